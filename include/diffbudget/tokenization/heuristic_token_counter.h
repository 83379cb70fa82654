#pragma once

#include "diffbudget/tokenization/token_counter.h"

namespace diffbudget::tokenization {

/// Model-independent counter: always approximate_tokens(text).
class HeuristicTokenCounter final : public ITokenCounter {
 public:
  [[nodiscard]] int count_tokens(const std::string& text, const std::string& model) const override;
  [[nodiscard]] std::string counter_id() const override { return "heuristic"; }
};

}  // namespace diffbudget::tokenization
