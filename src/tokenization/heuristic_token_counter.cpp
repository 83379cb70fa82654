#include "diffbudget/tokenization/heuristic_token_counter.h"

#include <climits>
#include <cstddef>

namespace diffbudget::tokenization {

int approximate_tokens(const std::string_view text) {
  const std::size_t tokens = text.size() / 4;
  if (tokens > static_cast<std::size_t>(INT_MAX)) {
    return INT_MAX;
  }
  return static_cast<int>(tokens);
}

int HeuristicTokenCounter::count_tokens(const std::string& text,
                                        const std::string& /*model*/) const {
  return approximate_tokens(text);
}

}  // namespace diffbudget::tokenization
