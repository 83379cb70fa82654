#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace diffbudget::core {

// Fingerprint accumulates a stable 64-bit FNV-1a digest over several fields.
// Stable across platforms and runs, so it is safe to persist as a cache key.
// Each field is length-prefixed, so ("ab", "c") and ("a", "bc") differ.
class Fingerprint {
 public:
  Fingerprint& add(std::string_view field);
  Fingerprint& add(std::int64_t value);

  [[nodiscard]] std::uint64_t value() const { return hash_; }

  // 16 lower-case hex digits.
  [[nodiscard]] std::string hex() const;

 private:
  void mix(std::string_view bytes);

  std::uint64_t hash_{14695981039346656037ull};
};

}  // namespace diffbudget::core
