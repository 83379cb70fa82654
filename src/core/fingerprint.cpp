#include "diffbudget/core/fingerprint.h"

#include <iomanip>
#include <sstream>

namespace diffbudget::core {

void Fingerprint::mix(const std::string_view bytes) {
  constexpr std::uint64_t kPrime = 1099511628211ull;
  for (const char ch : bytes) {
    hash_ ^= static_cast<std::uint64_t>(static_cast<unsigned char>(ch));
    hash_ *= kPrime;
  }
}

Fingerprint& Fingerprint::add(const std::string_view field) {
  add(static_cast<std::int64_t>(field.size()));
  mix(field);
  return *this;
}

Fingerprint& Fingerprint::add(const std::int64_t value) {
  // Little-endian byte order, independent of the host.
  std::string bytes(8, '\0');
  const auto raw = static_cast<std::uint64_t>(value);
  for (unsigned i = 0; i < 8u; ++i) {
    bytes[i] = static_cast<char>((raw >> (i * 8u)) & 0xffu);
  }
  mix(bytes);
  return *this;
}

std::string Fingerprint::hex() const {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0') << std::setw(16) << hash_;
  return oss.str();
}

}  // namespace diffbudget::core
