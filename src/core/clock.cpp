#include "diffbudget/core/clock.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace diffbudget::core {

std::string IClock::now_iso8601() {
  return format_iso8601(now_epoch_seconds());
}

std::int64_t SystemClock::now_epoch_seconds() {
  const auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

std::int64_t FixedClock::now_epoch_seconds() {
  return epoch_seconds_;
}

std::string format_iso8601(const std::int64_t epoch_seconds) {
  const auto time_t_value = static_cast<std::time_t>(epoch_seconds);
  std::tm utc{};
  gmtime_r(&time_t_value, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

}  // namespace diffbudget::core
