#pragma once

#include <cstdint>
#include <string>

namespace diffbudget::core {

// Abstract clock interface for timestamp injection.
// Production code uses system time; tests use a fixed, manually advanced clock so cache
// expiry is deterministic.
class IClock {
 public:
  virtual ~IClock() = default;

  // Seconds since the Unix epoch (UTC).
  virtual std::int64_t now_epoch_seconds() = 0;

  // Current time in ISO 8601 format (UTC), derived from now_epoch_seconds().
  std::string now_iso8601();

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::int64_t now_epoch_seconds() override;
};

// Fixed clock: returns a constant time until advanced explicitly.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(const std::int64_t epoch_seconds) : epoch_seconds_(epoch_seconds) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::int64_t now_epoch_seconds() override;

  void advance(const std::int64_t seconds) { epoch_seconds_ += seconds; }

 private:
  std::int64_t epoch_seconds_;
};

// format_iso8601 renders epoch seconds as "YYYY-MM-DDTHH:MM:SSZ".
[[nodiscard]] std::string format_iso8601(std::int64_t epoch_seconds);

}  // namespace diffbudget::core
