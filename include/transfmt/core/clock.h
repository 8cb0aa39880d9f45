#pragma once

#include <string>
#include <utility>

namespace transfmt::core {

// Timestamp source for audit events.
// Runs use SystemClock; tests inject FixedClock so stored trails are reproducible.
class IClock {
 public:
  virtual ~IClock() = default;

  // Current UTC time as ISO 8601, e.g. "2026-01-01T00:00:00Z".
  virtual std::string now_iso8601() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  std::string now_iso8601() override;
};

class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time) : fixed_time_(std::move(fixed_time)) {}

  std::string now_iso8601() override;

 private:
  std::string fixed_time_;
};

}  // namespace transfmt::core
