#include "transfmt/core/clock.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace transfmt::core {

std::string SystemClock::now_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t time_now = std::chrono::system_clock::to_time_t(now);

  std::tm utc{};
#if defined(_WIN32)
  gmtime_s(&utc, &time_now);
#else
  gmtime_r(&time_now, &utc);
#endif

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string FixedClock::now_iso8601() {
  return fixed_time_;
}

}  // namespace transfmt::core
