#include "posmr/core/clock.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace posmr::core {

std::string SystemClock::now_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t time_now = std::chrono::system_clock::to_time_t(now);

  std::tm utc{};
  gmtime_r(&time_now, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string date_prefix(const std::string& iso8601) {
  constexpr std::size_t kDateLength = 10;  // YYYY-MM-DD
  if (iso8601.size() < kDateLength || iso8601[4] != '-' || iso8601[7] != '-') {
    return {};
  }
  return iso8601.substr(0, kDateLength);
}

}  // namespace posmr::core
