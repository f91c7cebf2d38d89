#pragma once

#include <string>
#include <utility>

namespace posmr::core {

// IClock supplies run timestamps for the audit trail.
// The engine never reads the clock; only the application layer stamps events.
class IClock {
 public:
  virtual ~IClock() = default;

  // Current time as ISO 8601 UTC, e.g. "2026-03-01T08:15:00Z".
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

// FixedClock returns the same timestamp on every call (tests, reproducible runs).
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time) : fixed_time_(std::move(fixed_time)) {}

  std::string now_iso8601() override { return fixed_time_; }

 private:
  std::string fixed_time_;
};

// date_prefix returns the "YYYY-MM-DD" part of an ISO 8601 timestamp, or the
// empty string when the input is too short to carry a date.
std::string date_prefix(const std::string& iso8601);

}  // namespace posmr::core
