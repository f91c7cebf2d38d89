#include "posmr/domain/completion_record.h"

#include <cmath>

namespace posmr::domain {

CompletionStatus completion_status(const std::size_t completed, const std::size_t required) {
  if (required == 0) {
    return CompletionStatus::kNoDisplays;
  }
  if (completed == 0) {
    return CompletionStatus::kNotVerified;
  }
  if (completed == required) {
    return CompletionStatus::kComplete;
  }
  return CompletionStatus::kPartial;
}

double completion_rate(const std::size_t completed, const std::size_t required) {
  if (required == 0) {
    return 0.0;
  }
  const double raw = static_cast<double>(completed) / static_cast<double>(required) * 100.0;
  return std::round(raw * 10.0) / 10.0;
}

std::string_view to_string(const CompletionStatus status) noexcept {
  switch (status) {
    case CompletionStatus::kComplete:
      return "complete";
    case CompletionStatus::kPartial:
      return "partial";
    case CompletionStatus::kNotVerified:
      return "not_verified";
    case CompletionStatus::kNoDisplays:
      return "no_displays";
  }
  return "unknown";
}

}  // namespace posmr::domain
