#include "posmr/domain/audit_finding.h"

namespace posmr::domain {

std::string_view to_string(const FindingConfidence confidence) noexcept {
  switch (confidence) {
    case FindingConfidence::kLow:
      return "low";
    case FindingConfidence::kMedium:
      return "medium";
    case FindingConfidence::kHigh:
      return "high";
  }
  return "unknown";
}

}  // namespace posmr::domain
