#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace posmr::domain {

// Ordered from least to most trustworthy so std::min picks the downgrade.
enum class FindingConfidence {
  kLow,
  kMedium,
  kHigh,
};

[[nodiscard]] std::string_view to_string(FindingConfidence confidence) noexcept;

struct AuditFinding {
  std::string store_id;
  FindingConfidence confidence{FindingConfidence::kHigh};
  std::vector<std::string> issues;
  std::vector<std::string> check_ids;
};

}  // namespace posmr::domain
