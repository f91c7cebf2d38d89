#pragma once

#include "posmr/domain/audit_finding.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace posmr::audit {

// RateBucket counts stores whose rate falls in [lower, upper); the last
// bucket is closed so 100% lands in it.
struct RateBucket {
  int lower{0};
  int upper{0};
  std::size_t store_count{0};
};

struct AuditSummary {
  std::size_t total_stores{0};
  std::size_t total_displays{0};  // assignments given to the reporter
  std::size_t total_submissions{0};
  std::size_t stores_at_full_completion{0};
  std::size_t stores_with_findings{0};
  std::size_t anomaly_caps{0};
  std::vector<RateBucket> rate_distribution;
  std::map<std::string, std::size_t> status_histogram;    // per record
  std::map<std::string, std::size_t> confidence_counts;  // per finding
};

struct Recommendation {
  std::string code;
  std::string message;
};

// AuditReport annotates a completion result; it never changes it.
struct AuditReport {
  AuditSummary summary;
  std::vector<domain::AuditFinding> store_findings;  // low first, then store id
  std::vector<Recommendation> recommendations;
};

[[nodiscard]] nlohmann::json audit_report_to_json(const AuditReport& report);

}  // namespace posmr::audit
