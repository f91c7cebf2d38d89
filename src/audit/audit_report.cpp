#include "posmr/audit/audit_report.h"

namespace posmr::audit {

nlohmann::json audit_report_to_json(const AuditReport& report) {
  nlohmann::json j;

  const auto& summary = report.summary;
  nlohmann::json distribution = nlohmann::json::array();
  for (const auto& bucket : summary.rate_distribution) {
    distribution.push_back({
        {"range", std::to_string(bucket.lower) + "-" + std::to_string(bucket.upper)},
        {"lower", bucket.lower},
        {"upper", bucket.upper},
        {"store_count", bucket.store_count},
    });
  }
  j["summary"] = {
      {"total_stores", summary.total_stores},
      {"total_displays", summary.total_displays},
      {"total_submissions", summary.total_submissions},
      {"stores_at_full_completion", summary.stores_at_full_completion},
      {"stores_with_findings", summary.stores_with_findings},
      {"anomaly_caps", summary.anomaly_caps},
      {"rate_distribution", distribution},
      {"status_histogram", summary.status_histogram},
      {"confidence_counts", summary.confidence_counts},
  };

  nlohmann::json findings = nlohmann::json::array();
  for (const auto& finding : report.store_findings) {
    findings.push_back({
        {"store_id", finding.store_id},
        {"confidence", std::string(domain::to_string(finding.confidence))},
        {"issues", finding.issues},
        {"check_ids", finding.check_ids},
    });
  }
  j["store_findings"] = findings;

  nlohmann::json recommendations = nlohmann::json::array();
  for (const auto& recommendation : report.recommendations) {
    recommendations.push_back({{"code", recommendation.code}, {"message", recommendation.message}});
  }
  j["recommendations"] = recommendations;
  return j;
}

}  // namespace posmr::audit
