#include "posmr/audit/checks/aud_003.h"

namespace posmr::audit {

std::vector<AuditIssue> Aud003::Evaluate(const completion::StoreCompletion& store,
                                         const AuditContext& /*context*/) const {
  std::vector<AuditIssue> issues;

  for (const auto& record : store.records) {
    if (!record.capped) {
      continue;
    }
    issues.push_back(AuditIssue{std::string(check_id()), domain::FindingConfidence::kMedium,
                                "Model " + record.model + ": " +
                                    std::to_string(record.raw_completed_count) +
                                    " confirmed codes capped at " +
                                    std::to_string(record.required_count) + " required."});
  }
  return issues;
}

}  // namespace posmr::audit
