#include "posmr/audit/checks/aud_002.h"

#include <algorithm>

namespace posmr::audit {

std::vector<AuditIssue> Aud002::Evaluate(const completion::StoreCompletion& store,
                                         const AuditContext& /*context*/) const {
  std::vector<AuditIssue> issues;

  if (store.completion_rate <= 0.0) {
    return issues;
  }

  const bool has_evidence =
      std::any_of(store.records.begin(), store.records.end(),
                  [](const domain::CompletionRecord& record) { return !record.evidence.empty(); });
  if (store.contributing_submission_count == 0 || !has_evidence) {
    issues.push_back(AuditIssue{std::string(check_id()), domain::FindingConfidence::kLow,
                                "Positive completion without contributing submission metadata."});
  }
  return issues;
}

}  // namespace posmr::audit
