#include "posmr/audit/checks/aud_001.h"

#include <set>

namespace posmr::audit {

std::vector<AuditIssue> Aud001::Evaluate(const completion::StoreCompletion& store,
                                         const AuditContext& context) const {
  std::vector<AuditIssue> issues;

  if (store.required_count == 0 || store.completed_count != store.required_count) {
    return issues;
  }
  if (store.contributing_submission_count != 1) {
    return issues;
  }

  std::set<std::size_t> indices;
  for (const auto& record : store.records) {
    for (const auto& evidence : record.evidence) {
      indices.insert(evidence.submission_index);
    }
  }
  if (indices.size() != 1 || *indices.begin() >= context.submissions.size()) {
    return issues;
  }

  const auto& submission = context.submissions[*indices.begin()];
  if (submission.model_responses.size() == 1) {
    issues.push_back(AuditIssue{std::string(check_id()), domain::FindingConfidence::kMedium,
                                "100% completion from a single submission with one model "
                                "response; not confirmed by a repeat visit."});
  }
  return issues;
}

}  // namespace posmr::audit
