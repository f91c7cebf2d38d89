#pragma once

#include "posmr/audit/audit_check.h"
#include "posmr/audit/audit_report.h"
#include "posmr/completion/completion_result.h"
#include "posmr/config/engine_config.h"

#include <memory>
#include <vector>

namespace posmr::audit {

struct AuditChecks {
  std::vector<std::unique_ptr<AuditCheck>> checks;
};

AuditChecks make_default_checks();

// AuditReporter runs every check against every store of a completion result
// and derives the summary and global recommendations.
class AuditReporter {
 public:
  explicit AuditReporter(const config::AuditThresholds& thresholds = {});
  AuditReporter(AuditChecks checks, const config::AuditThresholds& thresholds);

  [[nodiscard]] AuditReport audit(const completion::CompletionResult& result,
                                  const std::vector<domain::DisplayAssignment>& displays,
                                  const std::vector<domain::SurveySubmission>& submissions) const;

 private:
  AuditChecks checks_;
  config::AuditThresholds thresholds_;
};

AuditReport audit_completion(const completion::CompletionResult& result,
                             const std::vector<domain::DisplayAssignment>& displays,
                             const std::vector<domain::SurveySubmission>& submissions,
                             const config::AuditThresholds& thresholds = {});

}  // namespace posmr::audit
