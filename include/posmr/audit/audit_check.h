#pragma once

#include "posmr/completion/completion_result.h"
#include "posmr/domain/audit_finding.h"
#include "posmr/domain/display_assignment.h"
#include "posmr/domain/survey_submission.h"

#include <string>
#include <string_view>
#include <vector>

namespace posmr::audit {

// AuditIssue is one check's verdict on one store.
struct AuditIssue {
  std::string check_id;
  domain::FindingConfidence confidence{domain::FindingConfidence::kHigh};
  std::string message;
};

// AuditContext exposes the raw inputs behind a completion result.
struct AuditContext {
  const std::vector<domain::DisplayAssignment>& displays;
  const std::vector<domain::SurveySubmission>& submissions;
};

// AuditCheck is the abstract base for per-store audit checks.
// Checks only read the completion result; they never alter it.
class AuditCheck {
 public:
  virtual ~AuditCheck() = default;

  [[nodiscard]] virtual std::string_view check_id() const noexcept = 0;
  [[nodiscard]] virtual std::string_view version() const noexcept = 0;
  [[nodiscard]] virtual std::string_view description() const noexcept = 0;

  [[nodiscard]] virtual std::vector<AuditIssue> Evaluate(const completion::StoreCompletion& store,
                                                         const AuditContext& context) const = 0;

 protected:
  AuditCheck() = default;
  AuditCheck(const AuditCheck&) = default;
  AuditCheck& operator=(const AuditCheck&) = default;
  AuditCheck(AuditCheck&&) = default;
  AuditCheck& operator=(AuditCheck&&) = default;
};

}  // namespace posmr::audit
