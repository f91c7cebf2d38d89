#pragma once

#include "posmr/audit/audit_check.h"

namespace posmr::audit {

// AUD-003: anomaly cap fired on one of the store's records (MEDIUM)
// Submissions confirmed more codes than the model requires.
class Aud003 final : public AuditCheck {
 public:
  Aud003() = default;

  [[nodiscard]] std::string_view check_id() const noexcept override { return "AUD-003"; }
  [[nodiscard]] std::string_view version() const noexcept override { return "0.1.0"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Completed count capped at required count";
  }

  [[nodiscard]] std::vector<AuditIssue> Evaluate(const completion::StoreCompletion& store,
                                                 const AuditContext& context) const override;
};

}  // namespace posmr::audit
