#pragma once

#include "posmr/audit/audit_check.h"

namespace posmr::audit {

// AUD-002: positive completion without evidence metadata (LOW)
// The computed rate and the evidence trail disagree.
class Aud002 final : public AuditCheck {
 public:
  Aud002() = default;

  [[nodiscard]] std::string_view check_id() const noexcept override { return "AUD-002"; }
  [[nodiscard]] std::string_view version() const noexcept override { return "0.1.0"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Positive completion without contributing submissions";
  }

  [[nodiscard]] std::vector<AuditIssue> Evaluate(const completion::StoreCompletion& store,
                                                 const AuditContext& context) const override;
};

}  // namespace posmr::audit
