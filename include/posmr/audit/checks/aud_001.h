#pragma once

#include "posmr/audit/audit_check.h"

namespace posmr::audit {

// AUD-001: 100% completion backed by a single submission (MEDIUM)
// Validates:
// - store rate == 100 with exactly one contributing submission
// - that submission carries exactly one model response
// Such a result has not been confirmed by a repeat visit.
class Aud001 final : public AuditCheck {
 public:
  Aud001() = default;

  [[nodiscard]] std::string_view check_id() const noexcept override { return "AUD-001"; }
  [[nodiscard]] std::string_view version() const noexcept override { return "0.1.0"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Full completion from a single single-response submission";
  }

  [[nodiscard]] std::vector<AuditIssue> Evaluate(const completion::StoreCompletion& store,
                                                 const AuditContext& context) const override;
};

}  // namespace posmr::audit
