#pragma once

#include "posmr/config/engine_config.h"
#include "posmr/identity/identity_method.h"

namespace posmr::identity {

// Tier 2: candidate store id equals the leader label. Legacy submissions used
// the leader field to carry the store key.
class ExactIdentifier final : public IdentityMethod {
 public:
  explicit ExactIdentifier(const config::IdentityThresholds& thresholds)
      : confidence_(thresholds.exact_confidence) {}

  [[nodiscard]] std::string_view method_id() const noexcept override { return "exact_identifier"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Store id equals leader label";
  }

  [[nodiscard]] MethodOutcome Evaluate(const IdentityQuery& query) const override;

 private:
  double confidence_;
};

}  // namespace posmr::identity
