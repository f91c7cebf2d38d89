#pragma once

#include "posmr/config/engine_config.h"
#include "posmr/identity/identity_method.h"

namespace posmr::identity {

// Tier 1: catalog store name equals the submission shop label after normalization.
class ExactStoreName final : public IdentityMethod {
 public:
  explicit ExactStoreName(const config::IdentityThresholds& thresholds)
      : confidence_(thresholds.exact_confidence) {}

  [[nodiscard]] std::string_view method_id() const noexcept override { return "exact_store_name"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Catalog store name equals shop label";
  }

  [[nodiscard]] MethodOutcome Evaluate(const IdentityQuery& query) const override;

 private:
  double confidence_;
};

}  // namespace posmr::identity
