#pragma once

#include "posmr/config/engine_config.h"
#include "posmr/identity/identity_method.h"

namespace posmr::identity {

// Tier 5: the submission's own leader label appears as a whole word inside a
// longer shop label. Same guards as IdentifierInName.
class LabelInName final : public IdentityMethod {
 public:
  explicit LabelInName(const config::IdentityThresholds& thresholds)
      : min_length_(thresholds.min_identifier_length),
        confidence_(thresholds.label_in_name_confidence) {}

  [[nodiscard]] std::string_view method_id() const noexcept override { return "label_in_name"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Leader label appears as a word in shop label";
  }

  [[nodiscard]] MethodOutcome Evaluate(const IdentityQuery& query) const override;

 private:
  std::size_t min_length_;
  double confidence_;
};

}  // namespace posmr::identity
