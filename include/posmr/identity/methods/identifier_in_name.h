#pragma once

#include "posmr/config/engine_config.h"
#include "posmr/identity/identity_method.h"

namespace posmr::identity {

// Tier 4: the catalog store id appears as a whole word inside a longer shop label,
// e.g. id "hcm_0142" in "dmx hcm_0142 quan 7".
class IdentifierInName final : public IdentityMethod {
 public:
  explicit IdentifierInName(const config::IdentityThresholds& thresholds)
      : min_length_(thresholds.min_identifier_length),
        confidence_(thresholds.identifier_in_name_confidence) {}

  [[nodiscard]] std::string_view method_id() const noexcept override {
    return "identifier_in_name";
  }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Store id appears as a word in shop label";
  }

  [[nodiscard]] MethodOutcome Evaluate(const IdentityQuery& query) const override;

 private:
  std::size_t min_length_;
  double confidence_;
};

}  // namespace posmr::identity
