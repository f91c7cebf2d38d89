#pragma once

#include "posmr/config/engine_config.h"
#include "posmr/identity/identity_method.h"

namespace posmr::identity {

// Tier 3: near-identical multi-token names.
// Requires, with tokens of length <= 2 discarded:
// - at least 2 tokens on each side
// - token Jaccard >= partial_min_overlap with >= partial_min_shared_tokens shared
// - token counts differing by at most partial_max_token_count_diff
// - one normalized name containing the other
// - numbered-store guard: when either name ends in a digit ("... Branch 2"),
//   the names must be equal, otherwise "Branch 2" would absorb "Branch 20".
// Confidence scales linearly from floor (at the minimum overlap) to ceiling (at 1.0).
class StrictPartialName final : public IdentityMethod {
 public:
  explicit StrictPartialName(const config::IdentityThresholds& thresholds)
      : thresholds_(thresholds) {}

  [[nodiscard]] std::string_view method_id() const noexcept override {
    return "strict_partial_name";
  }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Token-overlap name match with numbered-store guard";
  }

  [[nodiscard]] MethodOutcome Evaluate(const IdentityQuery& query) const override;

 private:
  config::IdentityThresholds thresholds_;
};

}  // namespace posmr::identity
