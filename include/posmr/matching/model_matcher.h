#pragma once

#include "posmr/config/engine_config.h"

#include <string_view>

namespace posmr::matching {

// ModelMatcher decides whether a free-text submission model names the same
// product as a catalog display model. Submissions carry inconsistent spacing
// and punctuation ("SM-A556 5G", "sm a556 5g"), so comparison happens on
// punctuation-free tokens first and word overlap last.
class ModelMatcher {
 public:
  explicit ModelMatcher(const config::ModelMatchThresholds& thresholds = {})
      : similarity_threshold_(thresholds.similarity_threshold) {}

  // Accepts when the stripped tokens are equal, one contains the other, or the
  // word-set Jaccard of the normalized labels reaches the similarity threshold.
  // Empty names never match.
  [[nodiscard]] bool matches(std::string_view display_model,
                             std::string_view submission_model) const;

  [[nodiscard]] double similarity_threshold() const noexcept { return similarity_threshold_; }

 private:
  double similarity_threshold_;
};

}  // namespace posmr::matching
