#pragma once

#include <cstddef>

namespace posmr::config {

// IdentityThresholds tunes the store identity cascade.
// These are empirically tuned constants, not derived bounds.
struct IdentityThresholds {
  double accept_threshold{0.85};  // minimum confidence for an accept
  double exact_confidence{1.0};

  // Strict partial name match
  double partial_min_overlap{0.85};  // token Jaccard
  std::size_t partial_min_shared_tokens{3};
  std::size_t partial_max_token_count_diff{1};
  double partial_confidence_floor{0.75};
  double partial_confidence_ceiling{0.90};

  // Controlled containment matches
  std::size_t min_identifier_length{4};
  double identifier_in_name_confidence{0.88};
  double label_in_name_confidence{0.87};
};

struct ModelMatchThresholds {
  double similarity_threshold{0.80};  // word Jaccard over normalized labels
};

struct AggregationOptions {
  std::size_t max_workers{0};  // 0 = hardware concurrency, 1 = serial
  bool include_hidden_displays{false};
};

struct AuditThresholds {
  double over_matching_ratio{0.50};    // share of stores at 100%
  double systemic_review_ratio{0.10};  // share of stores with findings
  int bucket_width{10};                // percentage points
};

struct EngineConfig {
  IdentityThresholds identity;
  ModelMatchThresholds model;
  AggregationOptions aggregation;
  AuditThresholds audit;
};

}  // namespace posmr::config
