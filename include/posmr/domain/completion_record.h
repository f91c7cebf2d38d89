#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace posmr::domain {

enum class CompletionStatus {
  kComplete,
  kPartial,
  kNotVerified,
  kNoDisplays,
};

// completion_status derives status from counts only:
// required == 0 → no_displays; completed == 0 → not_verified;
// completed == required → complete; otherwise partial.
[[nodiscard]] CompletionStatus completion_status(std::size_t completed, std::size_t required);

// completion_rate is completed / required * 100 rounded to one decimal, 0 when required == 0.
[[nodiscard]] double completion_rate(std::size_t completed, std::size_t required);

[[nodiscard]] std::string_view to_string(CompletionStatus status) noexcept;

// EvidenceRef names one submission that contributed POSM codes to a record.
struct EvidenceRef {
  std::size_t submission_index{0};
  std::string submission_id;
  std::string identity_method;
  double identity_confidence{0.0};
  std::string submitted_at;
  int quality_score{0};
  std::vector<std::string> matched_models;  // submission-side model names
};

// CompletionRecord is the per (store, model) result. Recomputed on every run.
// Invariant: completed_count <= required_count.
struct CompletionRecord {
  std::string store_id;
  std::string model;
  std::size_t required_count{0};
  std::size_t completed_count{0};
  double completion_rate{0.0};
  CompletionStatus status{CompletionStatus::kNoDisplays};
  std::size_t contributing_submission_count{0};

  std::size_t matched_submission_count{0};  // identity-resolved, validated
  std::size_t raw_completed_count{0};       // union size before capping
  bool capped{false};
  std::vector<std::string> confirmed_codes;  // sorted union of selected codes
  std::string last_submission_at;
  std::vector<EvidenceRef> evidence;
};

}  // namespace posmr::domain
