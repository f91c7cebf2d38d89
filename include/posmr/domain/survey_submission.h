#pragma once

#include <string>
#include <vector>

namespace posmr::domain {

struct PosmSelection {
  std::string posm_code;
  bool selected{false};
};

struct ModelResponse {
  std::string model;
  std::vector<PosmSelection> posm_selections;
};

// SurveySubmission is one field report. Store identity is free text:
// shop_name_label is what the surveyor typed, leader_label a secondary label
// that in legacy data sometimes carries the store id.
struct SurveySubmission {
  std::string submission_id;  // optional; positional id used when empty
  std::string leader_label;
  std::string shop_name_label;
  std::string submitted_at;  // ISO 8601
  std::vector<ModelResponse> model_responses;
};

// display_id returns submission_id, or "sub-<index>" when it is empty.
std::string display_id(const SurveySubmission& submission, std::size_t index);

}  // namespace posmr::domain
