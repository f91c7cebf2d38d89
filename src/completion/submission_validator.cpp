#include "posmr/completion/submission_validator.h"

#include "posmr/core/normalization.h"

#include <algorithm>

namespace posmr::completion {

namespace {

bool has_any_selection(const domain::SurveySubmission& submission) {
  return std::any_of(submission.model_responses.begin(), submission.model_responses.end(),
                     [](const domain::ModelResponse& r) { return !r.posm_selections.empty(); });
}

bool has_text(const std::string& value) {
  return !core::trim(value).empty();
}

}  // namespace

int quality_score(const domain::SurveySubmission& submission) {
  int score = 0;
  if (!submission.model_responses.empty()) {
    score += 30;
  }
  if (has_any_selection(submission)) {
    score += 40;
  }
  if (has_text(submission.shop_name_label)) {
    score += 15;
  }
  if (has_text(submission.leader_label)) {
    score += 10;
  }
  if (has_text(submission.submitted_at)) {
    score += 5;
  }
  return score;
}

SubmissionCheck validate_submission(const domain::SurveySubmission& submission) {
  SubmissionCheck check;
  check.quality_score = quality_score(submission);

  if (submission.model_responses.empty()) {
    check.reason = "no model responses";
    return check;
  }
  if (!has_any_selection(submission)) {
    check.reason = "no POSM selections";
    return check;
  }
  if (!has_text(submission.shop_name_label) && !has_text(submission.leader_label)) {
    check.reason = "no identifying label";
    return check;
  }
  if (check.quality_score < kMinQualityScore) {
    check.reason = "quality score below minimum";
    return check;
  }

  check.valid = true;
  return check;
}

}  // namespace posmr::completion
