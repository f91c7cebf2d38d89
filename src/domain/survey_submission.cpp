#include "posmr/domain/survey_submission.h"

namespace posmr::domain {

std::string display_id(const SurveySubmission& submission, const std::size_t index) {
  if (!submission.submission_id.empty()) {
    return submission.submission_id;
  }
  return "sub-" + std::to_string(index);
}

}  // namespace posmr::domain
