#pragma once

#include "posmr/domain/survey_submission.h"

#include <string>

namespace posmr::completion {

// Minimum quality score a submission needs to contribute evidence.
inline constexpr int kMinQualityScore = 30;

// quality_score rates a submission 0-100:
// +30 has model responses, +40 has any POSM selection entries,
// +15 non-empty shop label, +10 non-empty leader label, +5 has a timestamp.
[[nodiscard]] int quality_score(const domain::SurveySubmission& submission);

struct SubmissionCheck {
  bool valid{false};
  int quality_score{0};
  std::string reason;  // empty when valid
};

// validate_submission rejects submissions that must not contribute evidence:
// no model responses, no POSM selection entries anywhere, neither a shop nor a
// leader label, or a quality score below kMinQualityScore.
[[nodiscard]] SubmissionCheck validate_submission(const domain::SurveySubmission& submission);

}  // namespace posmr::completion
