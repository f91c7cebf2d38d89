#include "posmr/matching/model_matcher.h"

#include "posmr/core/normalization.h"

#include <string>

namespace posmr::matching {

bool ModelMatcher::matches(const std::string_view display_model,
                           const std::string_view submission_model) const {
  const std::string display_token = core::normalize_model_token(display_model);
  const std::string submission_token = core::normalize_model_token(submission_model);
  if (display_token.empty() || submission_token.empty()) {
    return false;
  }

  if (display_token == submission_token) {
    return true;
  }
  if (display_token.find(submission_token) != std::string::npos ||
      submission_token.find(display_token) != std::string::npos) {
    return true;
  }

  const auto display_words = core::split_words(display_model);
  const auto submission_words = core::split_words(submission_model);
  return core::jaccard(display_words, submission_words) >= similarity_threshold_;
}

}  // namespace posmr::matching
