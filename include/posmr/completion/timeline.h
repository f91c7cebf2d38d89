#pragma once

#include "posmr/domain/survey_submission.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace posmr::completion {

// TimelineDay aggregates submissions by the date prefix of submitted_at.
// Cumulative counters run from the first reported day.
struct TimelineDay {
  std::string date;  // YYYY-MM-DD
  std::size_t submissions{0};
  std::size_t model_responses{0};
  std::size_t stores{0};  // distinct store keys seen that day
  std::size_t cumulative_submissions{0};
  std::size_t cumulative_model_responses{0};
  std::size_t cumulative_stores{0};  // distinct store keys seen up to that day
};

struct Timeline {
  std::vector<TimelineDay> days;  // ascending by date
  std::size_t total_submissions{0};
  std::size_t total_stores{0};
  std::size_t undated_submissions{0};  // no parseable date; excluded from days
};

// build_timeline groups submissions per day. The store key is the normalized
// leader label, falling back to the normalized shop label; submissions with
// neither are counted but contribute no store key. When since is non-empty,
// days before it are dropped. No wall clock is read.
[[nodiscard]] Timeline build_timeline(const std::vector<domain::SurveySubmission>& submissions,
                                      std::string_view since = {});

}  // namespace posmr::completion
