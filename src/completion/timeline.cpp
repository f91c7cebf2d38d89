#include "posmr/completion/timeline.h"

#include "posmr/core/clock.h"
#include "posmr/core/normalization.h"

#include <map>
#include <set>

namespace posmr::completion {

namespace {

struct DayBucket {
  std::size_t submissions{0};
  std::size_t model_responses{0};
  std::set<std::string> stores;
};

std::string store_key(const domain::SurveySubmission& submission) {
  std::string key = core::normalize_label(submission.leader_label);
  if (key.empty()) {
    key = core::normalize_label(submission.shop_name_label);
  }
  return key;
}

}  // namespace

Timeline build_timeline(const std::vector<domain::SurveySubmission>& submissions,
                        const std::string_view since) {
  const std::string since_date = core::trim(since);

  Timeline timeline;
  std::map<std::string, DayBucket> buckets;
  for (const auto& submission : submissions) {
    const std::string date = core::date_prefix(core::trim(submission.submitted_at));
    if (date.empty()) {
      ++timeline.undated_submissions;
      continue;
    }
    if (!since_date.empty() && date < since_date) {
      continue;
    }
    auto& bucket = buckets[date];
    ++bucket.submissions;
    bucket.model_responses += submission.model_responses.size();
    std::string key = store_key(submission);
    if (!key.empty()) {
      bucket.stores.insert(std::move(key));
    }
  }

  std::set<std::string> seen_stores;
  std::size_t running_submissions = 0;
  std::size_t running_responses = 0;
  timeline.days.reserve(buckets.size());
  for (const auto& [date, bucket] : buckets) {
    running_submissions += bucket.submissions;
    running_responses += bucket.model_responses;
    seen_stores.insert(bucket.stores.begin(), bucket.stores.end());

    TimelineDay day;
    day.date = date;
    day.submissions = bucket.submissions;
    day.model_responses = bucket.model_responses;
    day.stores = bucket.stores.size();
    day.cumulative_submissions = running_submissions;
    day.cumulative_model_responses = running_responses;
    day.cumulative_stores = seen_stores.size();
    timeline.days.push_back(std::move(day));
  }
  timeline.total_submissions = running_submissions;
  timeline.total_stores = seen_stores.size();
  return timeline;
}

}  // namespace posmr::completion
