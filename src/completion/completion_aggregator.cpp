#include "posmr/completion/completion_aggregator.h"

#include "posmr/completion/submission_validator.h"
#include "posmr/core/normalization.h"
#include "posmr/requirements/requirement_index.h"

#include <algorithm>
#include <future>
#include <map>
#include <set>
#include <string>
#include <thread>
#include <utility>

namespace posmr::completion {

namespace {

// StoreMatch is one validated submission accepted for a store.
struct StoreMatch {
  std::size_t submission_index{0};
  identity::Resolution resolution;
};

// Runs fn(i) for i in [0, count), striping indices across workers.
// Exceptions from any task propagate through future::get().
template <typename Fn>
void parallel_for(const std::size_t count, const std::size_t workers, Fn&& fn) {
  if (workers <= 1) {
    for (std::size_t i = 0; i < count; ++i) {
      fn(i);
    }
    return;
  }

  std::vector<std::future<void>> futures;
  futures.reserve(workers);
  for (std::size_t w = 0; w < workers; ++w) {
    futures.push_back(std::async(std::launch::async, [&fn, w, workers, count]() {
      for (std::size_t i = w; i < count; i += workers) {
        fn(i);
      }
    }));
  }
  for (auto& future : futures) {
    future.get();
  }
}

domain::CompletionRecord build_record(const domain::DisplayAssignment& assignment,
                                      const std::vector<StoreMatch>& matches,
                                      const std::vector<domain::SurveySubmission>& submissions,
                                      const std::vector<SubmissionCheck>& checks,
                                      const requirements::RequirementIndex& index,
                                      const matching::ModelMatcher& matcher) {
  domain::CompletionRecord record;
  record.store_id = core::trim(assignment.store_id);
  record.model = core::trim(assignment.model);
  record.required_count = index.required_count(record.model);
  record.matched_submission_count = matches.size();

  // Fold every matching response of every matched submission into one set.
  std::set<std::string> confirmed;
  for (const auto& match : matches) {
    const auto& submission = submissions[match.submission_index];

    domain::EvidenceRef evidence;
    for (const auto& response : submission.model_responses) {
      if (!matcher.matches(record.model, response.model)) {
        continue;
      }
      evidence.matched_models.push_back(response.model);
      for (const auto& selection : response.posm_selections) {
        if (!selection.selected) {
          continue;
        }
        std::string code = core::trim(selection.posm_code);
        if (!code.empty()) {
          confirmed.insert(std::move(code));
        }
      }
    }
    if (evidence.matched_models.empty()) {
      continue;
    }

    evidence.submission_index = match.submission_index;
    evidence.submission_id = domain::display_id(submission, match.submission_index);
    evidence.identity_method = match.resolution.method;
    evidence.identity_confidence = match.resolution.confidence;
    evidence.submitted_at = submission.submitted_at;
    evidence.quality_score = checks[match.submission_index].quality_score;
    if (submission.submitted_at > record.last_submission_at) {
      record.last_submission_at = submission.submitted_at;
    }
    record.evidence.push_back(std::move(evidence));
  }

  record.contributing_submission_count = record.evidence.size();
  record.raw_completed_count = confirmed.size();
  record.confirmed_codes.assign(confirmed.begin(), confirmed.end());
  record.capped = record.raw_completed_count > record.required_count;
  record.completed_count = std::min(record.raw_completed_count, record.required_count);
  record.completion_rate = domain::completion_rate(record.completed_count, record.required_count);
  record.status = domain::completion_status(record.completed_count, record.required_count);
  return record;
}

std::string or_unknown(const std::string& value) {
  return core::trim(value).empty() ? std::string(kUnknownLabel) : value;
}

template <typename T>
void sort_by_rate_desc(std::vector<T>& items) {
  std::stable_sort(items.begin(), items.end(), [](const T& a, const T& b) {
    return a.completion_rate > b.completion_rate;
  });
}

std::vector<StoreCompletion> rollup_stores(const std::vector<domain::CompletionRecord>& records,
                                           const domain::StoreCatalog& catalog) {
  std::vector<StoreCompletion> stores;
  std::map<std::string, std::size_t> slot_by_store;
  std::vector<std::set<std::size_t>> contributors;

  for (const auto& record : records) {
    auto [it, inserted] = slot_by_store.emplace(record.store_id, stores.size());
    if (inserted) {
      StoreCompletion store;
      store.store_id = record.store_id;
      const auto* entry = catalog.find(record.store_id);
      if (entry != nullptr) {
        store.store_name = or_unknown(entry->store_name);
        store.region = or_unknown(entry->region);
        store.province = or_unknown(entry->province);
        store.channel = or_unknown(entry->channel);
      } else {
        store.store_name = kUnknownLabel;
        store.region = kUnknownLabel;
        store.province = kUnknownLabel;
        store.channel = kUnknownLabel;
      }
      stores.push_back(std::move(store));
      contributors.emplace_back();
    }

    auto& store = stores[it->second];
    store.required_count += record.required_count;
    store.completed_count += record.completed_count;
    ++store.total_displays;
    store.models.push_back(record.model);
    if (!record.evidence.empty()) {
      ++store.verified_displays;
      store.verified_models.push_back(record.model);
    }
    for (const auto& evidence : record.evidence) {
      contributors[it->second].insert(evidence.submission_index);
    }
    if (record.last_submission_at > store.last_submission_at) {
      store.last_submission_at = record.last_submission_at;
    }
    store.records.push_back(record);
  }

  for (std::size_t i = 0; i < stores.size(); ++i) {
    stores[i].contributing_submission_count = contributors[i].size();
    stores[i].completion_rate =
        domain::completion_rate(stores[i].completed_count, stores[i].required_count);
  }
  sort_by_rate_desc(stores);
  return stores;
}

std::vector<ModelCompletion> rollup_models(const std::vector<domain::CompletionRecord>& records) {
  std::vector<ModelCompletion> models;
  std::map<std::string, std::size_t> slot_by_model;
  std::vector<std::set<std::string>> stores_per_model;

  for (const auto& record : records) {
    auto [it, inserted] = slot_by_model.emplace(record.model, models.size());
    if (inserted) {
      ModelCompletion model;
      model.model = record.model;
      models.push_back(std::move(model));
      stores_per_model.emplace_back();
    }
    auto& model = models[it->second];
    ++model.total_displays;
    if (!record.evidence.empty()) {
      ++model.verified_displays;
    }
    if (record.status == domain::CompletionStatus::kComplete) {
      ++model.completed_stores;
    }
    model.required_count += record.required_count;
    model.completed_count += record.completed_count;
    stores_per_model[it->second].insert(record.store_id);
  }

  for (std::size_t i = 0; i < models.size(); ++i) {
    models[i].store_count = stores_per_model[i].size();
    models[i].completion_rate =
        domain::completion_rate(models[i].completed_count, models[i].required_count);
  }
  sort_by_rate_desc(models);
  return models;
}

std::vector<RegionCompletion> rollup_regions(const std::vector<StoreCompletion>& stores) {
  std::vector<RegionCompletion> regions;
  std::map<std::string, std::size_t> slot_by_region;
  std::vector<std::set<std::string>> provinces;

  for (const auto& store : stores) {
    auto [it, inserted] = slot_by_region.emplace(store.region, regions.size());
    if (inserted) {
      RegionCompletion region;
      region.region = store.region;
      regions.push_back(std::move(region));
      provinces.emplace_back();
    }
    auto& region = regions[it->second];
    ++region.store_count;
    region.required_count += store.required_count;
    region.completed_count += store.completed_count;
    provinces[it->second].insert(store.province);
  }

  for (std::size_t i = 0; i < regions.size(); ++i) {
    regions[i].province_count = provinces[i].size();
    regions[i].completion_rate =
        domain::completion_rate(regions[i].completed_count, regions[i].required_count);
  }
  sort_by_rate_desc(regions);
  return regions;
}

std::vector<PosmProgress> rollup_posm(const std::vector<domain::CompletionRecord>& records,
                                      const requirements::RequirementIndex& index) {
  std::map<std::string, std::pair<std::set<std::string>, std::set<std::string>>> by_code;
  for (const auto& record : records) {
    const auto* codes = index.required_codes(record.model);
    if (codes == nullptr) {
      continue;
    }
    for (const auto& code : *codes) {
      auto& [required, completed] = by_code[code];
      required.insert(record.store_id);
      if (std::binary_search(record.confirmed_codes.begin(), record.confirmed_codes.end(), code)) {
        completed.insert(record.store_id);
      }
    }
  }

  std::vector<PosmProgress> progress;
  progress.reserve(by_code.size());
  for (const auto& [code, stores] : by_code) {
    PosmProgress item;
    item.posm_code = code;
    item.posm_name = index.posm_name(code);
    item.required_stores = stores.first.size();
    item.completed_stores = stores.second.size();
    item.completion_rate = domain::completion_rate(item.completed_stores, item.required_stores);
    progress.push_back(std::move(item));
  }
  sort_by_rate_desc(progress);
  return progress;
}

GlobalSummary summarize(const std::vector<domain::CompletionRecord>& records,
                        const std::vector<StoreCompletion>& stores) {
  GlobalSummary global;
  global.total_stores = stores.size();
  global.total_records = records.size();
  for (const auto status :
       {domain::CompletionStatus::kComplete, domain::CompletionStatus::kPartial,
        domain::CompletionStatus::kNotVerified, domain::CompletionStatus::kNoDisplays}) {
    global.status_counts[std::string(domain::to_string(status))] = 0;
  }

  std::set<std::string> models;
  for (const auto& record : records) {
    models.insert(record.model);
    global.total_required += record.required_count;
    global.total_completed += record.completed_count;
    ++global.status_counts[std::string(domain::to_string(record.status))];
  }
  global.total_models = models.size();
  global.overall_completion = domain::completion_rate(global.total_completed, global.total_required);
  global.stores_complete = static_cast<std::size_t>(
      std::count_if(stores.begin(), stores.end(), [](const StoreCompletion& s) {
        return s.required_count > 0 && s.completed_count == s.required_count;
      }));
  return global;
}

}  // namespace

std::size_t effective_worker_count(const std::size_t requested, const std::size_t tasks) {
  const std::size_t cores = std::max<std::size_t>(std::thread::hardware_concurrency(), 1);
  std::size_t workers = requested == 0 ? cores : requested;
  workers = std::min({workers, kMaxWorkersPerCore * cores, tasks});
  return std::max<std::size_t>(workers, 1);
}

CompletionAggregator::CompletionAggregator(const config::EngineConfig& config)
    : resolver_(config.identity), matcher_(config.model), options_(config.aggregation) {}

CompletionResult CompletionAggregator::compute(
    const std::vector<domain::DisplayAssignment>& displays,
    const std::vector<domain::SurveySubmission>& submissions,
    const std::vector<domain::PosmRequirement>& requirements,
    const domain::StoreCatalog& catalog) const {
  CompletionResult result;
  auto& diagnostics = result.diagnostics;
  const requirements::RequirementIndex index(requirements);

  // 1. Validate submissions once; only valid ones are candidates for any store.
  std::vector<SubmissionCheck> checks;
  checks.reserve(submissions.size());
  std::vector<std::size_t> validated;
  for (std::size_t i = 0; i < submissions.size(); ++i) {
    checks.push_back(validate_submission(submissions[i]));
    if (checks.back().valid) {
      validated.push_back(i);
    } else {
      diagnostics.rejections.push_back(
          {i, domain::display_id(submissions[i], i), checks.back().reason});
    }
  }
  diagnostics.total_submissions = submissions.size();
  diagnostics.validated_submissions = validated.size();
  diagnostics.rejected_submissions = submissions.size() - validated.size();

  // 2. Select assignments and the distinct stores they reference.
  std::vector<const domain::DisplayAssignment*> active;
  std::vector<std::string> store_ids;
  std::map<std::string, std::size_t> store_slot;
  for (const auto& display : displays) {
    if (!display.is_displayed && !options_.include_hidden_displays) {
      ++diagnostics.hidden_displays;
      continue;
    }
    active.push_back(&display);
    std::string key = core::trim(display.store_id);
    if (store_slot.emplace(key, store_ids.size()).second) {
      store_ids.push_back(std::move(key));
    }
  }

  // 3. Resolve submissions per distinct store.
  std::vector<std::vector<StoreMatch>> matches_by_store(store_ids.size());
  const std::size_t resolve_workers = effective_worker_count(options_.max_workers, store_ids.size());
  parallel_for(store_ids.size(), resolve_workers, [&](const std::size_t slot) {
    auto& matches = matches_by_store[slot];
    for (const std::size_t i : validated) {
      const auto& submission = submissions[i];
      auto resolution = resolver_.resolve(submission.leader_label, submission.shop_name_label,
                                          store_ids[slot], catalog);
      if (resolution.accepted) {
        matches.push_back({i, std::move(resolution)});
      }
    }
  });

  // 4. Build one record per assignment.
  result.records.resize(active.size());
  const std::size_t record_workers = effective_worker_count(options_.max_workers, active.size());
  parallel_for(active.size(), record_workers, [&](const std::size_t i) {
    const auto& assignment = *active[i];
    const auto& matches = matches_by_store[store_slot.at(core::trim(assignment.store_id))];
    result.records[i] = build_record(assignment, matches, submissions, checks, index, matcher_);
  });

  // 5. Diagnostics and rollups, serially and in input order.
  for (const auto& record : result.records) {
    if (record.capped) {
      diagnostics.anomaly_caps.push_back(
          {record.store_id, record.model, record.raw_completed_count, record.required_count});
    }
  }

  std::vector<bool> matched(submissions.size(), false);
  for (const auto& matches : matches_by_store) {
    for (const auto& match : matches) {
      matched[match.submission_index] = true;
    }
  }
  for (const std::size_t i : validated) {
    if (!matched[i]) {
      const auto& submission = submissions[i];
      diagnostics.orphaned_submissions.push_back({i, domain::display_id(submission, i),
                                                  submission.leader_label,
                                                  submission.shop_name_label});
    }
  }

  result.stores = rollup_stores(result.records, catalog);
  result.models = rollup_models(result.records);
  result.regions = rollup_regions(result.stores);
  result.posm = rollup_posm(result.records, index);
  result.global = summarize(result.records, result.stores);
  return result;
}

CompletionResult CompletionAggregator::compute(const domain::Dataset& dataset) const {
  const domain::StoreCatalog catalog(dataset.stores);
  return compute(dataset.displays, dataset.submissions, dataset.posm_requirements, catalog);
}

CompletionResult compute_completion(const domain::Dataset& dataset,
                                    const config::EngineConfig& config) {
  return CompletionAggregator(config).compute(dataset);
}

}  // namespace posmr::completion
