#pragma once

#include "posmr/completion/completion_result.h"
#include "posmr/config/engine_config.h"
#include "posmr/domain/dataset.h"
#include "posmr/identity/identity_resolver.h"
#include "posmr/matching/model_matcher.h"

#include <cstddef>
#include <vector>

namespace posmr::completion {

// CompletionAggregator reconciles survey evidence against display assignments.
//
// For each displayed assignment it collects every validated submission whose
// labels resolve to the assignment's store, unions the selected POSM codes of
// every response whose model matches, and compares the union against the
// model's required code count. Counts above the requirement are capped and
// reported in RunDiagnostics::anomaly_caps.
//
// compute() is const and reads its inputs only. Identity resolution (one task
// per distinct store) and record construction (one task per assignment) fan
// out over AggregationOptions::max_workers threads; each task writes only its
// own output slot, so results are identical for any worker count.
class CompletionAggregator {
 public:
  explicit CompletionAggregator(const config::EngineConfig& config = {});

  [[nodiscard]] CompletionResult compute(const std::vector<domain::DisplayAssignment>& displays,
                                         const std::vector<domain::SurveySubmission>& submissions,
                                         const std::vector<domain::PosmRequirement>& requirements,
                                         const domain::StoreCatalog& catalog) const;

  [[nodiscard]] CompletionResult compute(const domain::Dataset& dataset) const;

  [[nodiscard]] const identity::IdentityResolver& resolver() const noexcept { return resolver_; }

 private:
  identity::IdentityResolver resolver_;
  matching::ModelMatcher matcher_;
  config::AggregationOptions options_;
};

inline constexpr std::size_t kMaxWorkersPerCore = 4;

// effective_worker_count maps AggregationOptions::max_workers (0 = hardware
// concurrency) to a thread count in [1, min(tasks, kMaxWorkersPerCore * cores)].
[[nodiscard]] std::size_t effective_worker_count(std::size_t requested, std::size_t tasks);

CompletionResult compute_completion(const domain::Dataset& dataset,
                                    const config::EngineConfig& config = {});

}  // namespace posmr::completion
