#pragma once

#include "posmr/domain/completion_record.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace posmr::completion {

// Region/metadata placeholder for stores missing from the catalog.
inline constexpr const char* kUnknownLabel = "Unknown";

// StoreCompletion is the POSM-weighted rollup of one store's records:
// rate = sum(completed) / sum(required), not an average of per-model rates.
struct StoreCompletion {
  std::string store_id;
  std::string store_name;
  std::string region;
  std::string province;
  std::string channel;

  std::size_t required_count{0};
  std::size_t completed_count{0};
  double completion_rate{0.0};

  std::size_t total_displays{0};
  std::size_t verified_displays{0};  // records with any matched response
  std::vector<std::string> models;
  std::vector<std::string> verified_models;
  std::size_t contributing_submission_count{0};  // distinct submissions
  std::string last_submission_at;

  std::vector<domain::CompletionRecord> records;
};

struct ModelCompletion {
  std::string model;
  std::size_t total_displays{0};
  std::size_t verified_displays{0};  // records with any matched response
  std::size_t store_count{0};
  std::size_t completed_stores{0};  // records with status complete
  std::size_t required_count{0};
  std::size_t completed_count{0};
  double completion_rate{0.0};
};

struct RegionCompletion {
  std::string region;
  std::size_t store_count{0};
  std::size_t province_count{0};
  std::size_t required_count{0};
  std::size_t completed_count{0};
  double completion_rate{0.0};
};

// PosmProgress tracks one required code across the stores that must carry it.
struct PosmProgress {
  std::string posm_code;
  std::string posm_name;
  std::size_t required_stores{0};
  std::size_t completed_stores{0};
  double completion_rate{0.0};
};

struct GlobalSummary {
  std::size_t total_stores{0};
  std::size_t stores_complete{0};  // store rate == 100
  std::size_t total_models{0};
  std::size_t total_required{0};
  std::size_t total_completed{0};
  double overall_completion{0.0};
  std::size_t total_records{0};
  std::map<std::string, std::size_t> status_counts;  // keyed by status string
};

// AnomalyCap records one completed > required correction.
struct AnomalyCap {
  std::string store_id;
  std::string model;
  std::size_t raw_completed{0};
  std::size_t required{0};
};

struct OrphanedSubmission {
  std::size_t submission_index{0};
  std::string submission_id;
  std::string leader_label;
  std::string shop_name_label;
};

struct RejectedSubmission {
  std::size_t submission_index{0};
  std::string submission_id;
  std::string reason;
};

struct RunDiagnostics {
  std::size_t total_submissions{0};
  std::size_t validated_submissions{0};
  std::size_t rejected_submissions{0};
  std::size_t hidden_displays{0};
  std::vector<AnomalyCap> anomaly_caps;
  std::vector<OrphanedSubmission> orphaned_submissions;
  std::vector<RejectedSubmission> rejections;
};

// CompletionResult is the full output of one aggregation run.
// records keeps display-assignment order; every rollup list is sorted by
// descending completion rate with ties left in first-seen order.
struct CompletionResult {
  std::vector<domain::CompletionRecord> records;
  std::vector<StoreCompletion> stores;
  std::vector<ModelCompletion> models;
  std::vector<RegionCompletion> regions;
  std::vector<PosmProgress> posm;
  GlobalSummary global;
  RunDiagnostics diagnostics;
};

}  // namespace posmr::completion
