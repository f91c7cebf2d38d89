#include "posmr/completion/completion_json.h"

namespace posmr::completion {

nlohmann::json completion_record_to_json(const domain::CompletionRecord& record) {
  nlohmann::json j;
  j["store_id"] = record.store_id;
  j["model"] = record.model;
  j["required_count"] = record.required_count;
  j["completed_count"] = record.completed_count;
  j["completion_rate"] = record.completion_rate;
  j["status"] = std::string(domain::to_string(record.status));
  j["contributing_submission_count"] = record.contributing_submission_count;
  j["matched_submission_count"] = record.matched_submission_count;
  j["raw_completed_count"] = record.raw_completed_count;
  j["capped"] = record.capped;
  j["confirmed_codes"] = record.confirmed_codes;
  j["last_submission_at"] = record.last_submission_at;

  nlohmann::json evidence = nlohmann::json::array();
  for (const auto& ref : record.evidence) {
    evidence.push_back({
        {"submission_index", ref.submission_index},
        {"submission_id", ref.submission_id},
        {"identity_method", ref.identity_method},
        {"identity_confidence", ref.identity_confidence},
        {"submitted_at", ref.submitted_at},
        {"quality_score", ref.quality_score},
        {"matched_models", ref.matched_models},
    });
  }
  j["evidence"] = evidence;
  return j;
}

nlohmann::json completion_result_to_json(const CompletionResult& result) {
  nlohmann::json j;

  nlohmann::json stores = nlohmann::json::array();
  for (const auto& store : result.stores) {
    nlohmann::json s;
    s["store_id"] = store.store_id;
    s["store_name"] = store.store_name;
    s["region"] = store.region;
    s["province"] = store.province;
    s["channel"] = store.channel;
    s["required_count"] = store.required_count;
    s["completed_count"] = store.completed_count;
    s["completion_rate"] = store.completion_rate;
    s["total_displays"] = store.total_displays;
    s["verified_displays"] = store.verified_displays;
    s["models"] = store.models;
    s["verified_models"] = store.verified_models;
    s["contributing_submission_count"] = store.contributing_submission_count;
    s["last_submission_at"] = store.last_submission_at;

    nlohmann::json records = nlohmann::json::array();
    for (const auto& record : store.records) {
      records.push_back(completion_record_to_json(record));
    }
    s["records"] = records;
    stores.push_back(s);
  }
  j["stores"] = stores;

  nlohmann::json models = nlohmann::json::array();
  for (const auto& model : result.models) {
    models.push_back({
        {"model", model.model},
        {"total_displays", model.total_displays},
        {"verified_displays", model.verified_displays},
        {"store_count", model.store_count},
        {"completed_stores", model.completed_stores},
        {"required_count", model.required_count},
        {"completed_count", model.completed_count},
        {"completion_rate", model.completion_rate},
    });
  }
  j["models"] = models;

  nlohmann::json regions = nlohmann::json::array();
  for (const auto& region : result.regions) {
    regions.push_back({
        {"region", region.region},
        {"store_count", region.store_count},
        {"province_count", region.province_count},
        {"required_count", region.required_count},
        {"completed_count", region.completed_count},
        {"completion_rate", region.completion_rate},
    });
  }
  j["regions"] = regions;

  nlohmann::json posm = nlohmann::json::array();
  for (const auto& item : result.posm) {
    posm.push_back({
        {"posm_code", item.posm_code},
        {"posm_name", item.posm_name},
        {"required_stores", item.required_stores},
        {"completed_stores", item.completed_stores},
        {"completion_rate", item.completion_rate},
    });
  }
  j["posm"] = posm;

  const auto& global = result.global;
  j["global"] = {
      {"total_stores", global.total_stores},
      {"stores_complete", global.stores_complete},
      {"total_models", global.total_models},
      {"total_required", global.total_required},
      {"total_completed", global.total_completed},
      {"overall_completion", global.overall_completion},
      {"total_records", global.total_records},
      {"status_counts", global.status_counts},
  };

  const auto& diagnostics = result.diagnostics;
  nlohmann::json caps = nlohmann::json::array();
  for (const auto& cap : diagnostics.anomaly_caps) {
    caps.push_back({
        {"store_id", cap.store_id},
        {"model", cap.model},
        {"raw_completed", cap.raw_completed},
        {"required", cap.required},
    });
  }
  nlohmann::json orphans = nlohmann::json::array();
  for (const auto& orphan : diagnostics.orphaned_submissions) {
    orphans.push_back({
        {"submission_index", orphan.submission_index},
        {"submission_id", orphan.submission_id},
        {"leader", orphan.leader_label},
        {"shop_name", orphan.shop_name_label},
    });
  }
  nlohmann::json rejections = nlohmann::json::array();
  for (const auto& rejection : diagnostics.rejections) {
    rejections.push_back({
        {"submission_index", rejection.submission_index},
        {"submission_id", rejection.submission_id},
        {"reason", rejection.reason},
    });
  }
  j["diagnostics"] = {
      {"total_submissions", diagnostics.total_submissions},
      {"validated_submissions", diagnostics.validated_submissions},
      {"rejected_submissions", diagnostics.rejected_submissions},
      {"hidden_displays", diagnostics.hidden_displays},
      {"anomaly_caps", caps},
      {"orphaned_submissions", orphans},
      {"rejections", rejections},
  };

  return j;
}

nlohmann::json timeline_to_json(const Timeline& timeline) {
  nlohmann::json days = nlohmann::json::array();
  for (const auto& day : timeline.days) {
    days.push_back({
        {"date", day.date},
        {"submissions", day.submissions},
        {"model_responses", day.model_responses},
        {"stores", day.stores},
        {"cumulative_submissions", day.cumulative_submissions},
        {"cumulative_model_responses", day.cumulative_model_responses},
        {"cumulative_stores", day.cumulative_stores},
    });
  }
  return {
      {"days", days},
      {"total_submissions", timeline.total_submissions},
      {"total_stores", timeline.total_stores},
      {"undated_submissions", timeline.undated_submissions},
  };
}

}  // namespace posmr::completion
