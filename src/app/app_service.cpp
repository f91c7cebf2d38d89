#include "posmr/app/app_service.h"

#include "posmr/audit/audit_reporter.h"
#include "posmr/completion/completion_aggregator.h"
#include "posmr/config/engine_config_json.h"
#include "posmr/core/ids.h"
#include "posmr/core/normalization.h"

#include <stdexcept>
#include <utility>

namespace posmr::app {

namespace {

void emit(core::Services& services, core::IIdGenerator& id_gen, core::IClock& clock,
          const std::string& trace_id, const std::string& event_type,
          const nlohmann::json& payload, std::vector<std::string> refs = {}) {
  services.audit_log.append({id_gen.next("evt"), trace_id, event_type, payload.dump(),
                             clock.now_iso8601(), std::move(refs)});
}

std::string start_run(const CompletionPipelineRequest& req, const char* operation,
                      core::Services& services, core::IIdGenerator& id_gen, core::IClock& clock) {
  const std::string trace_id =
      req.trace_id.has_value() ? req.trace_id.value() : core::new_trace_id(id_gen).value;

  nlohmann::json payload;
  payload["source"] = "app_service";
  payload["operation"] = operation;
  payload["stores"] = req.dataset.stores.size();
  payload["displays"] = req.dataset.displays.size();
  payload["posm_requirements"] = req.dataset.posm_requirements.size();
  payload["submissions"] = req.dataset.submissions.size();
  payload["config"] = nlohmann::json::parse(config::engine_config_to_json(req.config));
  if (req.load_report.has_value()) {
    const auto& report = req.load_report.value();
    payload["skipped_records"] = {
        {"stores", report.skipped_stores},
        {"displays", report.skipped_displays},
        {"posm_requirements", report.skipped_requirements},
        {"submissions", report.skipped_submissions},
    };
  }
  emit(services, id_gen, clock, trace_id, "RunStarted", payload);
  return trace_id;
}

completion::CompletionResult compute_and_record(const CompletionPipelineRequest& req,
                                                const std::string& trace_id,
                                                core::Services& services,
                                                core::IIdGenerator& id_gen, core::IClock& clock) {
  auto result = completion::compute_completion(req.dataset, req.config);
  const auto& diagnostics = result.diagnostics;

  std::vector<std::string> rejected_ids;
  for (const auto& rejection : diagnostics.rejections) {
    rejected_ids.push_back(rejection.submission_id);
  }
  emit(services, id_gen, clock, trace_id, "SubmissionsValidated",
       {{"total", diagnostics.total_submissions},
        {"validated", diagnostics.validated_submissions},
        {"rejected", diagnostics.rejected_submissions},
        {"orphaned", diagnostics.orphaned_submissions.size()}},
       std::move(rejected_ids));

  // One warning per cap: completed count exceeded the requirement.
  for (const auto& cap : diagnostics.anomaly_caps) {
    emit(services, id_gen, clock, trace_id, "AnomalyCapped",
         {{"store_id", cap.store_id},
          {"model", cap.model},
          {"raw_completed", cap.raw_completed},
          {"required", cap.required}},
         {cap.store_id, cap.model});
  }

  emit(services, id_gen, clock, trace_id, "CompletionComputed",
       {{"records", result.global.total_records},
        {"stores", result.global.total_stores},
        {"stores_complete", result.global.stores_complete},
        {"overall_completion", result.global.overall_completion},
        {"hidden_displays", diagnostics.hidden_displays},
        {"anomaly_caps", diagnostics.anomaly_caps.size()}});
  return result;
}

void finish_run(const std::string& trace_id, core::Services& services, core::IIdGenerator& id_gen,
                core::IClock& clock) {
  emit(services, id_gen, clock, trace_id, "RunCompleted", {{"status", "success"}});
}

}  // namespace

CompletionPipelineResponse run_completion_pipeline(const CompletionPipelineRequest& req,
                                                   core::Services& services,
                                                   core::IIdGenerator& id_gen,
                                                   core::IClock& clock) {
  const std::string trace_id = start_run(req, "completion_pipeline", services, id_gen, clock);
  auto result = compute_and_record(req, trace_id, services, id_gen, clock);
  finish_run(trace_id, services, id_gen, clock);

  return CompletionPipelineResponse{
      .trace_id = trace_id,
      .completion = std::move(result),
  };
}

AuditPipelineResponse run_audit_pipeline(const CompletionPipelineRequest& req,
                                         core::Services& services, core::IIdGenerator& id_gen,
                                         core::IClock& clock) {
  const std::string trace_id = start_run(req, "audit_pipeline", services, id_gen, clock);
  auto result = compute_and_record(req, trace_id, services, id_gen, clock);

  auto report = audit::audit_completion(result, req.dataset.displays, req.dataset.submissions,
                                        req.config.audit);

  std::vector<std::string> flagged;
  for (const auto& finding : report.store_findings) {
    flagged.push_back(finding.store_id);
  }
  std::vector<std::string> recommendation_codes;
  for (const auto& recommendation : report.recommendations) {
    recommendation_codes.push_back(recommendation.code);
  }
  emit(services, id_gen, clock, trace_id, "AuditCompleted",
       {{"stores_with_findings", report.summary.stores_with_findings},
        {"recommendations", recommendation_codes}},
       std::move(flagged));

  finish_run(trace_id, services, id_gen, clock);

  return AuditPipelineResponse{
      .trace_id = trace_id,
      .completion = std::move(result),
      .audit = std::move(report),
  };
}

identity::Resolution resolve_store_identity(const domain::SurveySubmission& submission,
                                            const std::string& store_id,
                                            const domain::StoreCatalog& catalog,
                                            const config::IdentityThresholds& thresholds) {
  const std::string key = core::trim(store_id);
  if (key.empty()) {
    throw std::invalid_argument("store_id must not be empty");
  }
  if (catalog.find(key) == nullptr) {
    throw std::invalid_argument("Store not found in catalog: " + key);
  }

  const identity::IdentityResolver resolver(thresholds);
  return resolver.resolve(submission.leader_label, submission.shop_name_label, key, catalog);
}

nlohmann::json resolution_to_json(const identity::Resolution& resolution) {
  return {
      {"accepted", resolution.accepted},
      {"confidence", resolution.confidence},
      {"method", resolution.method},
  };
}

std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                   core::Services& services) {
  return services.audit_log.query(trace_id);
}

}  // namespace posmr::app
