#pragma once

#include "posmr/audit/audit_report.h"
#include "posmr/completion/completion_result.h"
#include "posmr/config/engine_config.h"
#include "posmr/core/clock.h"
#include "posmr/core/id_generator.h"
#include "posmr/core/services.h"
#include "posmr/domain/dataset.h"
#include "posmr/domain/store.h"
#include "posmr/domain/survey_submission.h"
#include "posmr/identity/identity_resolver.h"
#include "posmr/storage/audit_event.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace posmr::app {

// ────────────────────────────────────────────────────────────────
// Completion Pipeline
// ────────────────────────────────────────────────────────────────

struct CompletionPipelineRequest {
  domain::Dataset dataset;       // NOLINT(readability-identifier-naming)
  config::EngineConfig config;  // NOLINT(readability-identifier-naming)

  // Records dropped while loading the dataset; reported in RunStarted.
  std::optional<domain::LoadReport> load_report;  // NOLINT(readability-identifier-naming)

  // Optional trace_id (if not provided, will be generated)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

struct CompletionPipelineResponse {
  std::string trace_id;                    // NOLINT(readability-identifier-naming)
  completion::CompletionResult completion;  // NOLINT(readability-identifier-naming)
};

// Run the completion aggregator over the request dataset.
// Emits audit events: RunStarted, SubmissionsValidated, AnomalyCapped (one per
// capped record), CompletionComputed, RunCompleted
[[nodiscard]] CompletionPipelineResponse run_completion_pipeline(
    const CompletionPipelineRequest& req, core::Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Audit Pipeline
// ────────────────────────────────────────────────────────────────

struct AuditPipelineResponse {
  std::string trace_id;                    // NOLINT(readability-identifier-naming)
  completion::CompletionResult completion;  // NOLINT(readability-identifier-naming)
  audit::AuditReport audit;                 // NOLINT(readability-identifier-naming)
};

// Completion followed by the audit reporter.
// Emits the completion pipeline events plus AuditCompleted before RunCompleted.
[[nodiscard]] AuditPipelineResponse run_audit_pipeline(const CompletionPipelineRequest& req,
                                                       core::Services& services,
                                                       core::IIdGenerator& id_gen,
                                                       core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Identity Resolution
// ────────────────────────────────────────────────────────────────

// Resolve one submission against one catalog store.
// Throws std::invalid_argument if store_id is empty or absent from the catalog.
[[nodiscard]] identity::Resolution resolve_store_identity(
    const domain::SurveySubmission& submission, const std::string& store_id,
    const domain::StoreCatalog& catalog, const config::IdentityThresholds& thresholds = {});

[[nodiscard]] nlohmann::json resolution_to_json(const identity::Resolution& resolution);

// ────────────────────────────────────────────────────────────────
// Audit Trace
// ────────────────────────────────────────────────────────────────

// Fetch all audit events for a given trace_id
[[nodiscard]] std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                                 core::Services& services);

}  // namespace posmr::app
