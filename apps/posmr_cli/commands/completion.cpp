#include "commands.h"
#include "common.h"

#include "posmr/app/app_service.h"
#include "posmr/audit/audit_report.h"
#include "posmr/completion/completion_json.h"
#include "posmr/core/clock.h"
#include "posmr/core/id_generator.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

struct RunCliConfig {
  posmr::apps::CommonCliConfig common;
};

enum class RunMode { kCompletion, kAudit };

int run_pipeline(int argc, char* argv[], const RunMode mode) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = posmr::apps::common_options<RunCliConfig>();
  const std::string usage = std::string("Usage: posmr_cli ") +
                            (mode == RunMode::kCompletion ? "completion" : "audit") +
                            " --dataset <file> [options]\n" + posmr::apps::usage_lines(options);

  std::vector<std::string> errors;
  const auto config = posmr::apps::parse_options(argc, argv, options, errors);
  if (posmr::apps::report_errors(errors, usage)) {
    return 1;
  }

  auto inputs = posmr::apps::load_engine_inputs(config.common);
  if (!inputs.has_value()) {
    return 1;
  }

  posmr::app::CompletionPipelineRequest request;
  request.dataset = std::move(inputs->loaded.dataset);
  request.config = inputs->config;
  request.load_report = inputs->loaded.report;

  posmr::core::SystemIdGenerator id_gen;
  posmr::core::SystemClock clock;

  return posmr::apps::with_services(config.common, [&](posmr::core::Services& services) {
    std::string trace_id;
    nlohmann::json out;
    if (mode == RunMode::kCompletion) {
      const auto response = posmr::app::run_completion_pipeline(request, services, id_gen, clock);
      trace_id = response.trace_id;
      out = posmr::completion::completion_result_to_json(response.completion);
    } else {
      const auto response = posmr::app::run_audit_pipeline(request, services, id_gen, clock);
      trace_id = response.trace_id;
      out = posmr::audit::audit_report_to_json(response.audit);
    }
    out["trace_id"] = trace_id;

    std::cout << out.dump(2) << "\n";
    if (config.common.trace) {
      posmr::apps::print_trace(services, trace_id);
    }
    return 0;
  });
}

}  // namespace

int cmd_completion(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return run_pipeline(argc, argv, RunMode::kCompletion);
}

int cmd_audit(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return run_pipeline(argc, argv, RunMode::kAudit);
}
