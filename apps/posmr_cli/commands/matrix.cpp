#include "commands.h"
#include "common.h"

#include "posmr/app/app_service.h"
#include "posmr/core/clock.h"
#include "posmr/core/id_generator.h"
#include "posmr/reporting/deployment_matrix.h"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

struct MatrixCliConfig {
  posmr::apps::CommonCliConfig common;
  posmr::reporting::MatrixQuery query;
};

}  // namespace

int cmd_matrix(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto options = posmr::apps::common_options<MatrixCliConfig>();
  options.push_back({"--page", true, "Page number, starting at 1",
                     [](MatrixCliConfig& c, const std::string& v) {
                       const auto page = posmr::apps::parse_size(v);
                       c.query.page = page.value_or(1);
                       return page.has_value() && page.value() >= 1;
                     }});
  options.push_back({"--limit", true, "Rows per page (clamped to 1-100)",
                     [](MatrixCliConfig& c, const std::string& v) {
                       const auto limit = posmr::apps::parse_size(v);
                       c.query.limit = limit.value_or(c.query.limit);
                       return limit.has_value();
                     }});
  options.push_back({"--search", true, "Filter by store id, name, region or province",
                     [](MatrixCliConfig& c, const std::string& v) {
                       c.query.search = v;
                       return true;
                     }});
  options.push_back({"--sort-by", true, "store_name, store_id, region or completion_rate",
                     [](MatrixCliConfig& c, const std::string& v) {
                       const auto column = posmr::reporting::parse_sort_column(v);
                       if (!column.has_value()) {
                         return false;
                       }
                       c.query.sort_by = column.value();
                       return true;
                     }});
  options.push_back({"--desc", false, "Sort descending (default)",
                     [](MatrixCliConfig& c, const std::string& /*v*/) {
                       c.query.descending = true;
                       return true;
                     }});
  options.push_back({"--asc", false, "Sort ascending",
                     [](MatrixCliConfig& c, const std::string& /*v*/) {
                       c.query.descending = false;
                       return true;
                     }});
  const std::string usage =
      "Usage: posmr_cli matrix --dataset <file> [options]\n" + posmr::apps::usage_lines(options);

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
    const auto response = posmr::app::run_completion_pipeline(request, services, id_gen, clock);
    const auto page = posmr::reporting::build_deployment_matrix(response.completion, config.query);

    auto out = posmr::reporting::matrix_page_to_json(page);
    out["trace_id"] = response.trace_id;
    std::cout << out.dump(2) << "\n";
    if (config.common.trace) {
      posmr::apps::print_trace(services, response.trace_id);
    }
    return 0;
  });
}
