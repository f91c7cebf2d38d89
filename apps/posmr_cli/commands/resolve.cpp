#include "commands.h"
#include "common.h"

#include "posmr/app/app_service.h"
#include "posmr/domain/store.h"
#include "posmr/domain/survey_submission.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ResolveCliConfig {
  posmr::apps::CommonCliConfig common;
  std::optional<std::string> store_id;
  std::optional<std::string> shop_name;
  std::string leader;
};

}  // namespace

int cmd_resolve(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto options = posmr::apps::common_options<ResolveCliConfig>();
  options.push_back({"--store-id", true, "Catalog store id to resolve against",
                     [](ResolveCliConfig& c, const std::string& v) {
                       c.store_id = v;
                       return !v.empty();
                     }});
  options.push_back({"--shop", true, "Shop name label as typed in the submission",
                     [](ResolveCliConfig& c, const std::string& v) {
                       c.shop_name = v;
                       return true;
                     }});
  options.push_back({"--leader", true, "Leader label of the submission",
                     [](ResolveCliConfig& c, const std::string& v) {
                       c.leader = v;
                       return true;
                     }});
  const std::string usage =
      "Usage: posmr_cli resolve --dataset <file> --store-id ID --shop TEXT [--leader TEXT]\n" +
      posmr::apps::usage_lines(options);

  std::vector<std::string> errors;
  const auto config = posmr::apps::parse_options(argc, argv, options, errors);
  if (!config.store_id.has_value()) {
    errors.emplace_back("--store-id is required");
  }
  if (!config.shop_name.has_value()) {
    errors.emplace_back("--shop is required");
  }
  if (posmr::apps::report_errors(errors, usage)) {
    return 1;
  }

  auto inputs = posmr::apps::load_engine_inputs(config.common);
  if (!inputs.has_value()) {
    return 1;
  }

  const posmr::domain::StoreCatalog catalog(inputs->loaded.dataset.stores);
  posmr::domain::SurveySubmission submission;
  submission.leader_label = config.leader;
  submission.shop_name_label = config.shop_name.value();

  const auto resolution = posmr::app::resolve_store_identity(submission, config.store_id.value(),
                                                             catalog, inputs->config.identity);
  std::cout << posmr::app::resolution_to_json(resolution).dump(2) << "\n";
  return 0;
}
