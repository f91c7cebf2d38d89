#include "commands.h"
#include "common.h"

#include "posmr/completion/completion_json.h"
#include "posmr/completion/timeline.h"
#include "posmr/core/clock.h"

#include <iostream>
#include <string>
#include <vector>

namespace {

struct TimelineCliConfig {
  posmr::apps::CommonCliConfig common;
  std::string since;
};

}  // namespace

int cmd_timeline(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto options = posmr::apps::common_options<TimelineCliConfig>();
  options.push_back({"--since", true, "Only report days on or after YYYY-MM-DD",
                     [](TimelineCliConfig& c, const std::string& v) {
                       c.since = v;
                       return posmr::core::date_prefix(v) == v;
                     }});
  const std::string usage = "Usage: posmr_cli timeline --dataset <file> [--since YYYY-MM-DD]\n" +
                            posmr::apps::usage_lines(options);

  std::vector<std::string> errors;
  const auto config = posmr::apps::parse_options(argc, argv, options, errors);
  if (posmr::apps::report_errors(errors, usage)) {
    return 1;
  }

  const auto inputs = posmr::apps::load_engine_inputs(config.common);
  if (!inputs.has_value()) {
    return 1;
  }

  const auto timeline =
      posmr::completion::build_timeline(inputs->loaded.dataset.submissions, config.since);
  std::cout << posmr::completion::timeline_to_json(timeline).dump(2) << "\n";
  return 0;
}
