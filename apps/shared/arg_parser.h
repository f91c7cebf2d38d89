#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace posmr::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false when the value is invalid; the
// parser records an error and keeps processing remaining flags.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler, and returns the populated config.
// Unknown flags, missing values and rejected values are appended to errors.
// Non-flag tokens are skipped so callers can handle positional arguments.
template <typename Config>
Config parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                     const std::vector<Option<Config>>& options, std::vector<std::string>& errors,
                     int start = 2, Config default_config = {}) {
  Config config = std::move(default_config);

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      std::string value;
      if (opt->requires_value) {
        if (i + 1 >= argc) {
          errors.push_back("Option " + arg + " requires a value");
          continue;
        }
        value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      }
      if (!opt->handler(config, value)) {
        errors.push_back("Invalid value for " + arg + ": " + value);
      }
    } else if (!arg.empty() && arg[0] == '-') {
      errors.push_back("Unknown option: " + arg);
    }
  }

  return config;
}

// usage_lines renders "  --flag <value>  description" lines for help output.
template <typename Config>
std::string usage_lines(const std::vector<Option<Config>>& options) {
  std::string out;
  for (const auto& opt : options) {
    out += "  " + opt.name + (opt.requires_value ? " <value>" : "") + "  " + opt.description + "\n";
  }
  return out;
}

}  // namespace posmr::apps
