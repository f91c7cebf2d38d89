#include "common.h"

#include "posmr/config/engine_config_json.h"
#include "posmr/config/presets.h"
#include "posmr/domain/dataset_json.h"

#include <charconv>
#include <stdexcept>
#include <string>
#include <utility>

namespace posmr::apps {

std::optional<std::size_t> parse_size(const std::string& value) {
  std::size_t out = 0;
  const char* end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(value.data(), end, out);
  if (ec != std::errc{} || ptr != end || value.empty()) {
    return std::nullopt;
  }
  return out;
}

std::optional<double> parse_ratio(const std::string& value) {
  try {
    std::size_t consumed = 0;
    const double out = std::stod(value, &consumed);
    if (consumed != value.size() || out < 0.0 || out > 1.0) {
      return std::nullopt;
    }
    return out;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

bool report_errors(const std::vector<std::string>& errors, const std::string& usage) {
  if (errors.empty()) {
    return false;
  }
  for (const auto& error : errors) {
    std::cerr << "Error: " << error << "\n";
  }
  std::cerr << usage;
  return true;
}

std::optional<EngineInputs> load_engine_inputs(const CommonCliConfig& common) {
  if (!common.dataset_path.has_value()) {
    std::cerr << "Error: --dataset <file.json> is required\n";
    return std::nullopt;
  }

  auto dataset_result = domain::load_dataset_file(common.dataset_path.value());
  if (!dataset_result.has_value()) {
    std::cerr << "Failed to load dataset: " << dataset_result.error() << "\n";
    return std::nullopt;
  }

  EngineInputs inputs{std::move(dataset_result.value()), config::default_preset()};
  if (common.preset.value_or("default") == "strict") {
    inputs.config = config::strict_preset();
  }
  if (common.config_path.has_value()) {
    auto config_result = config::load_engine_config_file(common.config_path.value(), inputs.config);
    if (!config_result.has_value()) {
      std::cerr << "Failed to load config: " << config_result.error() << "\n";
      return std::nullopt;
    }
    inputs.config = config_result.value();
  }
  if (common.workers.has_value()) {
    inputs.config.aggregation.max_workers = common.workers.value();
  }
  if (common.accept_threshold.has_value()) {
    inputs.config.identity.accept_threshold = common.accept_threshold.value();
  }

  const auto& report = inputs.loaded.report;
  if (report.total_skipped() > 0) {
    std::cerr << "Warning: skipped " << report.total_skipped() << " invalid record(s)\n";
    for (const auto& issue : report.issues) {
      std::cerr << "  " << issue << "\n";
    }
  }
  return inputs;
}

void print_trace(core::Services& services, const std::string& trace_id) {
  std::cerr << "\n--- Audit Trail (trace_id=" << trace_id << ") ---\n";
  for (const auto& event : services.audit_log.query(trace_id)) {
    std::cerr << event.created_at << " [" << event.event_type << "] " << event.payload << "\n";
  }
}

}  // namespace posmr::apps
