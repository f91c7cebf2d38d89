#pragma once

#include "posmr/config/engine_config.h"
#include "posmr/core/services.h"
#include "posmr/domain/dataset.h"
#include "posmr/storage/sqlite/sqlite_audit_log.h"
#include "posmr/storage/sqlite/sqlite_db.h"

#include "shared/arg_parser.h"

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace posmr::apps {

// Flags shared by every subcommand.
struct CommonCliConfig {
  std::optional<std::string> dataset_path;
  std::optional<std::string> config_path;
  std::optional<std::string> db_path;
  std::optional<std::string> preset;
  std::optional<std::size_t> workers;
  std::optional<double> accept_threshold;
  bool trace{false};
};

std::optional<std::size_t> parse_size(const std::string& value);
std::optional<double> parse_ratio(const std::string& value);

// common_options builds the shared flag table for a subcommand config that
// carries a CommonCliConfig member named common.
template <typename Config>
std::vector<Option<Config>> common_options() {
  return {
      {"--dataset", true, "Dataset JSON file (stores, displays, posm_requirements, submissions)",
       [](Config& c, const std::string& v) {
         c.common.dataset_path = v;
         return !v.empty();
       }},
      {"--config", true, "Engine config JSON overlay",
       [](Config& c, const std::string& v) {
         c.common.config_path = v;
         return !v.empty();
       }},
      {"--preset", true, "Threshold preset: default or strict",
       [](Config& c, const std::string& v) {
         c.common.preset = v;
         return v == "default" || v == "strict";
       }},
      {"--db", true, "SQLite file for the audit trail (in-memory when omitted)",
       [](Config& c, const std::string& v) {
         c.common.db_path = v;
         return !v.empty();
       }},
      {"--workers", true, "Worker threads (0 = hardware concurrency, 1 = serial)",
       [](Config& c, const std::string& v) {
         c.common.workers = parse_size(v);
         return c.common.workers.has_value();
       }},
      {"--accept-threshold", true, "Identity accept threshold in [0, 1]",
       [](Config& c, const std::string& v) {
         c.common.accept_threshold = parse_ratio(v);
         return c.common.accept_threshold.has_value();
       }},
      {"--trace", false, "Print the run's audit trail to stderr",
       [](Config& c, const std::string& /*v*/) {
         c.common.trace = true;
         return true;
       }},
  };
}

// report_errors prints parse errors and returns true when there were any.
bool report_errors(const std::vector<std::string>& errors, const std::string& usage);

struct EngineInputs {
  domain::LoadedDataset loaded;
  config::EngineConfig config;
};

// load_engine_inputs reads the dataset and layers preset, config file and CLI
// overrides. Prints the reason and returns nullopt on failure.
std::optional<EngineInputs> load_engine_inputs(const CommonCliConfig& common);

void print_trace(core::Services& services, const std::string& trace_id);

// with_services opens the audit sink selected by --db and runs fn(services).
// Without --db the trail is in-memory and lost on exit.
template <typename Fn>
int with_services(const CommonCliConfig& common, Fn&& fn) {
  if (common.db_path.has_value()) {
    auto db_result = storage::sqlite::SqliteDb::open(common.db_path.value());
    if (!db_result.has_value()) {
      std::cerr << "Failed to open database: " << db_result.error() << "\n";
      return 1;
    }

    auto db = db_result.value();
    auto schema_result = db->ensure_schema_v1();
    if (!schema_result.has_value()) {
      std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
      return 1;
    }

    storage::sqlite::SqliteAuditLog audit_log(db);
    core::Services services{audit_log};
    const int rc = fn(services);
    if (audit_log.failed_writes() > 0) {
      std::cerr << "Warning: " << audit_log.failed_writes() << " audit event(s) were not persisted\n";
    }
    return rc;
  }

  std::cerr << "Warning: no --db given; audit trail is in-memory and discarded on exit\n";
  storage::InMemoryAuditLog audit_log;
  core::Services services{audit_log};
  return fn(services);
}

}  // namespace posmr::apps
