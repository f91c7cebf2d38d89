#include "posmr/config/engine_config_json.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace posmr::config {

namespace {

using json = nlohmann::json;

// Overlay helpers: leave target untouched when key is absent, append to
// errors when present with the wrong type or outside [lo, hi].
void read_ratio(const json& obj, const char* key, double& target, std::string& errors,
                const double lo = 0.0, const double hi = 1.0) {
  const auto it = obj.find(key);
  if (it == obj.end()) {
    return;
  }
  if (!it->is_number()) {
    errors += std::string(key) + " must be a number; ";
    return;
  }
  const double value = it->get<double>();
  if (value < lo || value > hi) {
    errors += std::string(key) + " out of range; ";
    return;
  }
  target = value;
}

void read_count(const json& obj, const char* key, std::size_t& target, std::string& errors) {
  const auto it = obj.find(key);
  if (it == obj.end()) {
    return;
  }
  if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<long long>() >= 0)) {
    errors += std::string(key) + " must be a non-negative integer; ";
    return;
  }
  target = it->get<std::size_t>();
}

const json* section(const json& root, const char* key, std::string& errors) {
  const auto it = root.find(key);
  if (it == root.end()) {
    return nullptr;
  }
  if (!it->is_object()) {
    errors += std::string(key) + " must be an object; ";
    return nullptr;
  }
  return &*it;
}

}  // namespace

std::string engine_config_to_json(const EngineConfig& config) {
  // nlohmann::json objects are std::map backed, so keys serialize sorted.
  json j;
  j["identity"] = {
      {"accept_threshold", config.identity.accept_threshold},
      {"exact_confidence", config.identity.exact_confidence},
      {"partial_min_overlap", config.identity.partial_min_overlap},
      {"partial_min_shared_tokens", config.identity.partial_min_shared_tokens},
      {"partial_max_token_count_diff", config.identity.partial_max_token_count_diff},
      {"partial_confidence_floor", config.identity.partial_confidence_floor},
      {"partial_confidence_ceiling", config.identity.partial_confidence_ceiling},
      {"min_identifier_length", config.identity.min_identifier_length},
      {"identifier_in_name_confidence", config.identity.identifier_in_name_confidence},
      {"label_in_name_confidence", config.identity.label_in_name_confidence},
  };
  j["model"] = {{"similarity_threshold", config.model.similarity_threshold}};
  j["aggregation"] = {
      {"max_workers", config.aggregation.max_workers},
      {"include_hidden_displays", config.aggregation.include_hidden_displays},
  };
  j["audit"] = {
      {"over_matching_ratio", config.audit.over_matching_ratio},
      {"systemic_review_ratio", config.audit.systemic_review_ratio},
      {"bucket_width", config.audit.bucket_width},
  };
  return j.dump();
}

core::Result<EngineConfig, std::string> engine_config_from_json(const std::string& text,
                                                                const EngineConfig& base) {
  using R = core::Result<EngineConfig, std::string>;

  const json root = json::parse(text, nullptr, false);
  if (root.is_discarded() || !root.is_object()) {
    return R::err("engine config must be a JSON object");
  }

  EngineConfig config = base;
  std::string errors;

  if (const json* identity = section(root, "identity", errors); identity != nullptr) {
    auto& t = config.identity;
    read_ratio(*identity, "accept_threshold", t.accept_threshold, errors);
    read_ratio(*identity, "exact_confidence", t.exact_confidence, errors);
    read_ratio(*identity, "partial_min_overlap", t.partial_min_overlap, errors);
    read_count(*identity, "partial_min_shared_tokens", t.partial_min_shared_tokens, errors);
    read_count(*identity, "partial_max_token_count_diff", t.partial_max_token_count_diff, errors);
    read_ratio(*identity, "partial_confidence_floor", t.partial_confidence_floor, errors);
    read_ratio(*identity, "partial_confidence_ceiling", t.partial_confidence_ceiling, errors);
    read_count(*identity, "min_identifier_length", t.min_identifier_length, errors);
    read_ratio(*identity, "identifier_in_name_confidence", t.identifier_in_name_confidence,
               errors);
    read_ratio(*identity, "label_in_name_confidence", t.label_in_name_confidence, errors);
    if (t.partial_confidence_floor > t.partial_confidence_ceiling) {
      errors += "partial_confidence_floor exceeds partial_confidence_ceiling; ";
    }
  }

  if (const json* model = section(root, "model", errors); model != nullptr) {
    read_ratio(*model, "similarity_threshold", config.model.similarity_threshold, errors);
  }

  if (const json* aggregation = section(root, "aggregation", errors); aggregation != nullptr) {
    read_count(*aggregation, "max_workers", config.aggregation.max_workers, errors);
    const auto hidden = aggregation->find("include_hidden_displays");
    if (hidden != aggregation->end()) {
      if (hidden->is_boolean()) {
        config.aggregation.include_hidden_displays = hidden->get<bool>();
      } else {
        errors += "include_hidden_displays must be a boolean; ";
      }
    }
  }

  if (const json* audit = section(root, "audit", errors); audit != nullptr) {
    read_ratio(*audit, "over_matching_ratio", config.audit.over_matching_ratio, errors);
    read_ratio(*audit, "systemic_review_ratio", config.audit.systemic_review_ratio, errors);
    const auto width = audit->find("bucket_width");
    if (width != audit->end()) {
      // Range-check at full width; narrowing first could wrap into [1, 100].
      const long long value = width->is_number_integer() ? width->get<long long>() : 0;
      if (value >= 1 && value <= 100) {
        config.audit.bucket_width = static_cast<int>(value);
      } else {
        errors += "bucket_width must be an integer in [1, 100]; ";
      }
    }
  }

  if (!errors.empty()) {
    return R::err("invalid engine config: " + errors);
  }
  return R::ok(config);
}

core::Result<EngineConfig, std::string> load_engine_config_file(const std::string& path,
                                                                const EngineConfig& base) {
  std::ifstream in(path);
  if (!in) {
    return core::Result<EngineConfig, std::string>::err("cannot open config file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return engine_config_from_json(buffer.str(), base);
}

}  // namespace posmr::config
