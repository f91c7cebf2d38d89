#pragma once

#include "posmr/config/engine_config.h"
#include "posmr/core/result.h"

#include <string>

namespace posmr::config {

// engine_config_to_json serializes every field; keys are sorted so output is stable.
[[nodiscard]] std::string engine_config_to_json(const EngineConfig& config);

// engine_config_from_json overlays the document onto base. Missing keys keep
// base values; a present key with the wrong type or an out-of-range value is an error.
[[nodiscard]] core::Result<EngineConfig, std::string> engine_config_from_json(
    const std::string& text, const EngineConfig& base = EngineConfig{});

[[nodiscard]] core::Result<EngineConfig, std::string> load_engine_config_file(
    const std::string& path, const EngineConfig& base = EngineConfig{});

}  // namespace posmr::config
