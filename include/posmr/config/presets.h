#pragma once

#include "posmr/config/engine_config.h"

namespace posmr::config {

inline EngineConfig default_preset() {
  return EngineConfig{};
}

// strict_preset trades recall for precision: the containment tiers (0.88, 0.87)
// fall below the bar, leaving exact matches and full-overlap partial matches.
inline EngineConfig strict_preset() {
  EngineConfig config;
  config.identity.accept_threshold = 0.90;
  config.model.similarity_threshold = 0.90;
  return config;
}

}  // namespace posmr::config
