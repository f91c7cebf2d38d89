#pragma once

namespace posmr::core {

// kBuildVersion is the engine version reported in run metadata.
constexpr const char* kBuildVersion = "0.3";

}  // namespace posmr::core
