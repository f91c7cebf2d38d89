#pragma once

#include "posmr/completion/completion_result.h"
#include "posmr/completion/timeline.h"
#include "posmr/domain/completion_record.h"

#include <nlohmann/json.hpp>

namespace posmr::completion {

/// Serialize one record including its evidence trail.
[[nodiscard]] nlohmann::json completion_record_to_json(const domain::CompletionRecord& record);

/// Serialize a full run: stores (with records), models, regions, posm, global, diagnostics.
[[nodiscard]] nlohmann::json completion_result_to_json(const CompletionResult& result);

[[nodiscard]] nlohmann::json timeline_to_json(const Timeline& timeline);

}  // namespace posmr::completion
