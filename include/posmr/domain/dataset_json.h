#pragma once

#include "posmr/core/result.h"
#include "posmr/domain/dataset.h"

#include <string>

namespace posmr::domain {

// parse_dataset_json materializes a Dataset from the JSON document
//   {"stores": [...], "displays": [...], "posm_requirements": [...], "submissions": [...]}
// Missing collections are treated as empty. Records with a missing required field
// or a wrong shape are skipped and reported in LoadReport.
// Returns err() only when the text is not JSON or the root is not an object.
[[nodiscard]] core::Result<LoadedDataset, std::string> parse_dataset_json(const std::string& text);

// load_dataset_file reads path and delegates to parse_dataset_json.
[[nodiscard]] core::Result<LoadedDataset, std::string> load_dataset_file(const std::string& path);

}  // namespace posmr::domain
