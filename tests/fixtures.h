#pragma once

#include "posmr/domain/dataset.h"

#include <string>
#include <utility>
#include <vector>

// Builders for small hand-written datasets.
namespace fixtures {

inline posmr::domain::StoreCatalogEntry store(std::string id, std::string name,
                                              std::string region = "South",
                                              std::string province = "HCM") {
  return {std::move(id), std::move(name), std::move(region), std::move(province), "retail"};
}

inline posmr::domain::DisplayAssignment display(std::string store_id, std::string model,
                                                bool is_displayed = true) {
  return {std::move(store_id), std::move(model), is_displayed, "2026-01-01T00:00:00Z"};
}

inline std::vector<posmr::domain::PosmRequirement> requirements(
    const std::string& model, const std::vector<std::string>& codes) {
  std::vector<posmr::domain::PosmRequirement> out;
  for (const auto& code : codes) {
    out.push_back({model, code, "POSM " + code});
  }
  return out;
}

// response selects every listed code; unselected entries can be added by the caller.
inline posmr::domain::ModelResponse response(std::string model,
                                             const std::vector<std::string>& selected) {
  posmr::domain::ModelResponse r;
  r.model = std::move(model);
  for (const auto& code : selected) {
    r.posm_selections.push_back({code, true});
  }
  return r;
}

inline posmr::domain::SurveySubmission submission(std::string id, std::string leader,
                                                  std::string shop, std::string submitted_at,
                                                  std::vector<posmr::domain::ModelResponse> responses) {
  return {std::move(id), std::move(leader), std::move(shop), std::move(submitted_at),
          std::move(responses)};
}

// The S1 / M1 dataset: one store, one assignment, M1 requires P1 and P2.
inline posmr::domain::Dataset single_store_dataset() {
  posmr::domain::Dataset dataset;
  dataset.stores = {store("S1", "S1 Official")};
  dataset.displays = {display("S1", "M1")};
  dataset.posm_requirements = requirements("M1", {"P1", "P2"});
  return dataset;
}

}  // namespace fixtures
