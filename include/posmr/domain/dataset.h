#pragma once

#include "posmr/domain/display_assignment.h"
#include "posmr/domain/posm_requirement.h"
#include "posmr/domain/store.h"
#include "posmr/domain/survey_submission.h"

#include <cstddef>
#include <string>
#include <vector>

namespace posmr::domain {

// Dataset is the immutable input snapshot of one engine run.
struct Dataset {
  std::vector<StoreCatalogEntry> stores;
  std::vector<DisplayAssignment> displays;
  std::vector<PosmRequirement> posm_requirements;
  std::vector<SurveySubmission> submissions;
};

// LoadReport counts records dropped while materializing a Dataset.
// A dropped record never aborts the load.
struct LoadReport {
  std::size_t skipped_stores{0};
  std::size_t skipped_displays{0};
  std::size_t skipped_requirements{0};
  std::size_t skipped_submissions{0};
  std::vector<std::string> issues;

  [[nodiscard]] std::size_t total_skipped() const noexcept {
    return skipped_stores + skipped_displays + skipped_requirements + skipped_submissions;
  }
};

struct LoadedDataset {
  Dataset dataset;
  LoadReport report;
};

}  // namespace posmr::domain
