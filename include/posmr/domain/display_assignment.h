#pragma once

#include "posmr/core/result.h"

#include <string>

namespace posmr::domain {

// DisplayAssignment: "store_id is expected to have model on display".
// At most one record per (store_id, model); the owning catalog enforces this.
struct DisplayAssignment {
  std::string store_id;
  std::string model;
  bool is_displayed{true};
  std::string updated_at;  // ISO 8601, informational

  [[nodiscard]] core::Result<bool, std::string> validate() const;
};

}  // namespace posmr::domain
