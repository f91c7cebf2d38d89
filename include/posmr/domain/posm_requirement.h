#pragma once

#include "posmr/core/result.h"

#include <string>

namespace posmr::domain {

// PosmRequirement: model requires the point-of-sale material posm_code.
struct PosmRequirement {
  std::string model;
  std::string posm_code;
  std::string posm_name;

  [[nodiscard]] core::Result<bool, std::string> validate() const;
};

}  // namespace posmr::domain
