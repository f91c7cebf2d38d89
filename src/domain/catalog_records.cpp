#include "posmr/core/normalization.h"
#include "posmr/domain/display_assignment.h"
#include "posmr/domain/posm_requirement.h"

namespace posmr::domain {

core::Result<bool, std::string> DisplayAssignment::validate() const {
  if (core::trim(store_id).empty()) {
    return core::Result<bool, std::string>::err("display store_id must not be empty");
  }
  if (core::trim(model).empty()) {
    return core::Result<bool, std::string>::err("display model must not be empty");
  }
  return core::Result<bool, std::string>::ok(true);
}

core::Result<bool, std::string> PosmRequirement::validate() const {
  if (core::trim(model).empty()) {
    return core::Result<bool, std::string>::err("requirement model must not be empty");
  }
  if (core::trim(posm_code).empty()) {
    return core::Result<bool, std::string>::err("requirement posm code must not be empty");
  }
  return core::Result<bool, std::string>::ok(true);
}

}  // namespace posmr::domain
