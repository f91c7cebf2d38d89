#pragma once

#include "posmr/domain/posm_requirement.h"

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace posmr::requirements {

// RequirementIndex reduces the POSM requirement catalog to the set of distinct
// codes each model requires. Keys are trimmed model names and trimmed codes;
// duplicate (model, code) rows collapse.
class RequirementIndex {
 public:
  RequirementIndex() = default;
  explicit RequirementIndex(const std::vector<domain::PosmRequirement>& requirements);

  // 0 when the model has no requirement rows.
  [[nodiscard]] std::size_t required_count(std::string_view model) const;

  // nullptr when the model has no requirement rows.
  [[nodiscard]] const std::set<std::string>* required_codes(std::string_view model) const;

  [[nodiscard]] bool requires_code(std::string_view model, std::string_view posm_code) const;

  // First non-empty name seen for the code, or the code itself.
  [[nodiscard]] std::string posm_name(std::string_view posm_code) const;

  [[nodiscard]] std::vector<std::string> models() const;
  [[nodiscard]] std::size_t model_count() const noexcept { return codes_by_model_.size(); }

 private:
  std::map<std::string, std::set<std::string>, std::less<>> codes_by_model_;
  std::map<std::string, std::string, std::less<>> names_by_code_;
};

}  // namespace posmr::requirements
