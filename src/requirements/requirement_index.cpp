#include "posmr/requirements/requirement_index.h"

#include "posmr/core/normalization.h"

namespace posmr::requirements {

RequirementIndex::RequirementIndex(const std::vector<domain::PosmRequirement>& requirements) {
  for (const auto& requirement : requirements) {
    std::string model = core::trim(requirement.model);
    std::string code = core::trim(requirement.posm_code);
    if (model.empty() || code.empty()) {
      continue;
    }
    auto& name = names_by_code_[code];
    if (name.empty()) {
      name = core::trim(requirement.posm_name);
    }
    codes_by_model_[std::move(model)].insert(std::move(code));
  }
}

std::size_t RequirementIndex::required_count(const std::string_view model) const {
  const auto* codes = required_codes(model);
  return codes == nullptr ? 0 : codes->size();
}

const std::set<std::string>* RequirementIndex::required_codes(const std::string_view model) const {
  const auto it = codes_by_model_.find(core::trim(model));
  if (it == codes_by_model_.end()) {
    return nullptr;
  }
  return &it->second;
}

bool RequirementIndex::requires_code(const std::string_view model,
                                     const std::string_view posm_code) const {
  const auto* codes = required_codes(model);
  return codes != nullptr && codes->count(core::trim(posm_code)) > 0;
}

std::string RequirementIndex::posm_name(const std::string_view posm_code) const {
  const std::string code = core::trim(posm_code);
  const auto it = names_by_code_.find(code);
  if (it == names_by_code_.end() || it->second.empty()) {
    return code;
  }
  return it->second;
}

std::vector<std::string> RequirementIndex::models() const {
  std::vector<std::string> out;
  out.reserve(codes_by_model_.size());
  for (const auto& [model, codes] : codes_by_model_) {
    out.push_back(model);
  }
  return out;
}

}  // namespace posmr::requirements
