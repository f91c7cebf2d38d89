#include "posmr/identity/methods/label_in_name.h"

#include "posmr/core/normalization.h"

namespace posmr::identity {

MethodOutcome LabelInName::Evaluate(const IdentityQuery& query) const {
  const std::string& needle = query.leader;
  if (needle.size() < min_length_ || query.shop_name.size() <= needle.size()) {
    return {};
  }
  if (!core::contains_whole_word(query.shop_name, needle)) {
    return {};
  }
  return {true, confidence_};
}

}  // namespace posmr::identity
