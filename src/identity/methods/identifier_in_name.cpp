#include "posmr/identity/methods/identifier_in_name.h"

#include "posmr/core/normalization.h"

namespace posmr::identity {

MethodOutcome IdentifierInName::Evaluate(const IdentityQuery& query) const {
  const std::string& needle = query.store_id;
  if (needle.size() < min_length_ || query.shop_name.size() <= needle.size()) {
    return {};
  }
  if (!core::contains_whole_word(query.shop_name, needle)) {
    return {};
  }
  return {true, confidence_};
}

}  // namespace posmr::identity
