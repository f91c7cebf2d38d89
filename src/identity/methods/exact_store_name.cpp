#include "posmr/identity/methods/exact_store_name.h"

namespace posmr::identity {

MethodOutcome ExactStoreName::Evaluate(const IdentityQuery& query) const {
  if (query.catalog_entry == nullptr || query.catalog_store_name.empty() ||
      query.shop_name.empty()) {
    return {};
  }
  if (query.catalog_store_name != query.shop_name) {
    return {};
  }
  return {true, confidence_};
}

}  // namespace posmr::identity
