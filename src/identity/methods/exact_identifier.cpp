#include "posmr/identity/methods/exact_identifier.h"

namespace posmr::identity {

MethodOutcome ExactIdentifier::Evaluate(const IdentityQuery& query) const {
  if (query.store_id.empty() || query.leader.empty()) {
    return {};
  }
  if (query.store_id != query.leader) {
    return {};
  }
  return {true, confidence_};
}

}  // namespace posmr::identity
