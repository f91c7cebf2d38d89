#include "posmr/identity/identity_resolver.h"

#include "posmr/core/normalization.h"
#include "posmr/identity/methods/exact_identifier.h"
#include "posmr/identity/methods/exact_store_name.h"
#include "posmr/identity/methods/identifier_in_name.h"
#include "posmr/identity/methods/label_in_name.h"
#include "posmr/identity/methods/strict_partial_name.h"

#include <utility>

namespace posmr::identity {

IdentityCascade make_default_cascade(const config::IdentityThresholds& thresholds) {
  IdentityCascade cascade;
  cascade.methods.push_back(std::make_unique<ExactStoreName>(thresholds));
  cascade.methods.push_back(std::make_unique<ExactIdentifier>(thresholds));
  cascade.methods.push_back(std::make_unique<StrictPartialName>(thresholds));
  cascade.methods.push_back(std::make_unique<IdentifierInName>(thresholds));
  cascade.methods.push_back(std::make_unique<LabelInName>(thresholds));
  return cascade;
}

IdentityResolver::IdentityResolver(const config::IdentityThresholds& thresholds)
    : IdentityResolver(make_default_cascade(thresholds), thresholds) {}

IdentityResolver::IdentityResolver(IdentityCascade cascade,
                                   const config::IdentityThresholds& thresholds)
    : cascade_(std::move(cascade)), accept_threshold_(thresholds.accept_threshold) {}

Resolution IdentityResolver::resolve(const std::string_view leader_label,
                                     const std::string_view shop_name_label,
                                     const std::string_view store_id,
                                     const domain::StoreCatalog& catalog) const {
  IdentityQuery query;
  query.leader = core::normalize_label(leader_label);
  query.shop_name = core::normalize_label(shop_name_label);
  query.store_id = core::normalize_label(store_id);
  query.catalog_entry = catalog.find(core::trim(store_id));
  if (query.catalog_entry != nullptr) {
    query.catalog_store_name = core::normalize_label(query.catalog_entry->store_name);
  }

  Resolution resolution;
  for (const auto& method : cascade_.methods) {
    if (!method) {
      continue;
    }
    const MethodOutcome outcome = method->Evaluate(query);
    if (outcome.matched && outcome.confidence >= accept_threshold_) {
      resolution.accepted = true;
      resolution.confidence = outcome.confidence;
      resolution.method = std::string(method->method_id());
      return resolution;
    }
  }
  return resolution;
}

}  // namespace posmr::identity
