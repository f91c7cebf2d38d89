#include "posmr/identity/methods/strict_partial_name.h"

#include "posmr/core/normalization.h"

#include <algorithm>

namespace posmr::identity {

MethodOutcome StrictPartialName::Evaluate(const IdentityQuery& query) const {
  const std::string& shop = query.shop_name;
  const std::string& store = query.catalog_store_name;
  if (shop.empty() || store.empty()) {
    return {};
  }

  // Numbered-store guard runs before any overlap scoring.
  if ((core::ends_with_digit(shop) || core::ends_with_digit(store)) && shop != store) {
    return {};
  }

  const auto shop_tokens = core::tokenize_label(shop);
  const auto store_tokens = core::tokenize_label(store);
  if (shop_tokens.size() < 2 || store_tokens.size() < 2) {
    return {};
  }

  std::size_t shared = 0;
  for (const auto& token : shop_tokens) {
    shared += store_tokens.count(token);
  }
  const double overlap = core::jaccard(shop_tokens, store_tokens);
  if (overlap < thresholds_.partial_min_overlap || shared < thresholds_.partial_min_shared_tokens) {
    return {};
  }

  const std::size_t larger = std::max(shop_tokens.size(), store_tokens.size());
  const std::size_t smaller = std::min(shop_tokens.size(), store_tokens.size());
  if (larger - smaller > thresholds_.partial_max_token_count_diff) {
    return {};
  }

  if (shop.find(store) == std::string::npos && store.find(shop) == std::string::npos) {
    return {};
  }

  const double floor = thresholds_.partial_confidence_floor;
  const double ceiling = thresholds_.partial_confidence_ceiling;
  double confidence = ceiling;
  if (thresholds_.partial_min_overlap < 1.0) {
    const double span = 1.0 - thresholds_.partial_min_overlap;
    confidence = floor + (ceiling - floor) * (overlap - thresholds_.partial_min_overlap) / span;
  }
  return {true, std::clamp(confidence, floor, ceiling)};
}

}  // namespace posmr::identity
