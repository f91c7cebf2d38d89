#pragma once

#include "posmr/config/engine_config.h"
#include "posmr/domain/store.h"
#include "posmr/identity/identity_method.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace posmr::identity {

// Method name reported when no tier reaches the accept threshold.
inline constexpr std::string_view kNoMatchMethod = "none";

// Resolution is the outcome of one submission-vs-store identity check.
// A rejected pair reports method "none" and confidence 0.
struct Resolution {
  bool accepted{false};
  double confidence{0.0};
  std::string method{kNoMatchMethod};
};

// IdentityCascade owns the ordered tiers. Order is significant: the first tier
// that matches at or above the accept threshold decides the resolution.
struct IdentityCascade {
  std::vector<std::unique_ptr<IdentityMethod>> methods;
};

IdentityCascade make_default_cascade(const config::IdentityThresholds& thresholds);

// IdentityResolver decides whether a submission belongs to a given store.
// It is immutable after construction, so one instance is shared by all
// aggregation workers.
class IdentityResolver {
 public:
  explicit IdentityResolver(const config::IdentityThresholds& thresholds = {});
  IdentityResolver(IdentityCascade cascade, const config::IdentityThresholds& thresholds);

  [[nodiscard]] Resolution resolve(std::string_view leader_label, std::string_view shop_name_label,
                                   std::string_view store_id,
                                   const domain::StoreCatalog& catalog) const;

  [[nodiscard]] std::size_t method_count() const noexcept { return cascade_.methods.size(); }
  [[nodiscard]] double accept_threshold() const noexcept { return accept_threshold_; }

 private:
  IdentityCascade cascade_;
  double accept_threshold_;
};

}  // namespace posmr::identity
