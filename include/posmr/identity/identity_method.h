#pragma once

#include "posmr/domain/store.h"

#include <string>
#include <string_view>

namespace posmr::identity {

// IdentityQuery is one (submission labels, candidate store) pair with every
// label already normalized, so methods never re-normalize.
struct IdentityQuery {
  std::string leader;              // normalize_label(leader_label)
  std::string shop_name;           // normalize_label(shop_name_label)
  std::string store_id;            // normalize_label(candidate store id)
  std::string catalog_store_name;  // normalize_label(catalog name), empty when unknown
  const domain::StoreCatalogEntry* catalog_entry{nullptr};
};

// MethodOutcome: matched says the method's own criteria hold; confidence is
// meaningful only when matched. The resolver applies the global threshold.
struct MethodOutcome {
  bool matched{false};
  double confidence{0.0};
};

// IdentityMethod is one tier of the store identity cascade.
// Implementations are immutable after construction and safe to share across threads.
class IdentityMethod {
 public:
  virtual ~IdentityMethod() = default;

  [[nodiscard]] virtual std::string_view method_id() const noexcept = 0;
  [[nodiscard]] virtual std::string_view description() const noexcept = 0;

  [[nodiscard]] virtual MethodOutcome Evaluate(const IdentityQuery& query) const = 0;

 protected:
  IdentityMethod() = default;
  IdentityMethod(const IdentityMethod&) = default;
  IdentityMethod& operator=(const IdentityMethod&) = default;
  IdentityMethod(IdentityMethod&&) = default;
  IdentityMethod& operator=(IdentityMethod&&) = default;
};

}  // namespace posmr::identity
