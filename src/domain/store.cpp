#include "posmr/domain/store.h"

#include "posmr/core/normalization.h"

namespace posmr::domain {

core::Result<bool, std::string> StoreCatalogEntry::validate() const {
  if (core::trim(store_id).empty()) {
    return core::Result<bool, std::string>::err("store_id must not be empty");
  }
  return core::Result<bool, std::string>::ok(true);
}

StoreCatalog::StoreCatalog(const std::vector<StoreCatalogEntry>& entries) {
  for (const auto& entry : entries) {
    const auto [it, inserted] = entries_.emplace(core::trim(entry.store_id), entry);
    if (!inserted) {
      ++duplicates_;
    }
  }
}

const StoreCatalogEntry* StoreCatalog::find(const std::string& store_id) const {
  const auto it = entries_.find(core::trim(store_id));
  return it != entries_.end() ? &it->second : nullptr;
}

}  // namespace posmr::domain
