#pragma once

#include "posmr/core/result.h"

#include <map>
#include <string>
#include <vector>

namespace posmr::domain {

// StoreCatalogEntry is the canonical identity of one store.
// store_id is the key; every other field is descriptive.
struct StoreCatalogEntry {
  std::string store_id;
  std::string store_name;
  std::string region;
  std::string province;
  std::string channel;

  [[nodiscard]] core::Result<bool, std::string> validate() const;
};

// StoreCatalog is an immutable lookup table keyed by trimmed store_id.
// When the input repeats an id, the first entry wins.
class StoreCatalog {
 public:
  StoreCatalog() = default;
  explicit StoreCatalog(const std::vector<StoreCatalogEntry>& entries);

  [[nodiscard]] const StoreCatalogEntry* find(const std::string& store_id) const;
  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] std::size_t duplicate_count() const noexcept { return duplicates_; }

 private:
  std::map<std::string, StoreCatalogEntry> entries_;
  std::size_t duplicates_{0};
};

}  // namespace posmr::domain
