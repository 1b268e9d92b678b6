/**
 * @file collection_id.cpp
 * @brief Known collection lookups
 */

#include "store/collection_id.h"

namespace talentvault::store {

std::string_view CollectionName(CollectionId id) {
  for (const auto& info : kKnownCollections) {
    if (info.id == id) {
      return info.name;
    }
  }
  return {};
}

std::optional<CollectionId> ParseCollectionId(std::string_view name) {
  for (const auto& info : kKnownCollections) {
    if (info.name == name) {
      return info.id;
    }
  }
  return std::nullopt;
}

bool IsCatalogCollection(std::string_view name) {
  for (const auto& info : kKnownCollections) {
    if (info.name == name) {
      return info.catalog;
    }
  }
  return false;
}

}  // namespace talentvault::store
