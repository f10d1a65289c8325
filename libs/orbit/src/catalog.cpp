/**
 * @file catalog.cpp
 * @brief Catalog store implementation.
 * @author Watosn
 */

#include "opnav/orbit/catalog.hpp"

#include <utility>

namespace opnav::orbit {

CatalogStore::CatalogStore(std::shared_ptr<const Catalog> catalog)
    : catalog_(catalog ? std::move(catalog) : std::make_shared<const Catalog>()) {}

std::shared_ptr<const Catalog> CatalogStore::snapshot() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return catalog_;
}

void CatalogStore::replace(std::shared_ptr<const Catalog> catalog) {
  if (!catalog) {
    catalog = std::make_shared<const Catalog>();
  }
  const std::lock_guard<std::mutex> lock(mutex_);
  catalog_ = std::move(catalog);
  ++generation_;
}

std::uint64_t CatalogStore::generation() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

CatalogSnapshot CatalogStore::snapshot_with_generation() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return CatalogSnapshot{.catalog = catalog_, .generation = generation_};
}

}  // namespace opnav::orbit
