/**
 * @file catalog.hpp
 * @brief Satellite catalog snapshot and thread-safe catalog store.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "opnav/core/types.hpp"

namespace opnav::orbit {

/**
 * @brief Immutable set of trackable satellites plus a provenance label.
 */
struct Catalog {
  std::string source{};
  std::vector<core::SatelliteRecord> satellites{};
};

/**
 * @brief Catalog pointer and the store generation it was installed at.
 */
struct CatalogSnapshot {
  std::shared_ptr<const Catalog> catalog{};
  std::uint64_t generation{};
};

/**
 * @brief Holder for the current catalog, hot-swappable from any thread.
 *
 * Readers take a stable `shared_ptr` snapshot and keep using it for a whole cycle
 * even if the catalog is replaced concurrently.
 */
class CatalogStore final {
 public:
  CatalogStore() : catalog_(std::make_shared<const Catalog>()) {}
  explicit CatalogStore(std::shared_ptr<const Catalog> catalog);

  /**
   * @brief Current catalog; never null.
   */
  [[nodiscard]] std::shared_ptr<const Catalog> snapshot() const;

  /**
   * @brief Replace the catalog. A null pointer installs an empty catalog.
   */
  void replace(std::shared_ptr<const Catalog> catalog);

  /**
   * @brief Number of replacements since construction.
   */
  [[nodiscard]] std::uint64_t generation() const;

  /**
   * @brief Current catalog and generation read under one lock.
   */
  [[nodiscard]] CatalogSnapshot snapshot_with_generation() const;

 private:
  mutable std::mutex mutex_{};
  std::shared_ptr<const Catalog> catalog_{};
  std::uint64_t generation_{};
};

}  // namespace opnav::orbit
