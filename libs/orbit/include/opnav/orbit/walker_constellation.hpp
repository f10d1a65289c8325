/**
 * @file walker_constellation.hpp
 * @brief Synthetic Walker-delta constellation catalogs.
 * @author Watosn
 */
#pragma once

#include <string>

#include "opnav/core/types.hpp"
#include "opnav/orbit/catalog.hpp"

namespace opnav::orbit {

/**
 * @brief Provenance label given to generated catalogs.
 */
inline constexpr const char* kSyntheticCatalogSource = "SYNTHETIC";

/**
 * @brief Walker i:T/P/F constellation parameters (circular orbits).
 *
 * Defaults approximate a polar LEO broadband shell dense enough for 4+ satellites
 * above a 10 deg mask at any latitude.
 */
struct WalkerConfig {
  std::string name_prefix{"LEO"};
  std::string group{"walker"};
  int total_satellites{288};
  int planes{12};
  int phasing{1};
  double altitude_km{1200.0};
  double inclination_deg{87.9};
  /// RAAN spread: 360 for a Walker-delta, 180 for a Walker-star.
  double raan_spread_deg{360.0};
  core::Epoch epoch{};
};

/**
 * @brief Build a constellation catalog.
 * @param status_out Optional; InvalidInput when planes do not divide the total, counts are
 *        non-positive, phasing is outside [0, planes) or altitude is not positive.
 * @return Catalog labeled `kSyntheticCatalogSource`, empty on invalid input.
 */
[[nodiscard]] Catalog make_walker_constellation(const WalkerConfig& config, core::Status* status_out = nullptr);

}  // namespace opnav::orbit
