/**
 * @file catalog_file.hpp
 * @brief Satellite catalog loaders for on-disk element files.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

#include "opnav/core/types.hpp"
#include "opnav/orbit/catalog.hpp"

namespace opnav::orbit {

/**
 * @brief Provenance label given to catalogs read from disk.
 */
inline constexpr const char* kCachedCatalogSource = "CACHED";

/**
 * @brief Outcome of a catalog load.
 *
 * `catalog` is never null; on DataUnavailable it is empty. Malformed records are
 * skipped and counted in `rejected_records`.
 */
struct CatalogLoadResult {
  std::shared_ptr<const Catalog> catalog{};
  std::size_t rejected_records{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Loader configuration.
 */
struct CatalogFileConfig {
  std::filesystem::path file{};
  std::string source_label{kCachedCatalogSource};
  /// Group tag for TLE records (element CSV rows carry their own).
  std::string default_group{};
};

/**
 * @brief Load an element CSV.
 *
 * Columns: name,group,epoch_utc_s,semi_major_axis_km,eccentricity,inclination_deg,
 * raan_deg,arg_perigee_deg,mean_anomaly_deg. A first line containing "name" is a header.
 */
[[nodiscard]] CatalogLoadResult load_element_csv(const CatalogFileConfig& config);

/**
 * @brief Load a three-line TLE file (name, line 1, line 2 per record).
 *
 * Line checksums are verified. Mean motion is converted to a two-body semi-major axis.
 */
[[nodiscard]] CatalogLoadResult load_tle_file(const CatalogFileConfig& config);

/**
 * @brief Dispatch on extension: ".csv" is an element CSV, anything else is read as TLE.
 */
[[nodiscard]] CatalogLoadResult load_catalog_file(const CatalogFileConfig& config);

/**
 * @brief Parse one TLE record.
 * @return False when either line is malformed or fails its checksum.
 */
bool parse_tle_record(const std::string& name,
                      const std::string& line1,
                      const std::string& line2,
                      core::SatelliteRecord& out);

/**
 * @brief Verify the modulo-10 checksum in column 69 of a TLE line.
 */
[[nodiscard]] bool tle_checksum_ok(const std::string& line);

}  // namespace opnav::orbit
