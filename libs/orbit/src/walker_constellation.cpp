/**
 * @file walker_constellation.cpp
 * @brief Walker constellation generator.
 * @author Watosn
 */

#include "opnav/orbit/walker_constellation.hpp"

#include <fmt/format.h>

#include "opnav/core/constants.hpp"
#include "opnav/core/math_utils.hpp"

namespace opnav::orbit {

Catalog make_walker_constellation(const WalkerConfig& config, core::Status* status_out) {
  Catalog catalog{.source = kSyntheticCatalogSource};
  const bool valid = config.total_satellites > 0 && config.planes > 0 &&
                     (config.total_satellites % config.planes) == 0 && config.phasing >= 0 &&
                     config.phasing < config.planes && config.altitude_km > 0.0;
  if (status_out) {
    *status_out = valid ? core::Status::Ok : core::Status::InvalidInput;
  }
  if (!valid) {
    return catalog;
  }

  const int per_plane = config.total_satellites / config.planes;
  const double a = core::constants::kWgs84SemiMajorAxisKm + config.altitude_km;
  const double plane_step_deg = config.raan_spread_deg / static_cast<double>(config.planes);
  const double slot_step_deg = 360.0 / static_cast<double>(per_plane);
  const double phase_step_deg = 360.0 * static_cast<double>(config.phasing) / static_cast<double>(config.total_satellites);

  catalog.satellites.reserve(static_cast<std::size_t>(config.total_satellites));
  for (int p = 0; p < config.planes; ++p) {
    for (int s = 0; s < per_plane; ++s) {
      const double m_deg = static_cast<double>(s) * slot_step_deg + static_cast<double>(p) * phase_step_deg;
      catalog.satellites.push_back(core::SatelliteRecord{
          .name = fmt::format("{}-{:02d}{:02d}", config.name_prefix, p + 1, s + 1),
          .group = config.group,
          .elements = core::KeplerianElements{
              .epoch = config.epoch,
              .semi_major_axis_km = a,
              .eccentricity = 0.0,
              .inclination_deg = config.inclination_deg,
              .raan_deg = static_cast<double>(p) * plane_step_deg,
              .arg_perigee_deg = 0.0,
              .mean_anomaly_deg = core::wrap_deg_360(m_deg),
          }});
    }
  }
  return catalog;
}

}  // namespace opnav::orbit
