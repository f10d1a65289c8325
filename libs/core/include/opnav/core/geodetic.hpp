/**
 * @file geodetic.hpp
 * @brief WGS-84 geodetic <-> ECEF conversion and topocentric look angles.
 * @author Watosn
 */
#pragma once

#include <cmath>

#include "opnav/core/constants.hpp"
#include "opnav/core/math_utils.hpp"
#include "opnav/core/types.hpp"

namespace opnav::core {

/**
 * @brief Fixed iteration count of the Bowring-style latitude refinement.
 *
 * Three passes leave a residual well below 1 mm for |lat| < 89 deg at terrestrial
 * and LEO altitudes. The loop is not convergence-checked.
 */
inline constexpr int kGeodeticInverseIterations = 3;

/**
 * @brief Prime-vertical radius of curvature N(lat) in km.
 */
inline double prime_vertical_radius_km(double lat_rad) {
  const double s = std::sin(lat_rad);
  return constants::kWgs84SemiMajorAxisKm / std::sqrt(1.0 - constants::kWgs84EccentricitySquared * s * s);
}

/**
 * @brief Convert a geodetic coordinate to ECEF kilometers.
 */
inline Vec3 ecef_from_geodetic(const GeodeticPoint& geo) {
  const double lat = geo.lat_deg * constants::kDegToRad;
  const double lon = geo.lon_deg * constants::kDegToRad;
  const double n = prime_vertical_radius_km(lat);
  const double h_km = geo.alt_m / 1000.0;
  return Vec3{
      (n + h_km) * std::cos(lat) * std::cos(lon),
      (n + h_km) * std::cos(lat) * std::sin(lon),
      (n * (1.0 - constants::kWgs84EccentricitySquared) + h_km) * std::sin(lat),
  };
}

/**
 * @brief Convert ECEF kilometers to a geodetic coordinate.
 *
 * Latitude starts at atan2(z, p (1 - e^2)) and is refined a fixed
 * `kGeodeticInverseIterations` times. Accuracy degrades toward the poles, where
 * p / cos(lat) is ill-conditioned.
 */
inline GeodeticPoint geodetic_from_ecef(const Vec3& ecef_km) {
  constexpr double e2 = constants::kWgs84EccentricitySquared;
  const double p = std::hypot(ecef_km.x, ecef_km.y);
  const double lon = std::atan2(ecef_km.y, ecef_km.x);
  double lat = std::atan2(ecef_km.z, p * (1.0 - e2));
  double n = prime_vertical_radius_km(lat);
  for (int i = 0; i < kGeodeticInverseIterations; ++i) {
    n = prime_vertical_radius_km(lat);
    lat = std::atan2(ecef_km.z + e2 * n * std::sin(lat), p);
  }
  const double alt_km = p / std::cos(lat) - n;
  return GeodeticPoint{
      .lat_deg = lat * constants::kRadToDeg, .lon_deg = lon * constants::kRadToDeg, .alt_m = alt_km * 1000.0};
}

/**
 * @brief Rotation taking ECEF vectors into the observer's local East-North-Up frame.
 */
inline Mat3 enu_from_ecef_rotation(const GeodeticPoint& observer) {
  const double lat = observer.lat_deg * constants::kDegToRad;
  const double lon = observer.lon_deg * constants::kDegToRad;
  const double sl = std::sin(lat);
  const double cl = std::cos(lat);
  const double so = std::sin(lon);
  const double co = std::cos(lon);
  Mat3 m{};
  m(0, 0) = -so;
  m(0, 1) = co;
  m(0, 2) = 0.0;
  m(1, 0) = -sl * co;
  m(1, 1) = -sl * so;
  m(1, 2) = cl;
  m(2, 0) = cl * co;
  m(2, 1) = cl * so;
  m(2, 2) = sl;
  return m;
}

/**
 * @brief East-North-Up offset (km) of an ECEF target relative to an observer.
 */
inline Vec3 enu_from_ecef(const GeodeticPoint& observer, const Vec3& target_ecef_km) {
  return mat_vec(enu_from_ecef_rotation(observer), target_ecef_km - ecef_from_geodetic(observer));
}

/**
 * @brief Azimuth (clockwise from north, [0, 360)), elevation and slant range to a target.
 *
 * A target coincident with the observer reports zero range and 90 deg elevation.
 */
inline LookAngles look_angles(const GeodeticPoint& observer, const Vec3& target_ecef_km) {
  const Vec3 enu = enu_from_ecef(observer, target_ecef_km);
  const double range = norm(enu);
  if (!(range > 0.0)) {
    return LookAngles{.azimuth_deg = 0.0, .elevation_deg = 90.0, .range_km = 0.0};
  }
  const double az = wrap_deg_360(std::atan2(enu.x, enu.y) * constants::kRadToDeg);
  const double el = std::asin(enu.z / range) * constants::kRadToDeg;
  return LookAngles{.azimuth_deg = az, .elevation_deg = el, .range_km = range};
}

/**
 * @brief Geodetic point beneath an ECEF position (ground-track sample).
 */
inline GeodeticPoint subpoint(const Vec3& ecef_km) {
  GeodeticPoint g = geodetic_from_ecef(ecef_km);
  g.alt_m = 0.0;
  return g;
}

}  // namespace opnav::core
