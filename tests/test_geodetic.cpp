/**
 * @file test_geodetic.cpp
 * @brief WGS-84 geodetic/ECEF and look-angle regression tests.
 * @author Watosn
 */

#include <cmath>
#include <random>

#include <spdlog/spdlog.h>

#include "opnav/core/geodetic.hpp"

namespace {

bool approx_abs(double a, double b, double tol) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  using namespace opnav::core;

  // Known point: equator/prime meridian sits on the semi-major axis.
  const Vec3 origin = ecef_from_geodetic(GeodeticPoint{.lat_deg = 0.0, .lon_deg = 0.0, .alt_m = 0.0});
  if (!approx_abs(origin.x, constants::kWgs84SemiMajorAxisKm, 1e-9) || !approx_abs(origin.y, 0.0, 1e-9) ||
      !approx_abs(origin.z, 0.0, 1e-9)) {
    spdlog::error("equator/prime-meridian ecef mismatch: {} {} {}", origin.x, origin.y, origin.z);
    return 1;
  }

  // Pole: z equals the semi-minor axis b = a sqrt(1 - e^2).
  const Vec3 pole = ecef_from_geodetic(GeodeticPoint{.lat_deg = 90.0, .lon_deg = 0.0, .alt_m = 0.0});
  const double b = constants::kWgs84SemiMajorAxisKm * std::sqrt(1.0 - constants::kWgs84EccentricitySquared);
  if (!approx_abs(pole.z, b, 1e-6) || !approx_abs(std::hypot(pole.x, pole.y), 0.0, 1e-9)) {
    spdlog::error("north pole ecef mismatch: z={} expected={}", pole.z, b);
    return 2;
  }

  std::mt19937 rng(20240611U);
  std::uniform_real_distribution<double> lat_dist(-89.0, 89.0);
  std::uniform_real_distribution<double> lon_dist(-180.0, 180.0);
  std::uniform_real_distribution<double> alt_dist(-500.0, 20000.0);
  for (int i = 0; i < 1000; ++i) {
    const GeodeticPoint in{.lat_deg = lat_dist(rng), .lon_deg = lon_dist(rng), .alt_m = alt_dist(rng)};
    const GeodeticPoint out = geodetic_from_ecef(ecef_from_geodetic(in));
    if (!approx_abs(out.lat_deg, in.lat_deg, 1e-6) || !approx_abs(wrap_deg_180(out.lon_deg - in.lon_deg), 0.0, 1e-6)) {
      spdlog::error("round trip angle mismatch at ({}, {}): ({}, {})", in.lat_deg, in.lon_deg, out.lat_deg, out.lon_deg);
      return 3;
    }
    if (!approx_abs(out.alt_m, in.alt_m, 1e-3)) {
      spdlog::error("round trip altitude mismatch at ({}, {}): {} vs {}", in.lat_deg, in.lon_deg, out.alt_m, in.alt_m);
      return 4;
    }
  }

  // LEO altitudes stay within the same bounds.
  const GeodeticPoint leo{.lat_deg = 53.0, .lon_deg = -120.0, .alt_m = 1.2e6};
  const GeodeticPoint leo_out = geodetic_from_ecef(ecef_from_geodetic(leo));
  if (!approx_abs(leo_out.lat_deg, leo.lat_deg, 1e-6) || !approx_abs(leo_out.alt_m, leo.alt_m, 1e-3)) {
    spdlog::error("leo round trip mismatch");
    return 5;
  }

  // Look angles: a point straight up is at 90 deg elevation and its altitude in range.
  const GeodeticPoint observer{.lat_deg = 12.9706089, .lon_deg = 80.0431389, .alt_m = 45.0};
  const Vec3 zenith = ecef_from_geodetic(GeodeticPoint{.lat_deg = observer.lat_deg, .lon_deg = observer.lon_deg, .alt_m = 500045.0});
  const LookAngles up = look_angles(observer, zenith);
  if (!approx_abs(up.elevation_deg, 90.0, 1e-6) || !approx_abs(up.range_km, 500.0, 1e-6)) {
    spdlog::error("zenith look angles mismatch: el={} range={}", up.elevation_deg, up.range_km);
    return 6;
  }

  // A target displaced purely east/north of the observer in its local frame.
  const Mat3 enu_to_ecef = mat_transpose(enu_from_ecef_rotation(observer));
  const Vec3 obs_ecef = ecef_from_geodetic(observer);
  const Vec3 east = obs_ecef + mat_vec(enu_to_ecef, Vec3{100.0, 0.0, 0.0});
  const Vec3 north = obs_ecef + mat_vec(enu_to_ecef, Vec3{0.0, 100.0, 0.0});
  const Vec3 west_up = obs_ecef + mat_vec(enu_to_ecef, Vec3{-100.0, 0.0, 100.0});
  const LookAngles e = look_angles(observer, east);
  const LookAngles n = look_angles(observer, north);
  const LookAngles wu = look_angles(observer, west_up);
  if (!approx_abs(e.azimuth_deg, 90.0, 1e-9) || !approx_abs(e.elevation_deg, 0.0, 1e-9)) {
    spdlog::error("east azimuth mismatch: az={} el={}", e.azimuth_deg, e.elevation_deg);
    return 7;
  }
  if (!approx_abs(wrap_deg_180(n.azimuth_deg), 0.0, 1e-9)) {
    spdlog::error("north azimuth mismatch: az={}", n.azimuth_deg);
    return 8;
  }
  if (!approx_abs(wu.azimuth_deg, 270.0, 1e-9) || !approx_abs(wu.elevation_deg, 45.0, 1e-9) ||
      !approx_abs(wu.range_km, std::sqrt(2.0) * 100.0, 1e-9)) {
    spdlog::error("west-up look angles mismatch: az={} el={} range={}", wu.azimuth_deg, wu.elevation_deg, wu.range_km);
    return 9;
  }

  // Observer at its own position.
  const LookAngles self = look_angles(observer, obs_ecef);
  if (self.range_km != 0.0 || self.elevation_deg != 90.0) {
    spdlog::error("coincident target look angles mismatch");
    return 10;
  }

  const GeodeticPoint sp = subpoint(zenith);
  if (!approx_abs(sp.lat_deg, observer.lat_deg, 1e-6) || !approx_abs(sp.lon_deg, observer.lon_deg, 1e-9) ||
      sp.alt_m != 0.0) {
    spdlog::error("subpoint mismatch");
    return 11;
  }

  return 0;
}
