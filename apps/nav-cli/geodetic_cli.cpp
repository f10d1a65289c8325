/**
 * @file geodetic_cli.cpp
 * @brief WGS-84 geodetic/ECEF conversion and look-angle CLI.
 * @author Watosn
 */

#include <cstdlib>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "opnav/core/geodetic.hpp"

int main(int argc, char** argv) {
  if (argc != 5 && argc != 8) {
    spdlog::error("usage: geodetic_cli lla <lat_deg> <lon_deg> <alt_m>");
    spdlog::error("       geodetic_cli ecef <x_km> <y_km> <z_km>");
    spdlog::error("       geodetic_cli look <obs_lat_deg> <obs_lon_deg> <obs_alt_m> <x_km> <y_km> <z_km>");
    return 1;
  }

  const std::string mode = argv[1];
  const double a = std::atof(argv[2]);
  const double b = std::atof(argv[3]);
  const double c = std::atof(argv[4]);

  if (mode == "lla" && argc == 5) {
    if (a < -90.0 || a > 90.0 || b < -180.0 || b > 180.0) {
      spdlog::error("latitude must be in [-90, 90] and longitude in [-180, 180]");
      return 2;
    }
    const auto ecef = opnav::core::ecef_from_geodetic({.lat_deg = a, .lon_deg = b, .alt_m = c});
    fmt::print("x_km={:.6f} y_km={:.6f} z_km={:.6f}\n", ecef.x, ecef.y, ecef.z);
    return 0;
  }
  if (mode == "ecef" && argc == 5) {
    const auto geo = opnav::core::geodetic_from_ecef(opnav::core::Vec3{a, b, c});
    fmt::print("lat_deg={:.9f} lon_deg={:.9f} alt_m={:.3f}\n", geo.lat_deg, geo.lon_deg, geo.alt_m);
    return 0;
  }
  if (mode == "look" && argc == 8) {
    const opnav::core::GeodeticPoint observer{.lat_deg = a, .lon_deg = b, .alt_m = c};
    const opnav::core::Vec3 target{std::atof(argv[5]), std::atof(argv[6]), std::atof(argv[7])};
    const auto look = opnav::core::look_angles(observer, target);
    const auto sub = opnav::core::subpoint(target);
    fmt::print("az_deg={:.6f} el_deg={:.6f} range_km={:.6f} subpoint_lat_deg={:.6f} subpoint_lon_deg={:.6f}\n",
               look.azimuth_deg, look.elevation_deg, look.range_km, sub.lat_deg, sub.lon_deg);
    return 0;
  }

  spdlog::error("unknown mode or argument count: {}", mode);
  return 3;
}
