/**
 * @file snapshot.hpp
 * @brief Immutable per-cycle navigation output.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "opnav/core/types.hpp"
#include "opnav/nav/fix.hpp"

namespace opnav::engine {

/**
 * @brief One visible satellite as seen from the observer this cycle.
 */
struct SatelliteView {
  std::string name{};
  std::string group{};
  double azimuth_deg{};
  double elevation_deg{};
  double range_km{};
  double time_of_flight_ms{};
  core::GeodeticPoint subpoint{};
};

/**
 * @brief Sub-satellite points around the cycle epoch.
 */
struct GroundTrack {
  std::string name{};
  std::vector<core::GeodeticPoint> points{};
};

/**
 * @brief Whole-cycle output. Built off to the side and published once; never mutated after.
 */
struct NavSnapshot {
  std::uint64_t sequence{};
  core::Epoch epoch{};
  std::string status{"BOOTING"};
  std::string catalog_source{"INIT"};
  /// Latest good fix; retained from an earlier cycle when this cycle could not solve.
  nav::Fix fix{};
  bool fix_updated{};
  std::optional<nav::Fix> smoothed_fix{};
  core::Status solve_status{core::Status::DataUnavailable};
  std::size_t visible_satellites{};
  std::size_t propagation_failures{};
  /// Highest-elevation satellites first, truncated to the configured count.
  std::vector<SatelliteView> satellites{};
  std::vector<GroundTrack> ground_tracks{};
  std::vector<double> spectrum{};
  core::Status spectrum_status{core::Status::DataUnavailable};
  std::vector<std::string> event_log{};
};

}  // namespace opnav::engine
