/**
 * @file test_end_to_end.cpp
 * @brief Observer-to-fix pipeline: visibility, synthesis, solve, post-process.
 * @author Watosn
 */

#include <cmath>
#include <vector>

#include <spdlog/spdlog.h>

#include "opnav/core/geodetic.hpp"
#include "opnav/nav/fix.hpp"
#include "opnav/nav/measurement.hpp"
#include "opnav/nav/multilateration.hpp"
#include "opnav/nav/visibility.hpp"

int main() {
  using namespace opnav;

  const core::GeodeticPoint observer{.lat_deg = 12.9706089, .lon_deg = 80.0431389, .alt_m = 45.0};
  const core::Vec3 truth = core::ecef_from_geodetic(observer);
  const core::Mat3 enu_to_ecef = core::mat_transpose(core::enu_from_ecef_rotation(observer));

  struct Pointing {
    double az_deg;
    double el_deg;
    double range_km;
  };
  // Four LEO-range satellites above the mask plus one below the horizon.
  const std::vector<Pointing> sky{{15.0, 65.0, 900.0},
                                  {110.0, 40.0, 1200.0},
                                  {220.0, 30.0, 1500.0},
                                  {320.0, 55.0, 800.0},
                                  {180.0, 5.0, 2500.0}};

  nav::MeasurementSynthesizer synthesizer(1U);
  std::vector<nav::Measurement> measurements;
  for (const auto& p : sky) {
    const double az = p.az_deg * core::constants::kDegToRad;
    const double el = p.el_deg * core::constants::kDegToRad;
    const core::Vec3 sat = truth + core::mat_vec(enu_to_ecef, core::Vec3{std::cos(el) * std::sin(az) * p.range_km,
                                                                         std::cos(el) * std::cos(az) * p.range_km,
                                                                         std::sin(el) * p.range_km});
    const core::LookAngles look = core::look_angles(observer, sat);
    if (std::abs(look.elevation_deg - p.el_deg) > 1e-6 || look.range_km < 500.0) {
      spdlog::error("scenario geometry mismatch for az={}", p.az_deg);
      return 1;
    }
    if (!nav::is_visible(look.elevation_deg, nav::kDefaultElevationMaskDeg)) {
      continue;
    }
    const auto synth = synthesizer.synthesize(sat, truth, 120.0, 0.0);
    if (!synth.ok()) {
      spdlog::error("synthesis rejected for az={}", p.az_deg);
      return 7;
    }
    measurements.push_back(synth.measurement);
  }
  if (measurements.size() != 4U) {
    spdlog::error("expected 4 visible satellites, got {}", measurements.size());
    return 2;
  }

  const auto result =
      nav::solve(measurements, nav::SolverConfig{.initial_state = nav::coarse_initial_state(measurements)});
  if (!result.ok() || !result.converged) {
    spdlog::error("end-to-end solve failed: {}", core::to_string(result.status));
    return 3;
  }

  const nav::Fix fix = nav::postprocess(result.state, observer, 1.0);
  const double dlat_m = (fix.lat_deg - observer.lat_deg) * 111000.0;
  const double dlon_m = (fix.lon_deg - observer.lon_deg) * 111000.0;
  if (std::abs(dlat_m) > 0.01 || std::abs(dlon_m) > 0.01 || fix.error_m > 0.01) {
    spdlog::error("fix off truth: dlat={} m dlon={} m err={} m", dlat_m, dlon_m, fix.error_m);
    return 4;
  }
  if (std::abs(fix.alt_m - observer.alt_m) > 0.01 || std::abs(fix.clock_bias_km - 120.0) > 1e-6) {
    spdlog::error("altitude/bias off truth: alt={} bias={}", fix.alt_m, fix.clock_bias_km);
    return 5;
  }
  if (nav::ecef_error_m(result.state, truth) > 0.01) {
    spdlog::error("ecef error too large: {}", nav::ecef_error_m(result.state, truth));
    return 6;
  }
  return 0;
}
