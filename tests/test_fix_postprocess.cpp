/**
 * @file test_fix_postprocess.cpp
 * @brief Fix blending, error metric and smoothing tests.
 * @author Watosn
 */

#include <cmath>

#include <spdlog/spdlog.h>

#include "opnav/core/geodetic.hpp"
#include "opnav/nav/fix.hpp"

namespace {

bool approx_abs(double a, double b, double tol) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  using namespace opnav;

  const core::GeodeticPoint reference{.lat_deg = 12.9706089, .lon_deg = 80.0431389, .alt_m = 45.0};
  const core::GeodeticPoint offset{.lat_deg = 12.9806089, .lon_deg = 80.0631389, .alt_m = 145.0};
  const nav::StateEstimate raw{.position_km = core::ecef_from_geodetic(offset), .clock_bias_km = 120.0};

  // w = 1 keeps the raw solution; error is the full offset.
  const nav::Fix unblended = nav::postprocess(raw, reference, 1.0);
  if (!approx_abs(unblended.lat_deg, offset.lat_deg, 1e-8) || !approx_abs(unblended.lon_deg, offset.lon_deg, 1e-8) ||
      !approx_abs(unblended.alt_m, offset.alt_m, 1e-3)) {
    spdlog::error("unblended fix must equal the raw solution");
    return 1;
  }
  const double expected_error = std::hypot(0.01 * 111000.0, 0.02 * 111000.0);
  if (!approx_abs(unblended.error_m, expected_error, 1e-2) || unblended.mode != nav::FixMode::Lock3D ||
      unblended.clock_bias_km != 120.0) {
    spdlog::error("unblended error mismatch: {} vs {}", unblended.error_m, expected_error);
    return 2;
  }

  // w = 0.5 lands halfway; error halves; altitude stays raw.
  const nav::Fix half = nav::postprocess(raw, reference, 0.5);
  if (!approx_abs(half.lat_deg, 12.9756089, 1e-8) || !approx_abs(half.lon_deg, 80.0531389, 1e-8) ||
      !approx_abs(half.alt_m, offset.alt_m, 1e-3) || !approx_abs(half.error_m, 0.5 * expected_error, 1e-2)) {
    spdlog::error("half blend mismatch: lat={} lon={} alt={} err={}", half.lat_deg, half.lon_deg, half.alt_m,
                  half.error_m);
    return 3;
  }

  // w = 0 collapses onto the reference.
  const nav::Fix pinned = nav::postprocess(raw, reference, 0.0);
  if (!approx_abs(pinned.lat_deg, reference.lat_deg, 1e-12) || !approx_abs(pinned.lon_deg, reference.lon_deg, 1e-12) ||
      pinned.error_m > 1e-6) {
    spdlog::error("zero-weight blend must equal the reference");
    return 4;
  }

  // Longitude blending follows the short arc across the antimeridian.
  const core::GeodeticPoint east_of_dateline{.lat_deg = 0.0, .lon_deg = 179.9, .alt_m = 0.0};
  const core::GeodeticPoint west_of_dateline{.lat_deg = 0.0, .lon_deg = -179.9, .alt_m = 0.0};
  const nav::StateEstimate across{.position_km = core::ecef_from_geodetic(west_of_dateline), .clock_bias_km = 0.0};
  const nav::Fix wrapped = nav::postprocess(across, east_of_dateline, 0.5);
  if (!approx_abs(std::abs(wrapped.lon_deg), 180.0, 1e-8) || !approx_abs(wrapped.error_m, 0.1 * 111000.0, 1e-2)) {
    spdlog::error("antimeridian blend mismatch: lon={} err={}", wrapped.lon_deg, wrapped.error_m);
    return 5;
  }
  if (!approx_abs(nav::planar_error_m(east_of_dateline, west_of_dateline), 0.2 * 111000.0, 1e-6)) {
    spdlog::error("planar error must wrap longitude");
    return 6;
  }

  if (!approx_abs(nav::ecef_error_m(raw, core::ecef_from_geodetic(offset)), 0.0, 1e-9) ||
      !approx_abs(nav::ecef_error_m(nav::StateEstimate{.position_km = core::Vec3{1.0, 0.0, 0.0}}, core::Vec3{}), 1000.0,
                  1e-9)) {
    spdlog::error("ecef error mismatch");
    return 7;
  }

  // raw_fix carries solver diagnostics and the truth error.
  nav::SolveResult solved{};
  solved.state = raw;
  solved.converged = true;
  solved.iterations_used = 5;
  solved.measurements_used = 6;
  solved.gdop = 2.5;
  solved.pdop = 2.0;
  const nav::Fix canonical = nav::raw_fix(solved, reference);
  if (canonical.mode != nav::FixMode::Lock3D || canonical.satellites_used != 6 || canonical.iterations_used != 5 ||
      canonical.gdop != 2.5 || !approx_abs(canonical.error_m, expected_error, 1e-2)) {
    spdlog::error("raw fix diagnostics mismatch");
    return 8;
  }
  solved.converged = false;
  if (nav::raw_fix(solved).mode != nav::FixMode::Degraded || nav::raw_fix(solved).error_m != 0.0) {
    spdlog::error("unconverged raw fix must be degraded with unknown error");
    return 9;
  }
  solved.status = core::Status::SingularGeometry;
  if (nav::raw_fix(solved).mode != nav::FixMode::NoFix) {
    spdlog::error("failed solve must produce no fix");
    return 10;
  }

  // Smoother.
  nav::ExponentialFixSmoother smoother(0.25);
  if (smoother.current().has_value()) {
    spdlog::error("smoother must start empty");
    return 11;
  }
  nav::Fix a{};
  a.lat_deg = 10.0;
  a.lon_deg = 179.0;
  a.alt_m = 100.0;
  nav::Fix b = a;
  b.lat_deg = 14.0;
  b.lon_deg = -179.0;
  b.alt_m = 200.0;
  if (smoother.update(a) != core::Status::Ok || smoother.current()->lat_deg != 10.0) {
    spdlog::error("first smoother update must pass through");
    return 12;
  }
  if (smoother.update(b) != core::Status::Ok) {
    spdlog::error("smoother update failed");
    return 13;
  }
  const auto s = *smoother.current();
  if (!approx_abs(s.lat_deg, 11.0, 1e-12) || !approx_abs(s.lon_deg, 179.5, 1e-12) || !approx_abs(s.alt_m, 125.0, 1e-12)) {
    spdlog::error("smoothed fix mismatch: lat={} lon={} alt={}", s.lat_deg, s.lon_deg, s.alt_m);
    return 14;
  }
  smoother.reset();
  if (smoother.current().has_value()) {
    spdlog::error("reset must clear the smoother");
    return 15;
  }
  nav::ExponentialFixSmoother bad(1.5);
  if (bad.update(a) != core::Status::InvalidInput || bad.current().has_value()) {
    spdlog::error("out-of-range gain must be rejected");
    return 16;
  }
  return 0;
}
