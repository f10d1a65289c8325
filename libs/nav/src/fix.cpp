/**
 * @file fix.cpp
 * @brief Fix post-processing implementation.
 * @author Watosn
 */

#include "opnav/nav/fix.hpp"

#include <cmath>

#include "opnav/core/constants.hpp"
#include "opnav/core/geodetic.hpp"
#include "opnav/core/math_utils.hpp"

namespace opnav::nav {
namespace {

// Moves `from` toward `to` by `w` along the shorter longitude arc.
double blend_longitude_deg(double from, double to, double w) {
  return core::wrap_deg_180(from + w * core::wrap_deg_180(to - from));
}

}  // namespace

const char* to_string(FixMode mode) {
  switch (mode) {
    case FixMode::NoFix:
      return "NO FIX";
    case FixMode::Lock3D:
      return "3D LOCK";
    case FixMode::Degraded:
      return "3D DEGRADED";
  }
  return "UNKNOWN";
}

double planar_error_m(const core::GeodeticPoint& a, const core::GeodeticPoint& b) {
  const double dlat = (a.lat_deg - b.lat_deg) * core::constants::kMetersPerDegreeApprox;
  const double dlon = core::wrap_deg_180(a.lon_deg - b.lon_deg) * core::constants::kMetersPerDegreeApprox;
  return std::sqrt(dlat * dlat + dlon * dlon);
}

double ecef_error_m(const StateEstimate& estimate, const core::Vec3& truth_km) {
  return core::distance(estimate.position_km, truth_km) * 1000.0;
}

Fix postprocess(const StateEstimate& raw, const core::GeodeticPoint& reference, double blend_weight) {
  const core::GeodeticPoint g = core::geodetic_from_ecef(raw.position_km);
  const double w = blend_weight;

  const core::GeodeticPoint blended{
      .lat_deg = w * g.lat_deg + (1.0 - w) * reference.lat_deg,
      .lon_deg = blend_longitude_deg(reference.lon_deg, g.lon_deg, w),
      .alt_m = g.alt_m,
  };
  return Fix{
      .lat_deg = blended.lat_deg,
      .lon_deg = blended.lon_deg,
      .alt_m = blended.alt_m,
      .error_m = planar_error_m(blended, reference),
      .mode = FixMode::Lock3D,
      .clock_bias_km = raw.clock_bias_km,
  };
}

Fix raw_fix(const SolveResult& result, const std::optional<core::GeodeticPoint>& truth) {
  if (!result.ok()) {
    return Fix{};
  }
  const core::GeodeticPoint g = core::geodetic_from_ecef(result.state.position_km);
  return Fix{
      .lat_deg = g.lat_deg,
      .lon_deg = g.lon_deg,
      .alt_m = g.alt_m,
      .error_m = truth ? planar_error_m(g, *truth) : 0.0,
      .mode = result.converged ? FixMode::Lock3D : FixMode::Degraded,
      .clock_bias_km = result.state.clock_bias_km,
      .satellites_used = result.measurements_used,
      .iterations_used = result.iterations_used,
      .converged = result.converged,
      .gdop = result.gdop,
      .pdop = result.pdop,
  };
}

core::Status ExponentialFixSmoother::update(const Fix& fix) {
  if (!(alpha_ > 0.0 && alpha_ <= 1.0)) {
    return core::Status::InvalidInput;
  }
  if (!state_) {
    state_ = fix;
    return core::Status::Ok;
  }
  Fix next = fix;
  next.lat_deg = state_->lat_deg + alpha_ * (fix.lat_deg - state_->lat_deg);
  next.lon_deg = blend_longitude_deg(state_->lon_deg, fix.lon_deg, alpha_);
  next.alt_m = state_->alt_m + alpha_ * (fix.alt_m - state_->alt_m);
  next.error_m = state_->error_m + alpha_ * (fix.error_m - state_->error_m);
  state_ = next;
  return core::Status::Ok;
}

}  // namespace opnav::nav
