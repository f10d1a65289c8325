/**
 * @file kepler_propagator.cpp
 * @brief Two-body propagator implementation.
 * @author Watosn
 */

#include "opnav/orbit/kepler_propagator.hpp"

#include <cmath>

#include "opnav/core/constants.hpp"
#include "opnav/core/math_utils.hpp"
#include "opnav/core/transforms.hpp"

namespace opnav::orbit {

core::PropagationResult KeplerPropagator::propagate(const core::SatelliteRecord& satellite,
                                                    const core::Epoch& epoch) const {
  using core::constants::kDegToRad;
  const auto& el = satellite.elements;
  const double a = el.semi_major_axis_km;
  const double e = el.eccentricity;
  if (!(a > 0.0) || !(e >= 0.0 && e < 1.0) || !std::isfinite(epoch.utc_seconds)) {
    return core::PropagationResult{.status = core::Status::InvalidInput};
  }

  const double mu = core::constants::kEarthMuKm3S2;
  const double mean_motion = std::sqrt(mu / (a * a * a));
  const double dt = epoch.utc_seconds - el.epoch.utc_seconds;
  double m = std::fmod(el.mean_anomaly_deg * kDegToRad + mean_motion * dt, core::constants::kTwoPi);
  if (m < 0.0) {
    m += core::constants::kTwoPi;
  }

  double ecc_anomaly = (e < 0.8) ? m : core::constants::kPi;
  bool converged = false;
  for (int i = 0; i < config_.max_kepler_iterations; ++i) {
    const double f = ecc_anomaly - e * std::sin(ecc_anomaly) - m;
    ecc_anomaly -= f / (1.0 - e * std::cos(ecc_anomaly));
    if (std::abs(f) < config_.kepler_tolerance_rad) {
      converged = true;
      break;
    }
  }
  if (!converged || !std::isfinite(ecc_anomaly)) {
    return core::PropagationResult{.status = core::Status::PropagationFailure};
  }

  const double cos_e = std::cos(ecc_anomaly);
  const double sin_e = std::sin(ecc_anomaly);
  const double root = std::sqrt(1.0 - e * e);
  const double r = a * (1.0 - e * cos_e);
  const core::Vec3 r_pf{a * (cos_e - e), a * root * sin_e, 0.0};
  const double vscale = std::sqrt(mu * a) / r;
  const core::Vec3 v_pf{-vscale * sin_e, vscale * root * cos_e, 0.0};

  // Perifocal -> ECI: active rotations by argument of perigee, inclination and RAAN.
  const core::Mat3 pf_to_eci = core::mat_mul(
      core::rot_z(-el.raan_deg * kDegToRad),
      core::mat_mul(core::rot_x(-el.inclination_deg * kDegToRad), core::rot_z(-el.arg_perigee_deg * kDegToRad)));
  const core::Vec3 r_eci = core::mat_vec(pf_to_eci, r_pf);
  const core::Vec3 v_eci = core::mat_vec(pf_to_eci, v_pf);

  const auto ctx = core::build_approx_eci_ecef_context(epoch.utc_seconds);
  return core::PropagationResult{
      .position_ecef_km = core::approx_eci_to_ecef_position(r_eci, ctx),
      .velocity_ecef_kms = core::approx_eci_to_ecef_velocity(r_eci, v_eci, ctx),
      .status = core::Status::Ok,
  };
}

}  // namespace opnav::orbit
