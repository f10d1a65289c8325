/**
 * @file measurement.cpp
 * @brief Synthetic pseudorange generation.
 * @author Watosn
 */

#include "opnav/nav/measurement.hpp"

#include <chrono>
#include <cmath>

#include "opnav/core/constants.hpp"

namespace opnav::nav {

core::Status check_noise_model(double clock_bias_km, double noise_bound_km) {
  if (!std::isfinite(clock_bias_km) || !std::isfinite(noise_bound_km) || noise_bound_km < 0.0 ||
      noise_bound_km > clock_bias_km) {
    return core::Status::InvalidInput;
  }
  return core::Status::Ok;
}

double time_of_flight_ms(double pseudorange_km) {
  return pseudorange_km / core::constants::kSpeedOfLightKmS * 1000.0;
}

MeasurementSynthesizer::MeasurementSynthesizer(std::uint64_t seed) {
  if (seed == 0) {
    seed = static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
  }
  rng_.seed(seed);
}

SynthesisResult MeasurementSynthesizer::synthesize(const core::Vec3& sat_pos_km,
                                               const core::Vec3& truth_pos_km,
                                               double clock_bias_km,
                                               double noise_bound_km) {
  SynthesisResult out{};
  out.measurement.satellite_position_km = sat_pos_km;
  out.status = check_noise_model(clock_bias_km, noise_bound_km);
  if (!out.ok()) {
    return out;
  }
  double noise_km = 0.0;
  if (noise_bound_km > 0.0) {
    std::uniform_real_distribution<double> dist(-noise_bound_km, noise_bound_km);
    noise_km = dist(rng_);
  }
  out.measurement.pseudorange_km = core::distance(sat_pos_km, truth_pos_km) + clock_bias_km + noise_km;
  return out;
}

}  // namespace opnav::nav
