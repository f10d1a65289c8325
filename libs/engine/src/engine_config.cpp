/**
 * @file engine_config.cpp
 * @brief Engine configuration validation.
 * @author Watosn
 */

#include "opnav/engine/engine_config.hpp"

#include <cmath>

#include "opnav/nav/measurement.hpp"

namespace opnav::engine {
namespace {

bool valid_geodetic(const core::GeodeticPoint& g) {
  return g.lat_deg >= -90.0 && g.lat_deg <= 90.0 && g.lon_deg >= -180.0 && g.lon_deg <= 180.0 &&
         std::isfinite(g.alt_m);
}

}  // namespace

core::Status validate(const EngineConfig& config) {
  if (!valid_geodetic(config.observer) || (config.reference && !valid_geodetic(*config.reference))) {
    return core::Status::InvalidInput;
  }
  if (!std::isfinite(config.elevation_mask_deg) ||
      nav::check_noise_model(config.clock_bias_km, config.noise_bound_km) != core::Status::Ok) {
    return core::Status::InvalidInput;
  }
  if (!(config.blend_weight >= 0.0 && config.blend_weight <= 1.0) ||
      !(config.smoothing_alpha >= 0.0 && config.smoothing_alpha <= 1.0)) {
    return core::Status::InvalidInput;
  }
  if (config.solver.max_iterations < 1 || !(config.solver.convergence_threshold_km >= 0.0) ||
      !(config.solver.rank_tolerance > 0.0) || !(config.solver.max_condition_number >= 0.0)) {
    return core::Status::InvalidInput;
  }
  if (config.cycle_interval.count() <= 0 || !(config.ground_track_step_s > 0.0) ||
      !(config.ground_track_half_span_s >= 0.0)) {
    return core::Status::InvalidInput;
  }
  if (config.spectrum_mode == rf::SpectrumMode::Live && config.spectrum_file.empty()) {
    return core::Status::InvalidInput;
  }
  return core::Status::Ok;
}

}  // namespace opnav::engine
