/**
 * @file engine_config.hpp
 * @brief Navigation engine configuration.
 * @author Watosn
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>

#include "opnav/core/types.hpp"
#include "opnav/nav/multilateration.hpp"
#include "opnav/nav/visibility.hpp"
#include "opnav/rf/spectrum_source.hpp"

namespace opnav::engine {

/**
 * @brief Everything the navigation cycle needs besides its collaborators.
 *
 * `observer` is the true receiver location used to synthesize measurements; it is
 * never fed to the solver.
 */
struct EngineConfig {
  core::GeodeticPoint observer{.lat_deg = 12.9706089, .lon_deg = 80.0431389, .alt_m = 45.0};
  /// Single elevation mask applied to every satellite (deg).
  double elevation_mask_deg{nav::kDefaultElevationMaskDeg};
  double clock_bias_km{120.0};
  double noise_bound_km{0.02};
  nav::SolverConfig solver{};
  /// Seed each solve from the previous converged estimate instead of the coarse centroid.
  bool seed_from_previous{true};
  /// 1 publishes the raw solver fix; values below 1 blend toward `reference`.
  double blend_weight{1.0};
  /// Blend reference; the observer when empty.
  std::optional<core::GeodeticPoint> reference{};
  /// Exponential smoothing gain for the secondary smoothed fix; 0 disables it.
  double smoothing_alpha{0.0};
  std::chrono::milliseconds cycle_interval{1000};
  std::size_t max_catalog_satellites{400};
  std::size_t max_published_satellites{6};
  double ground_track_half_span_s{900.0};
  double ground_track_step_s{180.0};
  std::size_t spectrum_bins{40};
  rf::SpectrumMode spectrum_mode{rf::SpectrumMode::Synthetic};
  std::filesystem::path spectrum_file{};
  std::size_t event_log_depth{10};
  bool log_to_stdout{true};
  /// Seed for measurement noise and synthetic spectra; 0 seeds from the clock.
  std::uint64_t rng_seed{0};
};

/**
 * @brief Check ranges of configuration members.
 * @return InvalidInput for an observer outside valid latitude/longitude, a noise bound
 *         outside [0, clock_bias_km], blend weight outside [0, 1], smoothing gain outside
 *         [0, 1], a non-positive rank tolerance or negative condition cap, a non-positive
 *         cycle interval or ground-track step, or a Live spectrum mode without a file.
 */
[[nodiscard]] core::Status validate(const EngineConfig& config);

}  // namespace opnav::engine
