/**
 * @file multilateration.hpp
 * @brief Gauss-Newton pseudorange multilateration (position + clock bias).
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "opnav/core/types.hpp"
#include "opnav/nav/measurement.hpp"

namespace opnav::nav {

/**
 * @brief Minimum number of measurements for the 4-unknown solve.
 */
inline constexpr std::size_t kMinMeasurements = 4;

/**
 * @brief Lower bound on the estimate-to-satellite distance used to normalize line-of-sight rows (km).
 */
inline constexpr double kLineOfSightEpsilonKm = 1e-6;

/**
 * @brief Receiver state solved for: ECEF position and clock bias, both in km.
 */
struct StateEstimate {
  core::Vec3 position_km{};
  double clock_bias_km{};
};

/**
 * @brief Solver configuration.
 */
struct SolverConfig {
  int max_iterations{10};
  double convergence_threshold_km{1e-6};
  /// Starting state. Earth's center with zero bias when empty.
  std::optional<StateEstimate> initial_state{};
  /// Singular values below `rank_tolerance * s_max` mark the geometry as singular.
  double rank_tolerance{1e-10};
  /// Reject geometry with a larger design-matrix condition number; 0 disables the check.
  double max_condition_number{0.0};
};

/**
 * @brief Solver output.
 *
 * The state is populated for every non-failure status, converged or not; callers must
 * check `converged` before trusting it as a reliable fix.
 */
struct SolveResult {
  StateEstimate state{};
  bool converged{};
  int iterations_used{};
  double last_step_km{};
  double condition_number{};
  double gdop{};
  double pdop{};
  double residual_rms_km{};
  std::size_t measurements_used{};
  core::Status status{core::Status::Ok};

  [[nodiscard]] bool ok() const { return status == core::Status::Ok; }
  [[nodiscard]] std::optional<StateEstimate> estimate() const {
    if (!ok()) {
      return std::nullopt;
    }
    return state;
  }
};

/**
 * @brief Estimate receiver position and clock bias by iterative linearized least squares.
 *
 * Each iteration builds rows [los_x, los_y, los_z, 1] and residuals
 * pr - (|X_pos - sat| + X_bias), solves H dX ~= r with an SVD (minimum-norm least
 * squares) and applies X += dX, stopping early once |dX_pos| drops below the
 * threshold. Never throws and always terminates within `max_iterations`.
 *
 * @return InsufficientMeasurements for fewer than 4 inputs, SingularGeometry when the
 *         design matrix loses rank (or exceeds `max_condition_number`), NumericalError
 *         on a non-finite iterate, InvalidInput for a bad configuration.
 */
[[nodiscard]] SolveResult solve(const std::vector<Measurement>& measurements, const SolverConfig& config);

/**
 * @brief Convenience overload starting from Earth's center.
 */
[[nodiscard]] SolveResult solve(const std::vector<Measurement>& measurements,
                                int max_iterations,
                                double convergence_threshold_km);

/**
 * @brief Coarse starting state: the point at WGS-84 equatorial radius beneath the
 *        centroid of the satellite positions, zero clock bias.
 */
[[nodiscard]] StateEstimate coarse_initial_state(const std::vector<Measurement>& measurements);

}  // namespace opnav::nav
