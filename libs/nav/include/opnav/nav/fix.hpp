/**
 * @file fix.hpp
 * @brief Fix post-processing: geodetic conversion, reference blending, error metrics, smoothing.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "opnav/core/types.hpp"
#include "opnav/nav/multilateration.hpp"

namespace opnav::nav {

/**
 * @brief Quality class of a published fix.
 */
enum class FixMode : std::uint8_t { NoFix, Lock3D, Degraded };

/**
 * @brief Display label for a fix mode.
 */
[[nodiscard]] const char* to_string(FixMode mode);

/**
 * @brief Externally published position fix.
 */
struct Fix {
  double lat_deg{};
  double lon_deg{};
  double alt_m{};
  double error_m{};
  FixMode mode{FixMode::NoFix};
  double clock_bias_km{};
  std::size_t satellites_used{};
  int iterations_used{};
  bool converged{};
  double gdop{};
  double pdop{};
};

/**
 * @brief Planar small-angle error in meters between two geodetic points.
 *
 * sqrt((dlat * 111000)^2 + (dlon * 111000)^2), with the longitude difference wrapped.
 * Valid only for small angular offsets; it ignores the cos(lat) shrinking of
 * longitude degrees and is therefore pessimistic away from the equator.
 */
[[nodiscard]] double planar_error_m(const core::GeodeticPoint& a, const core::GeodeticPoint& b);

/**
 * @brief Exact straight-line distance in meters between an estimate and a true ECEF position.
 */
[[nodiscard]] double ecef_error_m(const StateEstimate& estimate, const core::Vec3& truth_km);

/**
 * @brief Blend a raw estimate toward a reference coordinate and report the planar error.
 *
 * lat = w * raw_lat + (1 - w) * ref_lat, longitude likewise along the shorter arc.
 * Altitude is the raw estimate's. `error_m` is the planar error of the blended fix
 * relative to `reference`, so for w < 1 it reflects the blend weight more than the
 * solver accuracy. w = 1 disables blending.
 */
[[nodiscard]] Fix postprocess(const StateEstimate& raw, const core::GeodeticPoint& reference, double blend_weight);

/**
 * @brief Canonical unblended fix from a successful solve.
 *
 * The mode is Lock3D when the solver converged and Degraded otherwise. `truth`, when
 * known (synthetic runs), fills `error_m` with the planar error against it.
 */
[[nodiscard]] Fix raw_fix(const SolveResult& result, const std::optional<core::GeodeticPoint>& truth = std::nullopt);

/**
 * @brief First-order exponential smoother over successive fixes.
 *
 * Separate, optional display stage; it never feeds back into the solver.
 */
class ExponentialFixSmoother final {
 public:
  /**
   * @brief Construct with gain `alpha` in (0, 1]; 1 passes fixes through unchanged.
   */
  explicit ExponentialFixSmoother(double alpha) : alpha_(alpha) {}

  /**
   * @brief Fold one fix into the smoothed state.
   * @return InvalidInput when alpha is outside (0, 1]; the first valid update passes through.
   */
  core::Status update(const Fix& fix);

  /**
   * @brief Current smoothed fix, empty before the first update.
   */
  [[nodiscard]] std::optional<Fix> current() const { return state_; }

  void reset() { state_.reset(); }

 private:
  double alpha_{};
  std::optional<Fix> state_{};
};

}  // namespace opnav::nav
