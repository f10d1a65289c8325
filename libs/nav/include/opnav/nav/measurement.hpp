/**
 * @file measurement.hpp
 * @brief Synthetic pseudorange measurements.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <random>

#include "opnav/core/types.hpp"

namespace opnav::nav {

/**
 * @brief One pseudorange to a satellite at a known ECEF position (km).
 */
struct Measurement {
  core::Vec3 satellite_position_km{};
  double pseudorange_km{};
};

/**
 * @brief Synthesized measurement plus status.
 */
struct SynthesisResult {
  Measurement measurement{};
  core::Status status{core::Status::Ok};

  [[nodiscard]] bool ok() const { return status == core::Status::Ok; }
};

/**
 * @brief Check the noise model keeps every pseudorange at or above the geometric range.
 * @return InvalidInput unless 0 <= noise_bound_km <= clock_bias_km and both are finite.
 */
[[nodiscard]] core::Status check_noise_model(double clock_bias_km, double noise_bound_km);

/**
 * @brief One-way signal time of flight in milliseconds for a pseudorange.
 */
[[nodiscard]] double time_of_flight_ms(double pseudorange_km);

/**
 * @brief Generates pseudoranges from true geometry plus a common clock bias and bounded noise.
 *
 * Noise is uniform in [-noise_bound_km, +noise_bound_km] and drawn independently for
 * every call. The synthesizer is not thread-safe; use one instance per worker.
 */
class MeasurementSynthesizer final {
 public:
  /**
   * @brief Construct with a fixed seed; seed 0 seeds from the steady clock.
   */
  explicit MeasurementSynthesizer(std::uint64_t seed = 0);

  /**
   * @brief Synthesize one measurement.
   * @param sat_pos_km Satellite ECEF position.
   * @param truth_pos_km True receiver ECEF position.
   * @param clock_bias_km Receiver clock bias shared by all measurements of a cycle.
   * @param noise_bound_km Half-width of the uniform noise; 0 disables noise.
   * @pre `check_noise_model(clock_bias_km, noise_bound_km)` is Ok; otherwise InvalidInput and no draw.
   */
  [[nodiscard]] SynthesisResult synthesize(const core::Vec3& sat_pos_km,
                                       const core::Vec3& truth_pos_km,
                                       double clock_bias_km,
                                       double noise_bound_km);

 private:
  std::mt19937_64 rng_;
};

}  // namespace opnav::nav
