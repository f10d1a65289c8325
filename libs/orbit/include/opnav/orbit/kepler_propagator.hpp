/**
 * @file kepler_propagator.hpp
 * @brief Two-body Keplerian orbit propagator producing Earth-fixed states.
 * @author Watosn
 */
#pragma once

#include "opnav/core/interfaces.hpp"

namespace opnav::orbit {

/**
 * @brief Unperturbed two-body propagator with a GMST-only ECI->ECEF rotation.
 *
 * Adequate for synthesizing plausible sky geometry; it ignores J2 and drag, so
 * element sets older than a few hours drift from the real satellite.
 */
class KeplerPropagator final : public core::IOrbitPropagator {
 public:
  /**
   * @brief Kepler-equation solver settings.
   */
  struct Config {
    int max_kepler_iterations{30};
    double kepler_tolerance_rad{1e-12};
  };

  KeplerPropagator() = default;
  explicit KeplerPropagator(const Config& config) : config_(config) {}

  /**
   * @brief Propagate elements to `epoch`.
   * @return InvalidInput for a <= 0 or e outside [0, 1), PropagationFailure when
   *         Kepler's equation does not converge.
   */
  [[nodiscard]] core::PropagationResult propagate(const core::SatelliteRecord& satellite,
                                                  const core::Epoch& epoch) const override;

 private:
  Config config_{};
};

}  // namespace opnav::orbit
