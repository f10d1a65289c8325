/**
 * @file interfaces.hpp
 * @brief Interfaces to the positioning core's external collaborators.
 * @author Watosn
 */
#pragma once

#include <cstddef>

#include "opnav/core/types.hpp"

namespace opnav::core {

/**
 * @brief Interface for satellite orbit propagators.
 */
class IOrbitPropagator {
 public:
  virtual ~IOrbitPropagator() = default;
  /**
   * @brief Propagate one catalog satellite to an epoch.
   * @param satellite Catalog record with its elements.
   * @param epoch UTC epoch.
   * @return Earth-fixed position/velocity with `status` set.
   */
  [[nodiscard]] virtual PropagationResult propagate(const SatelliteRecord& satellite, const Epoch& epoch) const = 0;
};

/**
 * @brief Interface for RF spectrum data sources.
 */
class ISpectrumSource {
 public:
  virtual ~ISpectrumSource() = default;
  /**
   * @brief Produce one spectrum sample.
   * @param bins Requested number of magnitude bins.
   * @return Sample with exactly `bins` non-negative magnitudes when `status` is Ok.
   */
  [[nodiscard]] virtual SpectrumSample sample(std::size_t bins) = 0;
};

}  // namespace opnav::core
