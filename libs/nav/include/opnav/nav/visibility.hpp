/**
 * @file visibility.hpp
 * @brief Elevation-mask visibility filter.
 * @author Watosn
 */
#pragma once

namespace opnav::nav {

/**
 * @brief Default minimum elevation for a satellite to enter the solve set.
 *
 * Negative masks are accepted and effectively pass every satellite above the
 * geometric horizon minus the mask (demonstration use only).
 */
inline constexpr double kDefaultElevationMaskDeg = 10.0;

/**
 * @brief Decide whether a satellite is usable at the given elevation.
 * @return True only when `elevation_deg` is strictly above `mask_deg`.
 */
[[nodiscard]] constexpr bool is_visible(double elevation_deg, double mask_deg) { return elevation_deg > mask_deg; }

}  // namespace opnav::nav
