/**
 * @file test_visibility.cpp
 * @brief Elevation-mask visibility tests.
 * @author Watosn
 */

#include <spdlog/spdlog.h>

#include "opnav/nav/visibility.hpp"

int main() {
  using namespace opnav::nav;

  static_assert(!is_visible(kDefaultElevationMaskDeg, kDefaultElevationMaskDeg));
  static_assert(is_visible(kDefaultElevationMaskDeg + 0.01, kDefaultElevationMaskDeg));

  const double masks[] = {-5.0, 0.0, 10.0, 45.0};
  for (const double mask : masks) {
    if (is_visible(mask, mask)) {
      spdlog::error("satellite at the mask must be rejected: mask={}", mask);
      return 1;
    }
    if (!is_visible(mask + 0.01, mask)) {
      spdlog::error("satellite just above the mask must pass: mask={}", mask);
      return 2;
    }
    if (is_visible(mask - 0.01, mask)) {
      spdlog::error("satellite below the mask must be rejected: mask={}", mask);
      return 3;
    }
  }

  // Negative masks let below-horizon satellites through.
  if (!is_visible(-2.0, -5.0)) {
    spdlog::error("negative mask must pass low satellites");
    return 4;
  }
  return 0;
}
