/**
 * @file constants.hpp
 * @brief Shared physical and geodetic constants.
 * @author Watosn
 */
#pragma once

#include <numbers>

namespace opnav::core::constants {

inline constexpr double kPi = std::numbers::pi;
inline constexpr double kTwoPi = 2.0 * std::numbers::pi;
inline constexpr double kDegToRad = kPi / 180.0;
inline constexpr double kRadToDeg = 180.0 / kPi;

// WGS-84 ellipsoid, kilometers.
inline constexpr double kWgs84SemiMajorAxisKm = 6378.137;
inline constexpr double kWgs84EccentricitySquared = 0.00669437999;

inline constexpr double kEarthMuKm3S2 = 398600.4418;
inline constexpr double kEarthRotationRateRadS = 7.2921151467e-5;
inline constexpr double kSpeedOfLightKmS = 299792.458;

inline constexpr double kSecondsPerDay = 86400.0;
inline constexpr double kJ2000Jd = 2451545.0;
inline constexpr double kUnixEpochJd = 2440587.5;

// Small-angle conversion used by the planar fix error metric.
inline constexpr double kMetersPerDegreeApprox = 111000.0;

}  // namespace opnav::core::constants
