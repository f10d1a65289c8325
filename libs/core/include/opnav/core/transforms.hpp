/**
 * @file transforms.hpp
 * @brief Shared time and inertial/Earth-fixed transform helpers.
 * @author Watosn
 */
#pragma once

#include <cmath>

#include "opnav/core/constants.hpp"
#include "opnav/core/math_utils.hpp"
#include "opnav/core/types.hpp"

namespace opnav::core {

/**
 * @brief Cached approximate GMST transform context.
 */
struct ApproxEciEcefContext {
  double gmst_rad{};
};

/**
 * @brief Convert UTC seconds since Unix epoch to JD UTC.
 */
inline double utc_seconds_to_julian_date_utc(double utc_seconds) {
  return utc_seconds / constants::kSecondsPerDay + constants::kUnixEpochJd;
}

inline double gmst_rad_from_jd_utc(double jd_utc) {
  const double t = (jd_utc - constants::kJ2000Jd) / 36525.0;
  double gmst_deg = 280.46061837 + 360.98564736629 * (jd_utc - constants::kJ2000Jd) + 0.000387933 * t * t
                    - (t * t * t) / 38710000.0;
  gmst_deg = std::fmod(gmst_deg, 360.0);
  if (gmst_deg < 0.0) {
    gmst_deg += 360.0;
  }
  return gmst_deg * constants::kDegToRad;
}

inline Vec3 rotate_z(double angle_rad, const Vec3& v) {
  return mat_vec(rot_z(angle_rad), v);
}

/**
 * @brief Build context for approximate ECI/ECEF transforms.
 */
inline ApproxEciEcefContext build_approx_eci_ecef_context(double utc_seconds) {
  return ApproxEciEcefContext{
      .gmst_rad = gmst_rad_from_jd_utc(utc_seconds_to_julian_date_utc(utc_seconds)),
  };
}

/**
 * @brief Approximate ECI->ECEF position transform using GMST-only rotation.
 */
inline Vec3 approx_eci_to_ecef_position(const Vec3& r_eci, const ApproxEciEcefContext& ctx) {
  return rotate_z(ctx.gmst_rad, r_eci);
}

/**
 * @brief Approximate ECI->ECEF velocity transform using GMST-only rotation + Earth rate.
 */
inline Vec3 approx_eci_to_ecef_velocity(const Vec3& r_eci, const Vec3& v_eci, const ApproxEciEcefContext& ctx) {
  const Vec3 omega{0.0, 0.0, constants::kEarthRotationRateRadS};
  return rotate_z(ctx.gmst_rad, v_eci - vec_cross(omega, r_eci));
}

/**
 * @brief Approximate ECEF->ECI position transform using GMST-only rotation.
 */
inline Vec3 approx_ecef_to_eci_position(const Vec3& r_ecef, const ApproxEciEcefContext& ctx) {
  return rotate_z(-ctx.gmst_rad, r_ecef);
}

}  // namespace opnav::core
