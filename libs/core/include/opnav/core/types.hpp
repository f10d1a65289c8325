/**
 * @file types.hpp
 * @brief Core domain types for opnav.
 * @author Watosn
 */
#pragma once

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace opnav::core {

/**
 * @brief Standard status code used by model and solver outputs.
 */
enum class Status : std::uint8_t {
  Ok,
  InvalidInput,
  DataUnavailable,
  NumericalError,
  InsufficientMeasurements,
  SingularGeometry,
  PropagationFailure
};

/**
 * @brief Short lowercase name for a status code, for logs and CSV output.
 */
inline const char* to_string(const Status status) {
  switch (status) {
    case Status::Ok:
      return "ok";
    case Status::InvalidInput:
      return "invalid_input";
    case Status::DataUnavailable:
      return "data_unavailable";
    case Status::NumericalError:
      return "numerical_error";
    case Status::InsufficientMeasurements:
      return "insufficient_measurements";
    case Status::SingularGeometry:
      return "singular_geometry";
    case Status::PropagationFailure:
      return "propagation_failure";
  }
  return "unknown";
}

/**
 * @brief Cartesian 3-vector. ECEF positions in this project are kilometers.
 */
struct Vec3 {
  double x{};
  double y{};
  double z{};
};

inline Vec3 operator+(const Vec3& a, const Vec3& b) { return Vec3{a.x + b.x, a.y + b.y, a.z + b.z}; }
inline Vec3 operator-(const Vec3& a, const Vec3& b) { return Vec3{a.x - b.x, a.y - b.y, a.z - b.z}; }
inline Vec3 operator*(double s, const Vec3& v) { return Vec3{s * v.x, s * v.y, s * v.z}; }
inline Vec3 operator*(const Vec3& v, double s) { return s * v; }
inline Vec3 operator/(const Vec3& v, double s) { return Vec3{v.x / s, v.y / s, v.z / s}; }

inline double dot(const Vec3& a, const Vec3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }
inline double norm(const Vec3& v) { return std::sqrt(dot(v, v)); }
inline double distance(const Vec3& a, const Vec3& b) { return norm(a - b); }
inline bool is_finite(const Vec3& v) { return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z); }

/**
 * @brief UTC epoch expressed as seconds since Unix epoch.
 */
struct Epoch {
  double utc_seconds{};
};

/**
 * @brief Geodetic coordinate on the WGS-84 ellipsoid.
 *
 * Latitude is in [-90, 90] and longitude in [-180, 180] degrees.
 */
struct GeodeticPoint {
  double lat_deg{};
  double lon_deg{};
  double alt_m{};
};

/**
 * @brief Topocentric direction from an observer to a target.
 */
struct LookAngles {
  double azimuth_deg{};
  double elevation_deg{};
  double range_km{};
};

/**
 * @brief Mean Keplerian elements at a reference epoch.
 */
struct KeplerianElements {
  Epoch epoch{};
  double semi_major_axis_km{};
  double eccentricity{};
  double inclination_deg{};
  double raan_deg{};
  double arg_perigee_deg{};
  double mean_anomaly_deg{};
};

/**
 * @brief One trackable satellite in a catalog.
 */
struct SatelliteRecord {
  std::string name{};
  std::string group{};
  KeplerianElements elements{};
};

/**
 * @brief Earth-fixed satellite state produced by an orbit propagator.
 */
struct PropagationResult {
  Vec3 position_ecef_km{};
  Vec3 velocity_ecef_kms{};
  Status status{Status::Ok};
};

/**
 * @brief Spectrum magnitudes from an RF data source.
 *
 * Magnitudes are non-negative; their scale is opaque to the positioning core.
 */
struct SpectrumSample {
  std::vector<double> magnitudes{};
  Status status{Status::Ok};
};

}  // namespace opnav::core
