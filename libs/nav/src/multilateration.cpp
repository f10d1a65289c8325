/**
 * @file multilateration.cpp
 * @brief Gauss-Newton pseudorange multilateration implementation.
 * @author Watosn
 */

#include "opnav/nav/multilateration.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <Eigen/Dense>

#include "opnav/core/constants.hpp"

namespace opnav::nav {
namespace {

using Vector4 = Eigen::Vector4d;

Vector4 to_vector(const StateEstimate& s) {
  return Vector4(s.position_km.x, s.position_km.y, s.position_km.z, s.clock_bias_km);
}

StateEstimate to_state(const Vector4& x) {
  return StateEstimate{.position_km = core::Vec3{x(0), x(1), x(2)}, .clock_bias_km = x(3)};
}

void build_linear_system(const std::vector<Measurement>& measurements,
                         const Vector4& x,
                         Eigen::MatrixXd& h,
                         Eigen::VectorXd& r) {
  const core::Vec3 pos{x(0), x(1), x(2)};
  for (std::size_t i = 0; i < measurements.size(); ++i) {
    const auto& m = measurements[i];
    const core::Vec3 delta = pos - m.satellite_position_km;
    const double d = core::norm(delta);
    const core::Vec3 los = delta / std::max(d, kLineOfSightEpsilonKm);
    const auto row = static_cast<Eigen::Index>(i);
    h(row, 0) = los.x;
    h(row, 1) = los.y;
    h(row, 2) = los.z;
    h(row, 3) = 1.0;
    r(row) = m.pseudorange_km - (d + x(3));
  }
}

// DOP from (H^T H)^-1 = V diag(1/s^2) V^T.
void fill_dilution_of_precision(const Eigen::JacobiSVD<Eigen::MatrixXd>& svd, SolveResult& out) {
  const auto& s = svd.singularValues();
  const Eigen::MatrixXd& v = svd.matrixV();
  if (!(s(3) > 0.0)) {
    out.gdop = std::numeric_limits<double>::infinity();
    out.pdop = std::numeric_limits<double>::infinity();
    return;
  }
  const Eigen::Vector4d inv_s2 = s.head<4>().cwiseProduct(s.head<4>()).cwiseInverse();
  const Eigen::Matrix4d q = v * inv_s2.asDiagonal() * v.transpose();
  out.gdop = std::sqrt(q.trace());
  out.pdop = std::sqrt(q(0, 0) + q(1, 1) + q(2, 2));
}

}  // namespace

SolveResult solve(const std::vector<Measurement>& measurements, const SolverConfig& config) {
  SolveResult out{};
  out.measurements_used = measurements.size();
  if (config.max_iterations < 1 || !(config.convergence_threshold_km >= 0.0) || !(config.rank_tolerance > 0.0) ||
      !(config.max_condition_number >= 0.0)) {
    out.status = core::Status::InvalidInput;
    return out;
  }
  if (measurements.size() < kMinMeasurements) {
    out.status = core::Status::InsufficientMeasurements;
    return out;
  }

  Vector4 x = config.initial_state ? to_vector(*config.initial_state) : Vector4::Zero();
  const auto n = static_cast<Eigen::Index>(measurements.size());
  Eigen::MatrixXd h(n, 4);
  Eigen::VectorXd r(n);

  for (int iter = 0; iter < config.max_iterations; ++iter) {
    build_linear_system(measurements, x, h, r);
    if (!h.allFinite() || !r.allFinite()) {
      out.state = to_state(x);
      out.status = core::Status::NumericalError;
      return out;
    }

    Eigen::JacobiSVD<Eigen::MatrixXd> svd(h, Eigen::ComputeThinU | Eigen::ComputeThinV);
    const auto& s = svd.singularValues();
    const double s_max = s(0);
    const double s_min = s(3);
    out.condition_number = (s_min > 0.0) ? (s_max / s_min) : std::numeric_limits<double>::infinity();
    if (!(s_min > config.rank_tolerance * s_max)) {
      out.state = to_state(x);
      out.iterations_used = iter;
      out.status = core::Status::SingularGeometry;
      return out;
    }
    if (config.max_condition_number > 0.0 && out.condition_number > config.max_condition_number) {
      out.state = to_state(x);
      out.iterations_used = iter;
      out.status = core::Status::SingularGeometry;
      return out;
    }

    svd.setThreshold(config.rank_tolerance);
    const Vector4 dx = svd.solve(r);
    x += dx;
    out.iterations_used = iter + 1;
    out.last_step_km = dx.head<3>().norm();
    if (!x.allFinite()) {
      out.state = to_state(x);
      out.status = core::Status::NumericalError;
      return out;
    }
    if (out.last_step_km < config.convergence_threshold_km) {
      out.converged = true;
      break;
    }
  }

  out.state = to_state(x);
  build_linear_system(measurements, x, h, r);
  out.residual_rms_km = r.norm() / std::sqrt(static_cast<double>(n));
  const Eigen::JacobiSVD<Eigen::MatrixXd> final_svd(h, Eigen::ComputeThinU | Eigen::ComputeThinV);
  fill_dilution_of_precision(final_svd, out);
  out.status = core::Status::Ok;
  return out;
}

SolveResult solve(const std::vector<Measurement>& measurements, int max_iterations, double convergence_threshold_km) {
  return solve(measurements,
               SolverConfig{.max_iterations = max_iterations, .convergence_threshold_km = convergence_threshold_km});
}

StateEstimate coarse_initial_state(const std::vector<Measurement>& measurements) {
  core::Vec3 centroid{};
  for (const auto& m : measurements) {
    centroid = centroid + m.satellite_position_km;
  }
  const double r = core::norm(centroid);
  if (measurements.empty() || !(r > 0.0) || !std::isfinite(r)) {
    return StateEstimate{};
  }
  return StateEstimate{.position_km = centroid * (core::constants::kWgs84SemiMajorAxisKm / r), .clock_bias_km = 0.0};
}

}  // namespace opnav::nav
