/**
 * @file solve_batch_cli.cpp
 * @brief Single-epoch multilateration from a pseudorange CSV.
 * @author Watosn
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "opnav/core/geodetic.hpp"
#include "opnav/nav/fix.hpp"
#include "opnav/nav/multilateration.hpp"

namespace {

bool parse_measurement_row(const std::string& line, opnav::nav::Measurement& out) {
  std::stringstream ss(line);
  std::string tok;
  std::vector<double> values;
  while (std::getline(ss, tok, ',')) {
    if (tok.empty()) {
      return false;
    }
    char* end = nullptr;
    const double v = std::strtod(tok.c_str(), &end);
    if (end == tok.c_str() || *end != '\0') {
      return false;
    }
    values.push_back(v);
  }
  if (values.size() != 4U) {
    return false;
  }
  out.satellite_position_km = opnav::core::Vec3{values[0], values[1], values[2]};
  out.pseudorange_km = values[3];
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2 || (argc > 5 && argc != 9)) {
    spdlog::error(
        "usage: solve_batch_cli <measurements_csv> [max_iterations] [threshold_km] [seed:origin|coarse] "
        "[ref_lat_deg ref_lon_deg ref_alt_m blend_weight]");
    spdlog::error("input row: x_km,y_km,z_km,pseudorange_km");
    return 1;
  }

  const std::filesystem::path input_path = argv[1];
  opnav::nav::SolverConfig solver{};
  if (argc >= 3) {
    solver.max_iterations = std::atoi(argv[2]);
  }
  if (argc >= 4) {
    solver.convergence_threshold_km = std::atof(argv[3]);
  }
  const std::string seed = (argc >= 5) ? argv[4] : "coarse";
  if (seed != "origin" && seed != "coarse") {
    spdlog::error("seed must be origin or coarse");
    return 4;
  }

  std::ifstream in(input_path);
  if (!in) {
    spdlog::error("failed to open measurement csv: {}", input_path.string());
    return 2;
  }

  std::vector<opnav::nav::Measurement> measurements;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty() || line[0] == '#') {
      continue;
    }
    opnav::nav::Measurement m{};
    if (!parse_measurement_row(line, m)) {
      if (line_no == 1 && line.find("pseudorange") != std::string::npos) {
        continue;
      }
      spdlog::warn("skipping malformed row {}", line_no);
      continue;
    }
    measurements.push_back(m);
  }

  if (seed == "coarse") {
    solver.initial_state = opnav::nav::coarse_initial_state(measurements);
  }
  const auto result = opnav::nav::solve(measurements, solver);
  if (!result.ok()) {
    spdlog::error("solve failed: {} ({} measurements)", opnav::core::to_string(result.status), measurements.size());
    return 3;
  }

  auto fix = opnav::nav::raw_fix(result);
  if (argc == 9) {
    const opnav::core::GeodeticPoint reference{
        .lat_deg = std::atof(argv[5]), .lon_deg = std::atof(argv[6]), .alt_m = std::atof(argv[7])};
    const double w = std::atof(argv[8]);
    if (!(w >= 0.0 && w <= 1.0)) {
      spdlog::error("blend weight must be in [0, 1]");
      return 5;
    }
    const auto blended = opnav::nav::postprocess(result.state, reference, w);
    fix.lat_deg = blended.lat_deg;
    fix.lon_deg = blended.lon_deg;
    fix.alt_m = blended.alt_m;
    fix.error_m = blended.error_m;
  }

  fmt::print("x_km={:.6f} y_km={:.6f} z_km={:.6f} clock_bias_km={:.6f}\n", result.state.position_km.x,
             result.state.position_km.y, result.state.position_km.z, result.state.clock_bias_km);
  fmt::print("lat_deg={:.9f} lon_deg={:.9f} alt_m={:.3f} error_m={:.3f} mode={}\n", fix.lat_deg, fix.lon_deg, fix.alt_m,
             fix.error_m, opnav::nav::to_string(fix.mode));
  fmt::print("converged={} iterations={} last_step_km={:.3e} residual_rms_km={:.3e} gdop={:.3f} pdop={:.3f} cond={:.3e}\n",
             result.converged ? 1 : 0, result.iterations_used, result.last_step_km, result.residual_rms_km, result.gdop,
             result.pdop, result.condition_number);
  return 0;
}
