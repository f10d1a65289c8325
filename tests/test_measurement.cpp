/**
 * @file test_measurement.cpp
 * @brief Pseudorange synthesis tests.
 * @author Watosn
 */

#include <cmath>

#include <spdlog/spdlog.h>

#include "opnav/core/constants.hpp"
#include "opnav/nav/measurement.hpp"

int main() {
  using namespace opnav;

  const core::Vec3 truth{1000.0, 6000.0, 1500.0};
  const core::Vec3 sat{4000.0, 9000.0, 4500.0};
  const double geometric = core::distance(sat, truth);

  nav::MeasurementSynthesizer exact(7U);
  const auto r0 = exact.synthesize(sat, truth, 120.0, 0.0);
  const auto& m0 = r0.measurement;
  if (!r0.ok()) {
    spdlog::error("noiseless synthesis must succeed");
    return 12;
  }
  if (m0.pseudorange_km != geometric + 120.0) {
    spdlog::error("noiseless pseudorange mismatch: {} vs {}", m0.pseudorange_km, geometric + 120.0);
    return 1;
  }
  if (m0.satellite_position_km.x != sat.x || m0.satellite_position_km.y != sat.y ||
      m0.satellite_position_km.z != sat.z) {
    spdlog::error("satellite position not carried through");
    return 2;
  }

  nav::MeasurementSynthesizer noisy(42U);
  bool saw_positive = false;
  bool saw_negative = false;
  for (int i = 0; i < 2000; ++i) {
    const auto m = noisy.synthesize(sat, truth, 0.5, 0.02).measurement;
    const double noise = m.pseudorange_km - geometric - 0.5;
    if (std::abs(noise) > 0.02 + 1e-12) {
      spdlog::error("noise out of bounds: {}", noise);
      return 3;
    }
    if (m.pseudorange_km < geometric) {
      spdlog::error("pseudorange below geometric range with bias above noise bound");
      return 4;
    }
    saw_positive = saw_positive || noise > 0.01;
    saw_negative = saw_negative || noise < -0.01;
  }
  if (!saw_positive || !saw_negative) {
    spdlog::error("noise does not span the configured interval");
    return 5;
  }

  // Same seed, same sequence.
  nav::MeasurementSynthesizer a(99U);
  nav::MeasurementSynthesizer b(99U);
  for (int i = 0; i < 10; ++i) {
    if (a.synthesize(sat, truth, 120.0, 0.02).measurement.pseudorange_km !=
        b.synthesize(sat, truth, 120.0, 0.02).measurement.pseudorange_km) {
      spdlog::error("seeded synthesizers diverged at draw {}", i);
      return 6;
    }
  }

  // Noise larger than the clock bias could put a pseudorange below the geometric range.
  if (nav::check_noise_model(0.0, 0.02) != core::Status::InvalidInput ||
      nav::check_noise_model(120.0, -0.02) != core::Status::InvalidInput ||
      nav::check_noise_model(120.0, 0.02) != core::Status::Ok || nav::check_noise_model(0.0, 0.0) != core::Status::Ok) {
    spdlog::error("noise model check mismatch");
    return 8;
  }
  nav::MeasurementSynthesizer guarded(5U);
  const auto rejected = guarded.synthesize(sat, truth, 0.0, 0.02);
  const auto negative = guarded.synthesize(sat, truth, 120.0, -0.02);
  if (rejected.status != core::Status::InvalidInput || negative.status != core::Status::InvalidInput) {
    spdlog::error("noise bound above bias or below zero must be rejected");
    return 9;
  }
  for (int i = 0; i < 20000; ++i) {
    const auto r = guarded.synthesize(sat, truth, 0.03, 0.02);
    if (!r.ok() || r.measurement.pseudorange_km < geometric) {
      spdlog::error("pseudorange below geometric range at draw {}", i);
      return 10;
    }
  }

  const double tof = nav::time_of_flight_ms(core::constants::kSpeedOfLightKmS);
  if (std::abs(tof - 1000.0) > 1e-9) {
    spdlog::error("time of flight mismatch: {}", tof);
    return 11;
  }
  return 0;
}
