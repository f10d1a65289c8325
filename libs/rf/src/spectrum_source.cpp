/**
 * @file spectrum_source.cpp
 * @brief Spectrum source implementations.
 * @author Watosn
 */

#include "opnav/rf/spectrum_source.hpp"

#include <chrono>
#include <cmath>
#include <exception>
#include <fstream>
#include <sstream>

namespace opnav::rf {
namespace {

constexpr std::size_t kRtlPowerFirstPowerColumn = 6;

bool parse_double(const std::string& text, double& value) {
  try {
    value = std::stod(text);
  } catch (const std::exception&) {
    return false;
  }
  return std::isfinite(value);
}

}  // namespace

SyntheticSpectrumSource::SyntheticSpectrumSource(const Config& config) : config_(config) {
  std::uint64_t seed = config_.seed;
  if (seed == 0) {
    seed = static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
  }
  rng_.seed(seed);
}

core::SpectrumSample SyntheticSpectrumSource::sample(std::size_t bins) {
  if (config_.min_level < 0 || config_.max_level < config_.min_level) {
    return core::SpectrumSample{.status = core::Status::InvalidInput};
  }
  std::uniform_int_distribution<int> dist(config_.min_level, config_.max_level);
  core::SpectrumSample out{};
  out.magnitudes.reserve(bins);
  for (std::size_t i = 0; i < bins; ++i) {
    out.magnitudes.push_back(static_cast<double>(dist(rng_)));
  }
  return out;
}

bool parse_rtl_power_row(const std::string& line, std::vector<double>& linear_power) {
  linear_power.clear();
  std::stringstream ss(line);
  std::string token;
  std::size_t col = 0;
  while (std::getline(ss, token, ',')) {
    if (col++ < kRtlPowerFirstPowerColumn) {
      continue;
    }
    double db = 0.0;
    if (!parse_double(token, db)) {
      continue;
    }
    linear_power.push_back(std::pow(10.0, db / 10.0));
  }
  return !linear_power.empty();
}

std::vector<double> resample_bins(const std::vector<double>& values, std::size_t bins) {
  std::vector<double> out(bins, 0.0);
  if (values.empty() || bins == 0) {
    return out;
  }
  const std::size_t n = values.size();
  for (std::size_t b = 0; b < bins; ++b) {
    std::size_t lo = b * n / bins;
    std::size_t hi = (b + 1) * n / bins;
    if (hi <= lo) {
      hi = lo + 1;
    }
    if (lo >= n) {
      lo = n - 1;
      hi = n;
    }
    double sum = 0.0;
    for (std::size_t i = lo; i < hi; ++i) {
      sum += values[i];
    }
    out[b] = sum / static_cast<double>(hi - lo);
  }
  return out;
}

core::SpectrumSample RtlPowerSpectrumSource::sample(std::size_t bins) {
  std::ifstream in(config_.csv_file);
  if (!in) {
    return core::SpectrumSample{.status = core::Status::DataUnavailable};
  }

  std::vector<double> newest;
  std::vector<double> row;
  std::string line;
  while (std::getline(in, line)) {
    if (parse_rtl_power_row(line, row)) {
      newest.swap(row);
    }
  }
  if (newest.empty()) {
    return core::SpectrumSample{.status = core::Status::DataUnavailable};
  }
  return core::SpectrumSample{.magnitudes = resample_bins(newest, bins), .status = core::Status::Ok};
}

std::unique_ptr<core::ISpectrumSource> make_spectrum_source(SpectrumMode mode,
                                                            const std::filesystem::path& live_file,
                                                            std::uint64_t seed) {
  if (mode == SpectrumMode::Live) {
    return std::make_unique<RtlPowerSpectrumSource>(RtlPowerSpectrumSource::Config{.csv_file = live_file});
  }
  return std::make_unique<SyntheticSpectrumSource>(SyntheticSpectrumSource::Config{.seed = seed});
}

}  // namespace opnav::rf
