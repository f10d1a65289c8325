/**
 * @file spectrum_source.hpp
 * @brief RF spectrum data sources (live file-backed and synthetic filler).
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "opnav/core/interfaces.hpp"

namespace opnav::rf {

/**
 * @brief Spectrum source variant, selected at configuration time.
 */
enum class SpectrumMode : std::uint8_t { Synthetic, Live };

/**
 * @brief Randomized spectrum filler for runs without RF hardware.
 *
 * Each bin is an independent uniform integer magnitude in [min_level, max_level].
 */
class SyntheticSpectrumSource final : public core::ISpectrumSource {
 public:
  /**
   * @brief Filler settings.
   */
  struct Config {
    int min_level{10};
    int max_level{50};
    std::uint64_t seed{0};
  };

  explicit SyntheticSpectrumSource(const Config& config);

  /**
   * @brief Draw `bins` magnitudes. InvalidInput when the level range is empty or negative.
   */
  [[nodiscard]] core::SpectrumSample sample(std::size_t bins) override;

 private:
  Config config_{};
  std::mt19937_64 rng_;
};

/**
 * @brief Live spectrum read from an rtl_power sweep CSV.
 *
 * Uses the last row of the file: `date, time, hz_low, hz_high, hz_step, samples, dB...`.
 * dB values are converted to linear power and bin-averaged to the requested count.
 */
class RtlPowerSpectrumSource final : public core::ISpectrumSource {
 public:
  /**
   * @brief File location.
   */
  struct Config {
    std::filesystem::path csv_file{};
  };

  explicit RtlPowerSpectrumSource(const Config& config) : config_(config) {}

  /**
   * @brief Read the newest sweep. DataUnavailable when the file is missing or has no valid row.
   */
  [[nodiscard]] core::SpectrumSample sample(std::size_t bins) override;

 private:
  Config config_{};
};

/**
 * @brief Parse the dB columns of one rtl_power row into linear power values.
 * @return False when the row has no parsable power columns.
 */
bool parse_rtl_power_row(const std::string& line, std::vector<double>& linear_power);

/**
 * @brief Average `values` into exactly `bins` buckets (nearest-sample fill when upsampling).
 */
[[nodiscard]] std::vector<double> resample_bins(const std::vector<double>& values, std::size_t bins);

/**
 * @brief Spectrum source factory.
 */
[[nodiscard]] std::unique_ptr<core::ISpectrumSource> make_spectrum_source(SpectrumMode mode,
                                                                          const std::filesystem::path& live_file,
                                                                          std::uint64_t seed);

}  // namespace opnav::rf
