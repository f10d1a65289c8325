/**
 * @file csv_fix_sink.hpp
 * @brief Snapshot sink appending one CSV row per cycle.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <utility>

#include "opnav/engine/solution_board.hpp"

namespace opnav::engine {

/**
 * @brief Fix log writer.
 *
 * Row: sequence,epoch_utc_s,status,solve_status,fix_updated,lat_deg,lon_deg,alt_m,error_m,mode,
 * clock_bias_km,satellites_used,iterations_used,converged,gdop,pdop
 */
class CsvFixSink final : public ISolutionSink {
 public:
  /**
   * @brief Output configuration.
   */
  struct Config {
    std::filesystem::path csv_file{};
    bool append{false};
  };

  /**
   * @brief Open the output file and write the header when starting a new file.
   * @return Null when the file cannot be opened.
   */
  static std::unique_ptr<CsvFixSink> Create(const Config& config);

  void publish(const std::shared_ptr<const NavSnapshot>& snapshot) override;

 private:
  explicit CsvFixSink(std::ofstream out) : out_(std::move(out)) {}

  std::mutex mutex_{};
  std::ofstream out_;
};

}  // namespace opnav::engine
