/**
 * @file csv_fix_sink.cpp
 * @brief CSV fix log implementation.
 * @author Watosn
 */

#include "opnav/engine/csv_fix_sink.hpp"

#include <string>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace opnav::engine {

std::unique_ptr<CsvFixSink> CsvFixSink::Create(const Config& config) {
  std::error_code ec;
  const bool has_content = std::filesystem::exists(config.csv_file, ec) && !std::filesystem::is_empty(config.csv_file, ec);
  const bool write_header = !config.append || !has_content;
  std::ofstream out(config.csv_file, config.append ? std::ios::app : std::ios::trunc);
  if (!out) {
    return nullptr;
  }
  if (write_header) {
    out << "sequence,epoch_utc_s,status,solve_status,fix_updated,lat_deg,lon_deg,alt_m,error_m,mode,"
           "clock_bias_km,satellites_used,iterations_used,converged,gdop,pdop\n";
  }
  return std::unique_ptr<CsvFixSink>(new CsvFixSink(std::move(out)));
}

void CsvFixSink::publish(const std::shared_ptr<const NavSnapshot>& snapshot) {
  if (!snapshot) {
    return;
  }
  const auto& s = *snapshot;
  const auto& f = s.fix;
  const std::string row = fmt::format("{},{:.3f},{},{},{},{:.9f},{:.9f},{:.3f},{:.3f},{},{:.6f},{},{},{},{:.3f},{:.3f}\n",
                                      s.sequence, s.epoch.utc_seconds, s.status, core::to_string(s.solve_status),
                                      s.fix_updated ? 1 : 0, f.lat_deg, f.lon_deg, f.alt_m, f.error_m,
                                      nav::to_string(f.mode), f.clock_bias_km, f.satellites_used, f.iterations_used,
                                      f.converged ? 1 : 0, f.gdop, f.pdop);
  const std::lock_guard<std::mutex> lock(mutex_);
  out_ << row;
  out_.flush();
}

}  // namespace opnav::engine
