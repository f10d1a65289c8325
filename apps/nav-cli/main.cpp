/**
 * @file main.cpp
 * @brief Navigation engine runner: catalog, worker loop, live fix printout.
 * @author Watosn
 */

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <thread>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "opnav/engine/csv_fix_sink.hpp"
#include "opnav/engine/nav_engine.hpp"
#include "opnav/orbit/catalog_file.hpp"
#include "opnav/orbit/kepler_propagator.hpp"
#include "opnav/orbit/walker_constellation.hpp"
#include "opnav/rf/spectrum_source.hpp"

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_signal(int) { g_stop_requested = 1; }

std::filesystem::file_time_type modified_time(const std::filesystem::path& file) {
  std::error_code ec;
  const auto t = std::filesystem::last_write_time(file, ec);
  return ec ? std::filesystem::file_time_type{} : t;
}

void print_snapshot(const opnav::engine::NavSnapshot& s) {
  const auto& f = s.fix;
  fmt::print("#{:<6} {:<20} {:<9} lat={:.7f} lon={:.7f} alt={:.1f}m err={:.3f}m gdop={:.2f} {}\n", s.sequence,
             s.status, s.catalog_source, f.lat_deg, f.lon_deg, f.alt_m, f.error_m, f.gdop, opnav::nav::to_string(f.mode));
  for (const auto& sat : s.satellites) {
    fmt::print("        {:<14} az={:6.1f} el={:5.1f} range={:8.1f}km tof={:.3f}ms\n", sat.name, sat.azimuth_deg,
               sat.elevation_deg, sat.range_km, sat.time_of_flight_ms);
  }
}

}  // namespace

int main(int argc, char** argv) {
  if (argc > 9) {
    spdlog::error(
        "usage: nav_cli [catalog:walker|<file.tle|file.csv>] [run_seconds:0=until interrupted] [fix_csv|-] [lat_deg] "
        "[lon_deg] [alt_m] [noise_bound_km] [rtl_power_csv]");
    return 1;
  }

  const std::string catalog_arg = (argc >= 2) ? argv[1] : "walker";
  const double run_seconds = (argc >= 3) ? std::atof(argv[2]) : 0.0;
  const std::string fix_csv = (argc >= 4) ? argv[3] : "-";

  opnav::engine::EngineConfig config{};
  if (argc >= 7) {
    config.observer = opnav::core::GeodeticPoint{
        .lat_deg = std::atof(argv[4]), .lon_deg = std::atof(argv[5]), .alt_m = std::atof(argv[6])};
  }
  if (argc >= 8) {
    config.noise_bound_km = std::atof(argv[7]);
  }
  if (argc >= 9) {
    config.spectrum_mode = opnav::rf::SpectrumMode::Live;
    config.spectrum_file = argv[8];
  }
  if (opnav::engine::validate(config) != opnav::core::Status::Ok) {
    spdlog::error("invalid engine configuration");
    return 2;
  }

  opnav::orbit::CatalogStore catalogs;
  const bool from_file = catalog_arg != "walker";
  const std::filesystem::path catalog_file = from_file ? std::filesystem::path(catalog_arg) : std::filesystem::path{};
  if (from_file) {
    const auto loaded = opnav::orbit::load_catalog_file({.file = catalog_file});
    if (loaded.status != opnav::core::Status::Ok) {
      spdlog::error("failed to load catalog: {} ({})", catalog_file.string(), opnav::core::to_string(loaded.status));
      return 3;
    }
    if (loaded.rejected_records > 0) {
      spdlog::warn("catalog: skipped {} malformed records", loaded.rejected_records);
    }
    catalogs.replace(loaded.catalog);
  } else {
    const auto walker =
        opnav::orbit::make_walker_constellation({.epoch = opnav::engine::NavEngine::now()});
    catalogs.replace(std::make_shared<const opnav::orbit::Catalog>(walker));
  }

  std::unique_ptr<opnav::engine::CsvFixSink> sink{};
  if (fix_csv != "-") {
    sink = opnav::engine::CsvFixSink::Create({.csv_file = fix_csv, .append = false});
    if (!sink) {
      spdlog::error("failed to open fix csv: {}", fix_csv);
      return 4;
    }
  }

  const opnav::orbit::KeplerPropagator propagator;
  const auto spectrum = opnav::rf::make_spectrum_source(config.spectrum_mode, config.spectrum_file, config.rng_seed);
  auto engine = opnav::engine::NavEngine::Create(config, catalogs, propagator, *spectrum, sink.get());
  if (!engine) {
    spdlog::error("failed to create engine");
    return 5;
  }

  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);
  if (!engine->start()) {
    return 6;
  }

  const auto started = std::chrono::steady_clock::now();
  auto catalog_mtime = from_file ? modified_time(catalog_file) : std::filesystem::file_time_type{};
  std::uint64_t printed = 0;
  while (g_stop_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    const auto latest = engine->board().latest();
    if (latest->sequence != printed) {
      printed = latest->sequence;
      print_snapshot(*latest);
    }

    if (from_file) {
      const auto mtime = modified_time(catalog_file);
      if (mtime != catalog_mtime) {
        catalog_mtime = mtime;
        const auto reloaded = opnav::orbit::load_catalog_file({.file = catalog_file});
        if (reloaded.status == opnav::core::Status::Ok) {
          catalogs.replace(reloaded.catalog);
        } else {
          spdlog::warn("catalog reload failed, keeping previous catalog");
        }
      }
    }

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
    if (run_seconds > 0.0 && elapsed.count() >= run_seconds) {
      break;
    }
  }

  engine->stop();
  const auto last = engine->board().latest();
  fmt::print("cycles={} final_status=\"{}\" lat={:.7f} lon={:.7f} alt={:.1f}\n", engine->board().published_count(),
             last->status, last->fix.lat_deg, last->fix.lon_deg, last->fix.alt_m);
  return 0;
}
