/**
 * @file test_catalog_file.cpp
 * @brief Element CSV / TLE catalog loader and catalog store tests.
 * @author Watosn
 */

#include <atomic>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "opnav/orbit/catalog.hpp"
#include "opnav/orbit/catalog_file.hpp"

namespace {

constexpr const char* kIssLine1 = "1 25544U 98067A   08264.51782528 -.00002182  00000-0 -11606-4 0  2927";
constexpr const char* kIssLine2 = "2 25544  51.6416 247.4627 0006703 130.5360 325.0288 15.72125391563537";

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

bool write_file(const std::filesystem::path& p, const std::string& content) {
  std::ofstream out(p);
  if (!out) {
    return false;
  }
  out << content;
  return true;
}

}  // namespace

int main() {
  namespace fs = std::filesystem;
  using namespace opnav;

  // Checksums.
  std::string corrupted = kIssLine2;
  corrupted[68] = '8';
  if (!orbit::tle_checksum_ok(kIssLine1) || !orbit::tle_checksum_ok(kIssLine2) || orbit::tle_checksum_ok(corrupted) ||
      orbit::tle_checksum_ok("1 25544U")) {
    spdlog::error("tle checksum mismatch");
    return 1;
  }

  core::SatelliteRecord iss{};
  if (!orbit::parse_tle_record("0 ISS (ZARYA)", kIssLine1, kIssLine2, iss)) {
    spdlog::error("valid tle record rejected");
    return 2;
  }
  const auto& el = iss.elements;
  if (iss.name != "ISS (ZARYA)" || !approx(el.inclination_deg, 51.6416, 1e-12) || !approx(el.raan_deg, 247.4627, 1e-12) ||
      !approx(el.eccentricity, 0.0006703, 1e-12) || !approx(el.arg_perigee_deg, 130.5360, 1e-12) ||
      !approx(el.mean_anomaly_deg, 325.0288, 1e-12)) {
    spdlog::error("tle element mismatch for {}", iss.name);
    return 3;
  }
  if (!approx(el.semi_major_axis_km, 6730.9607, 1e-3) || !approx(el.epoch.utc_seconds, 1221913540.104192, 1e-3)) {
    spdlog::error("tle derived values mismatch: a={} epoch={}", el.semi_major_axis_km, el.epoch.utc_seconds);
    return 4;
  }
  core::SatelliteRecord rejected{};
  if (orbit::parse_tle_record("ISS", kIssLine1, corrupted, rejected) ||
      orbit::parse_tle_record("ISS", kIssLine2, kIssLine1, rejected)) {
    spdlog::error("corrupted or swapped tle lines must be rejected");
    return 5;
  }

  // TLE file: named record, bare record, corrupted record, dangling line.
  const auto tle = fs::temp_directory_path() / "opnav_catalog_test.tle";
  const std::string tle_text = std::string("ISS (ZARYA)\n") + kIssLine1 + "\n" + kIssLine2 + "\n" + kIssLine1 + "\n" +
                               kIssLine2 + "\n" + "BROKEN\n" + kIssLine1 + "\n" + corrupted + "\n" + kIssLine1 + "\n";
  if (!write_file(tle, tle_text)) {
    spdlog::error("failed to write tle fixture");
    return 20;
  }
  const auto tle_load = orbit::load_catalog_file({.file = tle, .default_group = "stations"});
  if (tle_load.status != core::Status::Ok || tle_load.catalog->satellites.size() != 2U ||
      tle_load.rejected_records != 2U || tle_load.catalog->source != orbit::kCachedCatalogSource) {
    spdlog::error("tle file load mismatch: {} satellites, {} rejected", tle_load.catalog->satellites.size(),
                  tle_load.rejected_records);
    return 6;
  }
  if (tle_load.catalog->satellites[0].name != "ISS (ZARYA)" || tle_load.catalog->satellites[1].name != "25544" ||
      tle_load.catalog->satellites[0].group != "stations") {
    spdlog::error("tle naming/group mismatch");
    return 7;
  }

  // Element CSV with header, comment, malformed and out-of-range rows.
  const auto csv = fs::temp_directory_path() / "opnav_catalog_test.csv";
  const std::string csv_text =
      "name,group,epoch_utc_s,semi_major_axis_km,eccentricity,inclination_deg,raan_deg,arg_perigee_deg,mean_anomaly_deg\n"
      "# generated fixture\n"
      "SAT-A,leo,1700000000,7578.137,0.001,87.9,0,0,0\n"
      "SAT-B,leo,1700000000,7578.137,0.001,87.9,30,0,45\n"
      "SAT-C,leo,1700000000,not_a_number,0.001,87.9,30,0,45\n"
      "SAT-D,leo,1700000000,7578.137,1.5,87.9,30,0,45\n"
      "SAT-E,leo,1700000000\n"
      "\n";
  if (!write_file(csv, csv_text)) {
    spdlog::error("failed to write csv fixture");
    return 21;
  }
  const auto csv_load = orbit::load_catalog_file({.file = csv, .source_label = "FILE"});
  if (csv_load.status != core::Status::Ok || csv_load.catalog->satellites.size() != 2U ||
      csv_load.rejected_records != 3U || csv_load.catalog->source != "FILE") {
    spdlog::error("csv load mismatch: {} satellites, {} rejected", csv_load.catalog->satellites.size(),
                  csv_load.rejected_records);
    return 8;
  }
  const auto& b = csv_load.catalog->satellites[1];
  if (b.name != "SAT-B" || b.group != "leo" || b.elements.raan_deg != 30.0 || b.elements.mean_anomaly_deg != 45.0) {
    spdlog::error("csv row mismatch");
    return 9;
  }

  const auto missing = orbit::load_catalog_file({.file = fs::temp_directory_path() / "opnav_no_such_catalog.csv"});
  if (missing.status != core::Status::DataUnavailable || !missing.catalog || !missing.catalog->satellites.empty()) {
    spdlog::error("missing catalog must be unavailable and empty");
    return 10;
  }

  // Store: snapshots stay valid across replacement.
  orbit::CatalogStore store;
  if (!store.snapshot() || !store.snapshot()->satellites.empty() || store.generation() != 0U) {
    spdlog::error("default store must hold an empty catalog");
    return 11;
  }
  store.replace(csv_load.catalog);
  const auto held = store.snapshot();
  store.replace(tle_load.catalog);
  if (held->satellites.size() != 2U || held->source != "FILE" || store.snapshot()->source != orbit::kCachedCatalogSource ||
      store.generation() != 2U) {
    spdlog::error("store replacement mismatch");
    return 12;
  }
  store.replace(nullptr);
  if (!store.snapshot() || !store.snapshot()->satellites.empty()) {
    spdlog::error("null replacement must install an empty catalog");
    return 13;
  }

  // Generation and catalog are read together while a writer replaces.
  {
    orbit::CatalogStore live;
    std::atomic<bool> done{false};
    std::thread writer([&] {
      for (int i = 1; i <= 5000; ++i) {
        live.replace(std::make_shared<const orbit::Catalog>(orbit::Catalog{.source = std::to_string(i), .satellites = {}}));
      }
      done.store(true);
    });
    int torn = 0;
    while (!done.load()) {
      const orbit::CatalogSnapshot view = live.snapshot_with_generation();
      if (view.generation != 0U && view.catalog->source != std::to_string(view.generation)) {
        ++torn;
      }
    }
    writer.join();
    const orbit::CatalogSnapshot last = live.snapshot_with_generation();
    if (torn != 0 || last.generation != 5000U || last.catalog->source != "5000") {
      spdlog::error("catalog and generation read apart: torn={} generation={}", torn, last.generation);
      return 14;
    }
  }

  fs::remove(tle);
  fs::remove(csv);
  return 0;
}
