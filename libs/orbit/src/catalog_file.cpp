/**
 * @file catalog_file.cpp
 * @brief Element CSV and TLE catalog loaders.
 * @author Watosn
 */

#include "opnav/orbit/catalog_file.hpp"

#include <cctype>
#include <cmath>
#include <exception>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

#include "opnav/core/constants.hpp"

namespace opnav::orbit {
namespace {

constexpr std::size_t kElementCsvColumns = 9;
constexpr std::size_t kTleLineLength = 69;

int days_from_civil(int y, unsigned m, unsigned d) {
  y -= static_cast<int>(m <= 2);
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153U * (m + (m > 2 ? -3U : 9U)) + 2U) / 5U + d - 1U;
  const unsigned doe = yoe * 365U + yoe / 4U - yoe / 100U + doy;
  return era * 146097 + static_cast<int>(doe) - 719468;
}

std::string trim(const std::string& text) {
  std::size_t b = 0;
  std::size_t e = text.size();
  while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) {
    ++b;
  }
  while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) {
    --e;
  }
  return text.substr(b, e - b);
}

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  fields.reserve(kElementCsvColumns);
  std::string token;
  std::stringstream ss(line);
  while (std::getline(ss, token, ',')) {
    fields.push_back(trim(token));
  }
  return fields;
}

bool parse_double(const std::string& text, double& value) {
  if (text.empty()) {
    return false;
  }
  try {
    std::size_t used = 0;
    value = std::stod(text, &used);
    if (used != text.size()) {
      return false;
    }
  } catch (const std::exception&) {
    return false;
  }
  return std::isfinite(value);
}

bool parse_field(const std::string& line, std::size_t col, std::size_t len, double& value) {
  if (line.size() < col + len) {
    return false;
  }
  return parse_double(trim(line.substr(col, len)), value);
}

bool parse_element_row(const std::vector<std::string>& f, core::SatelliteRecord& out) {
  if (f.size() < kElementCsvColumns || f[0].empty()) {
    return false;
  }
  core::KeplerianElements el{};
  if (!parse_double(f[2], el.epoch.utc_seconds) || !parse_double(f[3], el.semi_major_axis_km) ||
      !parse_double(f[4], el.eccentricity) || !parse_double(f[5], el.inclination_deg) ||
      !parse_double(f[6], el.raan_deg) || !parse_double(f[7], el.arg_perigee_deg) ||
      !parse_double(f[8], el.mean_anomaly_deg)) {
    return false;
  }
  if (!(el.semi_major_axis_km > 0.0) || !(el.eccentricity >= 0.0 && el.eccentricity < 1.0)) {
    return false;
  }
  out = core::SatelliteRecord{.name = f[0], .group = f[1], .elements = el};
  return true;
}

CatalogLoadResult unavailable(const CatalogFileConfig& config) {
  return CatalogLoadResult{
      .catalog = std::make_shared<const Catalog>(Catalog{.source = config.source_label}),
      .rejected_records = 0,
      .status = core::Status::DataUnavailable};
}

}  // namespace

bool tle_checksum_ok(const std::string& line) {
  if (line.size() < kTleLineLength || !std::isdigit(static_cast<unsigned char>(line[68]))) {
    return false;
  }
  int sum = 0;
  for (std::size_t i = 0; i < 68; ++i) {
    const char c = line[i];
    if (std::isdigit(static_cast<unsigned char>(c))) {
      sum += c - '0';
    } else if (c == '-') {
      sum += 1;
    }
  }
  return (sum % 10) == (line[68] - '0');
}

bool parse_tle_record(const std::string& name,
                      const std::string& line1,
                      const std::string& line2,
                      core::SatelliteRecord& out) {
  const std::string l1 = trim(line1);
  const std::string l2 = trim(line2);
  if (l1.size() < kTleLineLength || l2.size() < kTleLineLength || l1[0] != '1' || l2[0] != '2') {
    return false;
  }
  if (!tle_checksum_ok(l1) || !tle_checksum_ok(l2)) {
    return false;
  }

  double epoch_year = 0.0;
  double epoch_day = 0.0;
  double incl = 0.0;
  double raan = 0.0;
  double ecc_digits = 0.0;
  double argp = 0.0;
  double mean_anomaly = 0.0;
  double revs_per_day = 0.0;
  if (!parse_field(l1, 18, 2, epoch_year) || !parse_field(l1, 20, 12, epoch_day) || !parse_field(l2, 8, 8, incl) ||
      !parse_field(l2, 17, 8, raan) || !parse_field(l2, 26, 7, ecc_digits) || !parse_field(l2, 34, 8, argp) ||
      !parse_field(l2, 43, 8, mean_anomaly) || !parse_field(l2, 52, 11, revs_per_day)) {
    return false;
  }
  if (!(revs_per_day > 0.0) || !(epoch_day >= 1.0)) {
    return false;
  }

  const int yy = static_cast<int>(epoch_year);
  const int year = (yy < 57) ? 2000 + yy : 1900 + yy;
  const double epoch_utc_s = static_cast<double>(days_from_civil(year, 1U, 1U)) * core::constants::kSecondsPerDay +
                             (epoch_day - 1.0) * core::constants::kSecondsPerDay;
  const double n_rad_s = revs_per_day * core::constants::kTwoPi / core::constants::kSecondsPerDay;

  std::string label = trim(name);
  if (label.rfind("0 ", 0) == 0) {
    label = trim(label.substr(2));
  }
  if (label.empty()) {
    label = trim(l1.substr(2, 5));
  }

  out = core::SatelliteRecord{
      .name = label,
      .group = out.group,
      .elements = core::KeplerianElements{
          .epoch = core::Epoch{.utc_seconds = epoch_utc_s},
          .semi_major_axis_km = std::cbrt(core::constants::kEarthMuKm3S2 / (n_rad_s * n_rad_s)),
          .eccentricity = ecc_digits * 1e-7,
          .inclination_deg = incl,
          .raan_deg = raan,
          .arg_perigee_deg = argp,
          .mean_anomaly_deg = mean_anomaly,
      }};
  return true;
}

CatalogLoadResult load_element_csv(const CatalogFileConfig& config) {
  std::ifstream in(config.file);
  if (!in) {
    return unavailable(config);
  }

  Catalog catalog{.source = config.source_label};
  std::size_t rejected = 0;
  std::string line;
  bool header_consumed = false;
  while (std::getline(in, line)) {
    if (trim(line).empty() || line[0] == '#') {
      continue;
    }
    if (!header_consumed) {
      header_consumed = true;
      if (line.find("name") != std::string::npos) {
        continue;
      }
    }
    core::SatelliteRecord record{};
    if (!parse_element_row(split_csv_line(line), record)) {
      ++rejected;
      continue;
    }
    catalog.satellites.push_back(std::move(record));
  }

  return CatalogLoadResult{.catalog = std::make_shared<const Catalog>(std::move(catalog)),
                           .rejected_records = rejected,
                           .status = core::Status::Ok};
}

CatalogLoadResult load_tle_file(const CatalogFileConfig& config) {
  std::ifstream in(config.file);
  if (!in) {
    return unavailable(config);
  }

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (!trim(line).empty()) {
      lines.push_back(line);
    }
  }

  Catalog catalog{.source = config.source_label};
  std::size_t rejected = 0;
  std::size_t i = 0;
  while (i < lines.size()) {
    // Records are name/line1/line2; a bare line1/line2 pair is tolerated.
    const bool has_name = trim(lines[i]).rfind("1 ", 0) != 0;
    const std::size_t need = has_name ? 3U : 2U;
    if (i + need > lines.size()) {
      rejected += 1;
      break;
    }
    const std::string name = has_name ? lines[i] : std::string{};
    const std::string& l1 = lines[i + need - 2];
    const std::string& l2 = lines[i + need - 1];
    core::SatelliteRecord record{.group = config.default_group};
    if (parse_tle_record(name, l1, l2, record)) {
      catalog.satellites.push_back(std::move(record));
    } else {
      ++rejected;
    }
    i += need;
  }

  return CatalogLoadResult{.catalog = std::make_shared<const Catalog>(std::move(catalog)),
                           .rejected_records = rejected,
                           .status = core::Status::Ok};
}

CatalogLoadResult load_catalog_file(const CatalogFileConfig& config) {
  if (config.file.extension() == ".csv") {
    return load_element_csv(config);
  }
  return load_tle_file(config);
}

}  // namespace opnav::orbit
