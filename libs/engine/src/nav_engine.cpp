/**
 * @file nav_engine.cpp
 * @brief Navigation engine cycle and worker loop.
 * @author Watosn
 */

#include "opnav/engine/nav_engine.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "opnav/core/geodetic.hpp"
#include "opnav/nav/multilateration.hpp"
#include "opnav/nav/visibility.hpp"

namespace opnav::engine {
namespace {

struct Candidate {
  SatelliteView view{};
  const core::SatelliteRecord* record{};
};

std::string trim_eol(std::string line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.pop_back();
  }
  return line;
}

}  // namespace

std::unique_ptr<NavEngine> NavEngine::Create(const EngineConfig& config,
                                             orbit::CatalogStore& catalogs,
                                             const core::IOrbitPropagator& propagator,
                                             core::ISpectrumSource& spectrum,
                                             ISolutionSink* extra_sink) {
  if (validate(config) != core::Status::Ok) {
    return nullptr;
  }
  return std::make_unique<NavEngine>(config, catalogs, propagator, spectrum, extra_sink);
}

NavEngine::NavEngine(const EngineConfig& config,
                     orbit::CatalogStore& catalogs,
                     const core::IOrbitPropagator& propagator,
                     core::ISpectrumSource& spectrum,
                     ISolutionSink* extra_sink)
    : config_(config),
      catalogs_(catalogs),
      propagator_(propagator),
      spectrum_(spectrum),
      extra_sink_(extra_sink),
      synthesizer_(config.rng_seed),
      truth_ecef_km_(core::ecef_from_geodetic(config.observer)) {
  event_log_ = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(std::max<std::size_t>(1, config_.event_log_depth));
  event_log_->set_pattern("[%H:%M:%S] %v");
  std::vector<spdlog::sink_ptr> sinks{event_log_};
  if (config_.log_to_stdout) {
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  }
  logger_ = std::make_shared<spdlog::logger>("opnav", sinks.begin(), sinks.end());
  logger_->set_level(spdlog::level::info);

  if (config_.smoothing_alpha > 0.0) {
    smoother_.emplace(config_.smoothing_alpha);
  }
  logger_->info("SYSTEM: Booting (observer {:.6f}, {:.6f}, {:.1f} m)", config_.observer.lat_deg,
                config_.observer.lon_deg, config_.observer.alt_m);
}

NavEngine::~NavEngine() { stop(); }

bool NavEngine::start() {
  if (running_.load(std::memory_order_acquire)) {
    logger_->warn("SYSTEM: Engine already running");
    return false;
  }
  running_.store(true, std::memory_order_release);
  worker_ = std::thread(&NavEngine::run, this);
  return true;
}

void NavEngine::stop() {
  {
    const std::lock_guard<std::mutex> lock(wait_mutex_);
    running_.store(false, std::memory_order_release);
  }
  wake_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

core::Epoch NavEngine::now() {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return core::Epoch{.utc_seconds = std::chrono::duration<double>(since_epoch).count()};
}

void NavEngine::run() {
  logger_->info("SYSTEM: Engine started ({} ms cycle)", config_.cycle_interval.count());
  while (running_.load(std::memory_order_acquire)) {
    try {
      run_cycle(now());
    } catch (const std::exception& e) {
      logger_->error("SYSTEM: Cycle failed: {}", e.what());
    }
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wake_.wait_for(lock, config_.cycle_interval, [this] { return !running_.load(std::memory_order_acquire); });
  }
  logger_->info("SYSTEM: Engine stopped after {} cycles", board_.published_count());
}

std::shared_ptr<const NavSnapshot> NavEngine::run_cycle(const core::Epoch& epoch) {
  const std::lock_guard<std::mutex> lock(cycle_mutex_);
  std::shared_ptr<const NavSnapshot> snapshot = execute_cycle(epoch);
  board_.publish(snapshot);
  if (extra_sink_ != nullptr) {
    extra_sink_->publish(snapshot);
  }
  return snapshot;
}

std::shared_ptr<const NavSnapshot> NavEngine::execute_cycle(const core::Epoch& epoch) {
  auto out = std::make_shared<NavSnapshot>();
  out->sequence = ++sequence_;
  out->epoch = epoch;

  const orbit::CatalogSnapshot current = catalogs_.snapshot_with_generation();
  const std::shared_ptr<const orbit::Catalog>& catalog = current.catalog;
  if (current.generation != seen_catalog_generation_) {
    seen_catalog_generation_ = current.generation;
    logger_->info("CATALOG: {} ({} satellites)", catalog->source, catalog->satellites.size());
  }
  out->catalog_source = catalog->source;

  // Visibility and measurement synthesis.
  const std::size_t limit = std::min(catalog->satellites.size(), config_.max_catalog_satellites);
  std::vector<nav::Measurement> measurements;
  std::vector<Candidate> candidates;
  for (std::size_t i = 0; i < limit; ++i) {
    const core::SatelliteRecord& sat = catalog->satellites[i];
    const core::PropagationResult state = propagator_.propagate(sat, epoch);
    if (state.status != core::Status::Ok || !core::is_finite(state.position_ecef_km)) {
      ++out->propagation_failures;
      logger_->debug("ORBIT: {} skipped ({})", sat.name, core::to_string(state.status));
      continue;
    }
    const core::LookAngles look = core::look_angles(config_.observer, state.position_ecef_km);
    if (!nav::is_visible(look.elevation_deg, config_.elevation_mask_deg)) {
      continue;
    }
    const nav::SynthesisResult synth = synthesizer_.synthesize(state.position_ecef_km, truth_ecef_km_,
                                                               config_.clock_bias_km, config_.noise_bound_km);
    if (!synth.ok()) {
      logger_->debug("NAV: {} measurement rejected ({})", sat.name, core::to_string(synth.status));
      continue;
    }
    const nav::Measurement& m = synth.measurement;
    measurements.push_back(m);
    candidates.push_back(Candidate{
        .view =
            SatelliteView{
                .name = sat.name,
                .group = sat.group,
                .azimuth_deg = look.azimuth_deg,
                .elevation_deg = look.elevation_deg,
                .range_km = look.range_km,
                .time_of_flight_ms = nav::time_of_flight_ms(m.pseudorange_km),
                .subpoint = core::subpoint(state.position_ecef_km),
            },
        .record = &sat,
    });
  }
  out->visible_satellites = measurements.size();

  std::stable_sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
    return a.view.elevation_deg > b.view.elevation_deg;
  });
  if (candidates.size() > config_.max_published_satellites) {
    candidates.resize(config_.max_published_satellites);
  }
  for (const Candidate& c : candidates) {
    out->satellites.push_back(c.view);
    out->ground_tracks.push_back(ground_track(*c.record, epoch));
  }

  // Solve.
  nav::SolverConfig solver = config_.solver;
  if (!solver.initial_state && measurements.size() >= nav::kMinMeasurements) {
    solver.initial_state = (config_.seed_from_previous && previous_estimate_)
                               ? *previous_estimate_
                               : nav::coarse_initial_state(measurements);
  }
  const nav::SolveResult result = nav::solve(measurements, solver);
  out->solve_status = result.status;

  if (result.ok()) {
    nav::Fix fix = nav::raw_fix(result, config_.observer);
    if (config_.blend_weight < 1.0) {
      const nav::Fix blended = nav::postprocess(result.state, blend_reference(), config_.blend_weight);
      fix.lat_deg = blended.lat_deg;
      fix.lon_deg = blended.lon_deg;
      fix.alt_m = blended.alt_m;
      fix.error_m = blended.error_m;
    }
    last_fix_ = fix;
    out->fix_updated = true;
    if (result.converged) {
      previous_estimate_ = result.state;
    } else {
      previous_estimate_.reset();
      logger_->warn("NAV: Solver stopped after {} iterations (step {:.3e} km)", result.iterations_used,
                    result.last_step_km);
    }
    if (!tracking_) {
      logger_->info("NAV: 3D lock ({} sats, GDOP {:.2f})", result.measurements_used, result.gdop);
    }
    tracking_ = true;
    out->status = fmt::format("TRACKING ({} SATS)", measurements.size());
    if (smoother_ && smoother_->update(fix) != core::Status::Ok) {
      logger_->warn("NAV: Smoother rejected fix");
    }
  } else {
    if (result.status == core::Status::SingularGeometry || result.status == core::Status::NumericalError) {
      previous_estimate_.reset();
      logger_->warn("NAV: Solve failed ({}), holding last fix", core::to_string(result.status));
    } else if (result.status != core::Status::InsufficientMeasurements) {
      logger_->warn("NAV: Solve rejected ({}), holding last fix", core::to_string(result.status));
    } else if (tracking_) {
      logger_->warn("NAV: Lock lost ({} sats visible)", measurements.size());
    }
    tracking_ = false;
    out->status = fmt::format("ACQUIRING ({} SATS)", measurements.size());
  }
  out->fix = last_fix_;
  if (smoother_) {
    out->smoothed_fix = smoother_->current();
  }

  // Spectrum.
  core::SpectrumSample spectrum = spectrum_.sample(config_.spectrum_bins);
  if (spectrum.status != last_spectrum_status_) {
    if (spectrum.status == core::Status::Ok) {
      logger_->info("RF: Spectrum restored");
    } else {
      logger_->warn("RF: Spectrum unavailable ({})", core::to_string(spectrum.status));
    }
    last_spectrum_status_ = spectrum.status;
  }
  out->spectrum_status = spectrum.status;
  if (spectrum.status == core::Status::Ok) {
    out->spectrum = std::move(spectrum.magnitudes);
  }

  for (std::string& line : event_log_->last_formatted()) {
    out->event_log.push_back(trim_eol(std::move(line)));
  }
  return out;
}

GroundTrack NavEngine::ground_track(const core::SatelliteRecord& satellite, const core::Epoch& epoch) const {
  GroundTrack track{.name = satellite.name, .points = {}};
  const double span = config_.ground_track_half_span_s;
  for (double dt = -span; dt <= span + 1e-9; dt += config_.ground_track_step_s) {
    const core::PropagationResult state = propagator_.propagate(satellite, core::Epoch{.utc_seconds = epoch.utc_seconds + dt});
    if (state.status == core::Status::Ok && core::is_finite(state.position_ecef_km)) {
      track.points.push_back(core::subpoint(state.position_ecef_km));
    }
  }
  return track;
}

core::GeodeticPoint NavEngine::blend_reference() const { return config_.reference.value_or(config_.observer); }

}  // namespace opnav::engine
