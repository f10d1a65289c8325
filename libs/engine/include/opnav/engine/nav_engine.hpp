/**
 * @file nav_engine.hpp
 * @brief Periodic navigation cycle: visibility, synthesis, solve, post-process, publish.
 * @author Watosn
 */
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include <spdlog/logger.h>
#include <spdlog/sinks/ringbuffer_sink.h>

#include "opnav/core/interfaces.hpp"
#include "opnav/core/types.hpp"
#include "opnav/engine/engine_config.hpp"
#include "opnav/engine/snapshot.hpp"
#include "opnav/engine/solution_board.hpp"
#include "opnav/nav/fix.hpp"
#include "opnav/nav/measurement.hpp"
#include "opnav/orbit/catalog.hpp"

namespace opnav::engine {

/**
 * @brief Single-writer navigation worker.
 *
 * One background thread runs `run_cycle` and then waits `cycle_interval`, until `stop()`.
 * Every cycle publishes one complete snapshot to the owned `SolutionBoard` and the
 * optional extra sink. No per-satellite or per-cycle failure ends the loop: failed
 * propagations are skipped, failed solves keep the previous fix.
 *
 * Collaborators are borrowed and must outlive the engine.
 */
class NavEngine final {
 public:
  /**
   * @brief Validate `config` and build an engine.
   * @return Null when `validate(config)` is not Ok.
   */
  static std::unique_ptr<NavEngine> Create(const EngineConfig& config,
                                           orbit::CatalogStore& catalogs,
                                           const core::IOrbitPropagator& propagator,
                                           core::ISpectrumSource& spectrum,
                                           ISolutionSink* extra_sink = nullptr);

  NavEngine(const EngineConfig& config,
            orbit::CatalogStore& catalogs,
            const core::IOrbitPropagator& propagator,
            core::ISpectrumSource& spectrum,
            ISolutionSink* extra_sink = nullptr);
  ~NavEngine();

  NavEngine(const NavEngine&) = delete;
  NavEngine& operator=(const NavEngine&) = delete;

  /**
   * @brief Start the worker thread.
   * @return False when already running.
   */
  bool start();

  /**
   * @brief Stop the worker, interrupting its wait; returns after the current cycle finishes.
   */
  void stop();

  [[nodiscard]] bool is_running() const { return running_.load(std::memory_order_acquire); }

  /**
   * @brief Execute and publish one full cycle at `epoch`.
   *
   * Serialized against the worker, so it may also be driven directly (tests, replay).
   * Publication happens under the same lock, so sinks receive snapshots in sequence order.
   */
  std::shared_ptr<const NavSnapshot> run_cycle(const core::Epoch& epoch);

  /**
   * @brief Owned publication state; `latest()` is safe from any thread.
   */
  [[nodiscard]] const SolutionBoard& board() const { return board_; }

  [[nodiscard]] const EngineConfig& config() const { return config_; }

  /**
   * @brief Wall-clock UTC epoch.
   */
  [[nodiscard]] static core::Epoch now();

 private:
  void run();
  std::shared_ptr<const NavSnapshot> execute_cycle(const core::Epoch& epoch);
  [[nodiscard]] GroundTrack ground_track(const core::SatelliteRecord& satellite, const core::Epoch& epoch) const;
  [[nodiscard]] core::GeodeticPoint blend_reference() const;

  EngineConfig config_;
  orbit::CatalogStore& catalogs_;
  const core::IOrbitPropagator& propagator_;
  core::ISpectrumSource& spectrum_;
  ISolutionSink* extra_sink_{nullptr};

  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> event_log_{};
  std::shared_ptr<spdlog::logger> logger_{};

  SolutionBoard board_{};
  nav::MeasurementSynthesizer synthesizer_;
  std::optional<nav::ExponentialFixSmoother> smoother_{};
  core::Vec3 truth_ecef_km_{};

  // Cycle state, guarded by cycle_mutex_.
  std::mutex cycle_mutex_{};
  std::uint64_t sequence_{};
  std::uint64_t seen_catalog_generation_{UINT64_MAX};
  std::optional<nav::StateEstimate> previous_estimate_{};
  nav::Fix last_fix_{};
  bool tracking_{};
  core::Status last_spectrum_status_{core::Status::Ok};

  std::thread worker_{};
  std::atomic<bool> running_{false};
  std::mutex wait_mutex_{};
  std::condition_variable wake_{};
};

}  // namespace opnav::engine
