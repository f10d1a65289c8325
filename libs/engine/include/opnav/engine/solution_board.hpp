/**
 * @file solution_board.hpp
 * @brief Publication sinks for navigation snapshots.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include "opnav/engine/snapshot.hpp"

namespace opnav::engine {

/**
 * @brief Interface for consumers of per-cycle snapshots.
 */
class ISolutionSink {
 public:
  virtual ~ISolutionSink() = default;
  /**
   * @brief Receive one complete snapshot. Called from the engine worker thread.
   */
  virtual void publish(const std::shared_ptr<const NavSnapshot>& snapshot) = 0;
};

/**
 * @brief Owned holder of the latest snapshot, readable from any thread.
 *
 * The lock guards only the pointer exchange, so readers never wait on a cycle and
 * always see one whole snapshot.
 */
class SolutionBoard final : public ISolutionSink {
 public:
  SolutionBoard() : latest_(std::make_shared<const NavSnapshot>()) {}

  void publish(const std::shared_ptr<const NavSnapshot>& snapshot) override;

  /**
   * @brief Latest published snapshot; never null.
   */
  [[nodiscard]] std::shared_ptr<const NavSnapshot> latest() const;

  [[nodiscard]] std::uint64_t published_count() const;

 private:
  mutable std::mutex mutex_{};
  std::shared_ptr<const NavSnapshot> latest_{};
  std::uint64_t published_{};
};

}  // namespace opnav::engine
