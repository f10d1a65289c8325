/**
 * @file solution_board.cpp
 * @brief Snapshot board implementation.
 * @author Watosn
 */

#include "opnav/engine/solution_board.hpp"

namespace opnav::engine {

void SolutionBoard::publish(const std::shared_ptr<const NavSnapshot>& snapshot) {
  if (!snapshot) {
    return;
  }
  const std::lock_guard<std::mutex> lock(mutex_);
  latest_ = snapshot;
  ++published_;
}

std::shared_ptr<const NavSnapshot> SolutionBoard::latest() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return latest_;
}

std::uint64_t SolutionBoard::published_count() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return published_;
}

}  // namespace opnav::engine
