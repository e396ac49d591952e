// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_PROGRESS_TRACKER_HPP
#define FERRY_PROGRESS_TRACKER_HPP

#include <atomic>
#include <cstdint>

#include "uploader_types.hpp"

namespace ferry {
namespace uploader {

/**
 * Copyable view of the tracker state
 */
struct ProgressSnapshot {
  uint64_t completed = 0;
  uint64_t total = 0;
};

/**
 * Merges server queue snapshots with local completions into a progress
 * signal that never decreases during one run.
 *
 * Every update is a max(): whichever source arrives last cannot lower
 * a value already published by the other.
 *
 * Thread Safety:
 * - fold() is called by the run loop, bumpCompleted() by upload workers
 * - All members are lock-free atomics
 */
class ProgressTracker {
public:
  ProgressTracker() = default;

  // Non-copyable, non-movable
  ProgressTracker(const ProgressTracker&) = delete;
  ProgressTracker& operator=(const ProgressTracker&) = delete;

  /**
   * Fold a server snapshot.
   * total := max(total, status.total)
   * completed := max(completed, status.completed + status.failed)
   */
  void fold(const QueueStatus& status);

  /**
   * Count one local success before the server confirms it.
   * Capped at the largest total seen so far when one is known.
   *
   * @return The completed count after the bump
   */
  uint64_t bumpCompleted();

  ProgressSnapshot snapshot() const;

  /**
   * Zero both counters. Only called when a new run begins.
   */
  void reset();

private:
  static void storeMax(std::atomic<uint64_t>& target, uint64_t value);

  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> total_{0};
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_PROGRESS_TRACKER_HPP
