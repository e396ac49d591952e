// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "progress_tracker.hpp"

namespace ferry {
namespace uploader {

void ProgressTracker::storeMax(std::atomic<uint64_t>& target, uint64_t value) {
  uint64_t current = target.load(std::memory_order_relaxed);
  while (current < value &&
         !target.compare_exchange_weak(current, value, std::memory_order_acq_rel)) {
  }
}

void ProgressTracker::fold(const QueueStatus& status) {
  storeMax(total_, status.total);
  storeMax(completed_, status.completed + status.failed);
}

uint64_t ProgressTracker::bumpCompleted() {
  uint64_t current = completed_.load(std::memory_order_relaxed);
  while (true) {
    uint64_t total = total_.load(std::memory_order_acquire);
    if (total > 0 && current >= total) {
      return current;
    }
    if (completed_.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel)) {
      return current + 1;
    }
  }
}

ProgressSnapshot ProgressTracker::snapshot() const {
  ProgressSnapshot s;
  s.completed = completed_.load(std::memory_order_acquire);
  s.total = total_.load(std::memory_order_acquire);
  return s;
}

void ProgressTracker::reset() {
  completed_.store(0, std::memory_order_release);
  total_.store(0, std::memory_order_release);
}

}  // namespace uploader
}  // namespace ferry
