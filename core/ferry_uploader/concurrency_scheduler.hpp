// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_CONCURRENCY_SCHEDULER_HPP
#define FERRY_CONCURRENCY_SCHEDULER_HPP

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace ferry {
namespace uploader {

/**
 * Bounded worker pool with FIFO admission and drain semantics.
 *
 * A fixed number of worker threads take jobs from a single queue, so at
 * most `capacity` jobs run at any time. waitIdle() blocks until the queue
 * is empty and no job is running.
 *
 * Thread Safety:
 * - submit() and waitIdle() may be called from any thread
 * - shutdown() and waitIdle() must not be called from a worker
 */
class ConcurrencyScheduler {
public:
  using Job = std::function<void()>;

  /**
   * @param capacity Number of worker threads (0 is treated as 1)
   */
  explicit ConcurrencyScheduler(size_t capacity);
  ~ConcurrencyScheduler();

  // Non-copyable, non-movable
  ConcurrencyScheduler(const ConcurrencyScheduler&) = delete;
  ConcurrencyScheduler& operator=(const ConcurrencyScheduler&) = delete;
  ConcurrencyScheduler(ConcurrencyScheduler&&) = delete;
  ConcurrencyScheduler& operator=(ConcurrencyScheduler&&) = delete;

  /**
   * Enqueue a job for execution as soon as a worker is free.
   *
   * @return false if the scheduler is shut down
   */
  bool submit(Job job);

  /**
   * Block until every accepted job has finished.
   *
   * @throws The first exception that escaped a job since the last waitIdle()
   */
  void waitIdle();

  /**
   * Finish queued jobs, then join all workers. Idempotent.
   */
  void shutdown();

  size_t capacity() const {
    return capacity_;
  }

  /**
   * Jobs queued or running
   */
  size_t outstanding() const;

  /**
   * True when called from inside a job of this scheduler
   */
  bool isWorkerThread() const;

private:
  void workerLoop();

  const size_t capacity_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::queue<Job> jobs_;
  size_t active_ = 0;
  bool shutdown_ = false;
  std::exception_ptr first_error_;

  std::vector<std::thread> workers_;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_CONCURRENCY_SCHEDULER_HPP
