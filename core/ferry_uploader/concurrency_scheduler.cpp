// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "concurrency_scheduler.hpp"

#include <utility>

namespace ferry {
namespace uploader {

namespace {
// Scheduler owning the current worker thread
thread_local const ConcurrencyScheduler* tls_owner = nullptr;
}  // namespace

ConcurrencyScheduler::ConcurrencyScheduler(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
  workers_.reserve(capacity_);
  for (size_t i = 0; i < capacity_; ++i) {
    workers_.emplace_back(&ConcurrencyScheduler::workerLoop, this);
  }
}

ConcurrencyScheduler::~ConcurrencyScheduler() {
  shutdown();
}

bool ConcurrencyScheduler::submit(Job job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
      return false;
    }
    jobs_.push(std::move(job));
  }
  work_cv_.notify_one();
  return true;
}

void ConcurrencyScheduler::waitIdle() {
  std::exception_ptr error;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] {
      return jobs_.empty() && active_ == 0;
    });
    std::swap(error, first_error_);
  }
  if (error) {
    std::rethrow_exception(error);
  }
}

void ConcurrencyScheduler::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_ && workers_.empty()) {
      return;
    }
    shutdown_ = true;
  }
  work_cv_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

size_t ConcurrencyScheduler::outstanding() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size() + active_;
}

bool ConcurrencyScheduler::isWorkerThread() const {
  return tls_owner == this;
}

void ConcurrencyScheduler::workerLoop() {
  tls_owner = this;
  while (true) {
    Job job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this] {
        return shutdown_ || !jobs_.empty();
      });
      // Drain remaining jobs before exiting
      if (jobs_.empty()) {
        return;
      }
      job = std::move(jobs_.front());
      jobs_.pop();
      ++active_;
    }

    std::exception_ptr error;
    try {
      job();
    } catch (...) {
      error = std::current_exception();
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --active_;
      if (error && !first_error_) {
        first_error_ = error;
      }
      if (jobs_.empty() && active_ == 0) {
        idle_cv_.notify_all();
      }
    }
  }
}

}  // namespace uploader
}  // namespace ferry
