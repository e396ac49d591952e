// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_BACKOFF_CONTROLLER_HPP
#define FERRY_BACKOFF_CONTROLLER_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>

namespace ferry {
namespace uploader {

/**
 * Configuration for one backoff counter
 */
struct BackoffConfig {
  std::chrono::milliseconds initial_delay{1000};  // Value after reset
  std::chrono::milliseconds max_delay{60000};     // Cap (1 minute)
  double factor = 2.0;                            // Growth per next()
  bool jitter = false;                            // Randomize returned waits
  double jitter_factor = 0.2;                     // Jitter range: [1-factor, 1+factor]
};

/**
 * Exponential backoff counter with a ceiling
 *
 * next() returns the current wait and grows the stored value by `factor`
 * up to `max_delay`; reset() restores `initial_delay`. Jitter only affects
 * the returned value, never the stored one.
 *
 * Not thread-safe: owned by a single run loop.
 */
class BackoffCounter {
public:
  explicit BackoffCounter(const BackoffConfig& config = {})
      : config_(config)
      , current_(config.initial_delay)
      , rng_(std::random_device{}()) {}

  /**
   * Current wait, then grow the stored value
   */
  std::chrono::milliseconds next() {
    auto wait = current_;

    double grown = static_cast<double>(current_.count()) * config_.factor;
    grown = std::min(grown, static_cast<double>(config_.max_delay.count()));
    current_ = std::chrono::milliseconds(static_cast<int64_t>(grown));

    if (config_.jitter) {
      std::uniform_real_distribution<> dist(
        1.0 - config_.jitter_factor, 1.0 + config_.jitter_factor
      );
      double jittered = static_cast<double>(wait.count()) * dist(rng_);
      wait = std::chrono::milliseconds(static_cast<int64_t>(std::max(jittered, 1.0)));
    }
    return wait;
  }

  /**
   * Wait that the next call to next() would return (without jitter)
   */
  std::chrono::milliseconds peek() const {
    return current_;
  }

  void reset() {
    current_ = config_.initial_delay;
  }

  const BackoffConfig& config() const {
    return config_;
  }

private:
  BackoffConfig config_;
  std::chrono::milliseconds current_;
  std::mt19937 rng_;
};

/**
 * Two independent backoff counters used by the upload run loop:
 * - idle: the queue had work but this client claimed none of it
 * - error: a loop-level operation failed
 */
class BackoffController {
public:
  BackoffController(const BackoffConfig& idle, const BackoffConfig& error)
      : idle_(idle)
      , error_(error) {}

  std::chrono::milliseconds nextIdle() {
    return idle_.next();
  }

  std::chrono::milliseconds nextError() {
    return error_.next();
  }

  void resetIdle() {
    idle_.reset();
  }

  void resetError() {
    error_.reset();
  }

  void reset() {
    idle_.reset();
    error_.reset();
  }

  const BackoffCounter& idle() const {
    return idle_;
  }

  const BackoffCounter& error() const {
    return error_;
  }

private:
  BackoffCounter idle_;
  BackoffCounter error_;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_BACKOFF_CONTROLLER_HPP
