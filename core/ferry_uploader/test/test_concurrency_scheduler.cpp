// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for ConcurrencyScheduler
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "concurrency_scheduler.hpp"

using namespace ferry::uploader;

TEST(ConcurrencySchedulerTest, ZeroCapacityTreatedAsOne) {
  ConcurrencyScheduler scheduler(0);
  EXPECT_EQ(scheduler.capacity(), 1u);
}

TEST(ConcurrencySchedulerTest, WaitIdleOnEmptySchedulerReturns) {
  ConcurrencyScheduler scheduler(3);
  EXPECT_NO_THROW(scheduler.waitIdle());
  EXPECT_EQ(scheduler.outstanding(), 0u);
}

TEST(ConcurrencySchedulerTest, RunsEveryJobBeforeIdle) {
  ConcurrencyScheduler scheduler(3);
  std::atomic<int> ran{0};

  for (int i = 0; i < 20; ++i) {
    ASSERT_TRUE(scheduler.submit([&ran] {
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
      ++ran;
    }));
  }
  scheduler.waitIdle();

  EXPECT_EQ(ran.load(), 20);
  EXPECT_EQ(scheduler.outstanding(), 0u);
}

TEST(ConcurrencySchedulerTest, NeverExceedsCapacity) {
  constexpr size_t kCapacity = 3;
  ConcurrencyScheduler scheduler(kCapacity);
  std::atomic<int> running{0};
  std::atomic<int> peak{0};

  for (int i = 0; i < 30; ++i) {
    scheduler.submit([&] {
      int now = ++running;
      int prev = peak.load();
      while (now > prev && !peak.compare_exchange_weak(prev, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      --running;
    });
  }
  scheduler.waitIdle();

  EXPECT_LE(peak.load(), static_cast<int>(kCapacity));
  EXPECT_GE(peak.load(), 2);
}

TEST(ConcurrencySchedulerTest, FifoAdmissionWithSingleWorker) {
  ConcurrencyScheduler scheduler(1);
  std::mutex mutex;
  std::vector<int> order;

  for (int i = 0; i < 5; ++i) {
    scheduler.submit([&, i] {
      std::lock_guard<std::mutex> lock(mutex);
      order.push_back(i);
    });
  }
  scheduler.waitIdle();

  EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(ConcurrencySchedulerTest, WaitIdleRethrowsFirstJobErrorOnce) {
  ConcurrencyScheduler scheduler(2);
  std::atomic<int> ran{0};

  scheduler.submit([] {
    throw std::runtime_error("job failed");
  });
  scheduler.submit([&ran] {
    ++ran;
  });

  EXPECT_THROW(scheduler.waitIdle(), std::runtime_error);
  EXPECT_EQ(ran.load(), 1);

  // Error is cleared and workers keep running
  EXPECT_NO_THROW(scheduler.waitIdle());
  EXPECT_TRUE(scheduler.submit([&ran] {
    ++ran;
  }));
  scheduler.waitIdle();
  EXPECT_EQ(ran.load(), 2);
}

TEST(ConcurrencySchedulerTest, ShutdownDrainsQueueAndRejectsNewJobs) {
  ConcurrencyScheduler scheduler(1);
  std::atomic<int> ran{0};

  for (int i = 0; i < 5; ++i) {
    scheduler.submit([&ran] {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      ++ran;
    });
  }
  scheduler.shutdown();

  EXPECT_EQ(ran.load(), 5);
  EXPECT_FALSE(scheduler.submit([] {}));
  EXPECT_NO_THROW(scheduler.shutdown());
}

TEST(ConcurrencySchedulerTest, IsWorkerThreadOnlyInsideOwnJobs) {
  ConcurrencyScheduler scheduler(2);
  ConcurrencyScheduler other(1);
  std::atomic<bool> inside_own{false};
  std::atomic<bool> inside_other{true};

  EXPECT_FALSE(scheduler.isWorkerThread());
  scheduler.submit([&] {
    inside_own = scheduler.isWorkerThread();
    inside_other = other.isWorkerThread();
  });
  scheduler.waitIdle();

  EXPECT_TRUE(inside_own.load());
  EXPECT_FALSE(inside_other.load());
}
