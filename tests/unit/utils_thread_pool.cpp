// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.
#include <gtest/gtest.h>

#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "utils/thread_pool.hpp"

using namespace std::chrono_literals;

TEST(ThreadPool, Basic) {
  static constexpr size_t adder_count = 100000;
  static constexpr std::array<size_t, 4> pool_sizes{1, 2, 4, 8};

  for (const auto pool_size : pool_sizes) {
    kestrel::utils::ThreadPool pool{pool_size, "test-pool"};

    std::atomic<size_t> count{0};
    for (size_t i = 0; i < adder_count; ++i) {
      pool.AddTask([&] { count.fetch_add(1); });
    }

    pool.AwaitIdle();
    ASSERT_EQ(pool.UnfinishedTasksNum(), 0);
    ASSERT_EQ(count.load(), adder_count);
  }
}

TEST(ThreadPool, AwaitIdleWaitsForRunningTasks) {
  kestrel::utils::ThreadPool pool{2, "test-pool"};
  std::atomic<int> finished{0};
  for (int i = 0; i < 4; ++i) {
    pool.AddTask([&] {
      std::this_thread::sleep_for(20ms);
      finished.fetch_add(1);
    });
  }
  pool.AwaitIdle();
  ASSERT_EQ(finished.load(), 4);
}

TEST(ThreadPool, ShutDownDiscardsQueuedTasks) {
  std::atomic<int> executed{0};
  {
    kestrel::utils::ThreadPool pool{1, "test-pool"};
    std::atomic<bool> release{false};
    pool.AddTask([&] {
      while (!release.load()) std::this_thread::sleep_for(1ms);
      executed.fetch_add(1);
    });
    for (int i = 0; i < 10; ++i) {
      pool.AddTask([&] { executed.fetch_add(1); });
    }
    std::jthread releaser([&] {
      std::this_thread::sleep_for(20ms);
      release.store(true);
    });
    pool.ShutDown();
  }
  // The running task finishes, queued ones may never start.
  ASSERT_GE(executed.load(), 1);
  ASSERT_LE(executed.load(), 11);
}
