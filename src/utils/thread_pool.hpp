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

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace kestrel::utils {

/// Fixed-size pool of jthreads consuming a FIFO task queue. Tasks that are
/// still queued when the pool shuts down are discarded; running tasks are
/// allowed to finish.
class ThreadPool {
  using TaskSignature = std::function<void()>;

 public:
  ThreadPool(size_t pool_size, std::string name);

  void AddTask(TaskSignature new_task);

  void ShutDown();

  /// Blocks until every task added so far has finished running.
  void AwaitIdle();

  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool(ThreadPool &&) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;
  ThreadPool &operator=(ThreadPool &&) = delete;

  size_t UnfinishedTasksNum() const;

 private:
  void ThreadLoop(std::stop_token token);

  std::string name_;

  std::mutex pool_lock_;
  std::condition_variable_any queue_cv_;
  std::condition_variable idle_cv_;

  std::queue<TaskSignature> task_queue_;
  std::stop_source pool_stop_source_;  //<! Common stop source for all the jthreads in `thread_pool_`

  std::vector<std::jthread> thread_pool_;

  std::atomic<size_t> unfinished_tasks_num_{0};
};

}  // namespace kestrel::utils
