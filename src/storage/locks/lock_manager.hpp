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
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

#include "storage/config.hpp"
#include "storage/locks/resource_types.hpp"

namespace kestrel::storage::locks {

class LockClient;

/**
 * Process wide table of shared and exclusive locks keyed by resource type and
 * resource id. Locks are taken and released through a LockClient, one per
 * transaction. There is no deadlock detection: a blocked acquisition gives up
 * after the configured timeout.
 */
class LockManager final {
 public:
  explicit LockManager(Config::Locks config) : config_(config) {}

  LockManager(const LockManager &) = delete;
  LockManager &operator=(const LockManager &) = delete;
  LockManager(LockManager &&) = delete;
  LockManager &operator=(LockManager &&) = delete;
  ~LockManager() = default;

  std::unique_ptr<LockClient> NewClient();

  /// Number of resources currently locked by any client.
  size_t ActiveLockCount() const;

 private:
  friend class LockClient;

  using LockKey = std::pair<ResourceType, uint64_t>;

  struct LockEntry {
    // client id -> re-entrancy count
    std::map<uint64_t, uint64_t> shared_holders;
    uint64_t exclusive_holder{0};
    uint64_t exclusive_count{0};
  };

  /// Grants the lock if it is compatible with the current holders. Called with mutex_ held.
  bool TryGrant(const LockKey &key, uint64_t client_id, LockMode mode);
  void Release(const LockKey &key, uint64_t client_id, LockMode mode);

  Config::Locks config_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<LockKey, LockEntry> locks_;

  std::atomic<uint64_t> next_client_id_{1};
};

/**
 * Handle through which one transaction takes locks. Locks are re-entrant per
 * client and are all released when the client is closed or destroyed. A
 * shared lock is upgraded to an exclusive one when the client is the only
 * holder.
 */
class LockClient final {
 public:
  LockClient(LockManager *manager, uint64_t client_id) : manager_(manager), client_id_(client_id) {}

  LockClient(const LockClient &) = delete;
  LockClient &operator=(const LockClient &) = delete;
  LockClient(LockClient &&) = delete;
  LockClient &operator=(LockClient &&) = delete;
  ~LockClient();

  /// Check invoked while waiting for a lock. It is expected to throw when the
  /// owning transaction was terminated.
  void SetInterruptCheck(std::function<void()> check) { interrupt_check_ = std::move(check); }
  void SetTracer(LockTracer *tracer) { tracer_ = tracer; }

  /// @throw LockAcquisitionTimeoutException
  /// @throw TransactionTerminatedException through the interrupt check
  /// @throw NotInTransactionException once the client is closed
  void AcquireShared(ResourceType type, uint64_t resource_id);
  void AcquireExclusive(ResourceType type, uint64_t resource_id);

  /// Acquires an exclusive lock without consulting the interrupt check. Used
  /// by cleanup paths that must run even for terminated transactions.
  void AcquireExclusiveUninterruptibly(ResourceType type, uint64_t resource_id);

  void ReleaseShared(ResourceType type, uint64_t resource_id);
  void ReleaseExclusive(ResourceType type, uint64_t resource_id);
  /// Drops every re-entrant exclusive hold on the resource and returns how
  /// many there were. Shared holds are kept.
  uint64_t ReleaseAllExclusive(ResourceType type, uint64_t resource_id);

  bool HoldsShared(ResourceType type, uint64_t resource_id) const;
  bool HoldsExclusive(ResourceType type, uint64_t resource_id) const;

  /// Releases every lock held by this client.
  void Close();

  uint64_t id() const { return client_id_; }

 private:
  struct HeldCounts {
    uint64_t shared{0};
    uint64_t exclusive{0};
  };

  void Acquire(ResourceType type, uint64_t resource_id, LockMode mode, bool interruptible);

  LockManager *manager_;
  uint64_t client_id_;
  std::function<void()> interrupt_check_;
  LockTracer *tracer_{nullptr};
  std::map<LockManager::LockKey, HeldCounts> held_;
  bool closed_{false};
};

}  // namespace kestrel::storage::locks
