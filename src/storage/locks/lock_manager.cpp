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
#include "storage/locks/lock_manager.hpp"

#include "storage/exceptions.hpp"
#include "utils/logging.hpp"

namespace kestrel::storage::locks {

std::unique_ptr<LockClient> LockManager::NewClient() {
  return std::make_unique<LockClient>(this, next_client_id_.fetch_add(1, std::memory_order_acq_rel));
}

size_t LockManager::ActiveLockCount() const {
  auto guard = std::lock_guard{mutex_};
  return locks_.size();
}

bool LockManager::TryGrant(const LockKey &key, const uint64_t client_id, const LockMode mode) {
  auto &entry = locks_[key];
  switch (mode) {
    case LockMode::SHARED: {
      if (entry.exclusive_count > 0 && entry.exclusive_holder != client_id) return false;
      ++entry.shared_holders[client_id];
      return true;
    }
    case LockMode::EXCLUSIVE: {
      if (entry.exclusive_count > 0 && entry.exclusive_holder != client_id) return false;
      // Other shared holders block the exclusive lock, our own shared lock gets upgraded.
      for (const auto &[holder, count] : entry.shared_holders) {
        if (holder != client_id) return false;
      }
      entry.exclusive_holder = client_id;
      ++entry.exclusive_count;
      return true;
    }
  }
  return false;
}

void LockManager::Release(const LockKey &key, const uint64_t client_id, const LockMode mode) {
  {
    auto guard = std::lock_guard{mutex_};
    auto it = locks_.find(key);
    KS_ASSERT(it != locks_.end(), "Releasing {} lock on {}({}) which is not held", LockModeToString(mode),
              ResourceTypeToString(key.first), key.second);
    auto &entry = it->second;
    switch (mode) {
      case LockMode::SHARED: {
        auto holder = entry.shared_holders.find(client_id);
        KS_ASSERT(holder != entry.shared_holders.end() && holder->second > 0, "Client {} holds no shared lock",
                  client_id);
        if (--holder->second == 0) entry.shared_holders.erase(holder);
        break;
      }
      case LockMode::EXCLUSIVE: {
        KS_ASSERT(entry.exclusive_holder == client_id && entry.exclusive_count > 0,
                  "Client {} holds no exclusive lock", client_id);
        if (--entry.exclusive_count == 0) entry.exclusive_holder = 0;
        break;
      }
    }
    if (entry.exclusive_count == 0 && entry.shared_holders.empty()) {
      locks_.erase(it);
    }
  }
  cv_.notify_all();
}

LockClient::~LockClient() { Close(); }

void LockClient::AcquireShared(const ResourceType type, const uint64_t resource_id) {
  Acquire(type, resource_id, LockMode::SHARED, true);
}

void LockClient::AcquireExclusive(const ResourceType type, const uint64_t resource_id) {
  Acquire(type, resource_id, LockMode::EXCLUSIVE, true);
}

void LockClient::AcquireExclusiveUninterruptibly(const ResourceType type, const uint64_t resource_id) {
  Acquire(type, resource_id, LockMode::EXCLUSIVE, false);
}

void LockClient::Acquire(const ResourceType type, const uint64_t resource_id, const LockMode mode,
                         const bool interruptible) {
  // The owning transaction was committed or rolled back.
  if (closed_) throw NotInTransactionException();
  const LockManager::LockKey key{type, resource_id};
  const auto &config = manager_->config_;
  const auto deadline = std::chrono::steady_clock::now() + config.acquisition_timeout;
  {
    auto lock = std::unique_lock{manager_->mutex_};
    while (!manager_->TryGrant(key, client_id_, mode)) {
      if (config.acquisition_timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline) {
        spdlog::debug("Client {} timed out waiting for {} lock on {}({})", client_id_, LockModeToString(mode),
                      ResourceTypeToString(type), resource_id);
        throw LockAcquisitionTimeoutException(type, resource_id, mode, config.acquisition_timeout);
      }
      manager_->cv_.wait_for(lock, config.poll_interval);
      if (interruptible && interrupt_check_) {
        lock.unlock();
        interrupt_check_();
        lock.lock();
      }
    }
  }
  auto &counts = held_[key];
  if (mode == LockMode::SHARED) {
    ++counts.shared;
  } else {
    ++counts.exclusive;
  }
  if (tracer_) tracer_->OnAcquired(type, resource_id, mode);
}

void LockClient::ReleaseShared(const ResourceType type, const uint64_t resource_id) {
  const LockManager::LockKey key{type, resource_id};
  auto it = held_.find(key);
  KS_ASSERT(it != held_.end() && it->second.shared > 0, "Releasing shared lock on {}({}) which is not held",
            ResourceTypeToString(type), resource_id);
  manager_->Release(key, client_id_, LockMode::SHARED);
  if (--it->second.shared == 0 && it->second.exclusive == 0) held_.erase(it);
}

void LockClient::ReleaseExclusive(const ResourceType type, const uint64_t resource_id) {
  const LockManager::LockKey key{type, resource_id};
  auto it = held_.find(key);
  KS_ASSERT(it != held_.end() && it->second.exclusive > 0, "Releasing exclusive lock on {}({}) which is not held",
            ResourceTypeToString(type), resource_id);
  manager_->Release(key, client_id_, LockMode::EXCLUSIVE);
  if (--it->second.exclusive == 0 && it->second.shared == 0) held_.erase(it);
}

uint64_t LockClient::ReleaseAllExclusive(const ResourceType type, const uint64_t resource_id) {
  auto it = held_.find({type, resource_id});
  if (it == held_.end()) return 0;
  const auto released = it->second.exclusive;
  for (uint64_t i = 0; i < released; ++i) manager_->Release(it->first, client_id_, LockMode::EXCLUSIVE);
  it->second.exclusive = 0;
  if (it->second.shared == 0) held_.erase(it);
  return released;
}

bool LockClient::HoldsShared(const ResourceType type, const uint64_t resource_id) const {
  auto it = held_.find({type, resource_id});
  return it != held_.end() && it->second.shared > 0;
}

bool LockClient::HoldsExclusive(const ResourceType type, const uint64_t resource_id) const {
  auto it = held_.find({type, resource_id});
  return it != held_.end() && it->second.exclusive > 0;
}

void LockClient::Close() {
  if (closed_) return;
  closed_ = true;
  for (const auto &[key, counts] : held_) {
    for (uint64_t i = 0; i < counts.exclusive; ++i) manager_->Release(key, client_id_, LockMode::EXCLUSIVE);
    for (uint64_t i = 0; i < counts.shared; ++i) manager_->Release(key, client_id_, LockMode::SHARED);
  }
  held_.clear();
}

}  // namespace kestrel::storage::locks
