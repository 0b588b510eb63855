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

#include <mutex>
#include <shared_mutex>
#include <utility>

namespace kestrel::utils {

/**
 * Keeps an object together with the reader-writer mutex that guards it. The
 * object is reachable only through a guard, exclusive for writers and shared
 * for readers:
 *
 *   Synchronized<std::map<IndexId, IndexRule>> rules_;
 *   rules_.WithLock([&](auto &rules) { rules.emplace(id, rule); });
 *   auto found = rules_.WithReadLock([&](const auto &rules) { return rules.contains(id); });
 */
template <class T, class TMutex = std::shared_mutex>
class Synchronized {
 public:
  template <class... Args>
  explicit Synchronized(Args &&...args) : object_(std::forward<Args>(args)...) {}

  Synchronized(const Synchronized &) = delete;
  Synchronized(Synchronized &&) = delete;
  Synchronized &operator=(const Synchronized &) = delete;
  Synchronized &operator=(Synchronized &&) = delete;
  ~Synchronized() = default;

  /// Pointer-like guard that holds the lock for its lifetime.
  template <class TObject, class TLock>
  class Guarded {
   public:
    Guarded(TObject *object, TMutex &mutex) : object_(object), lock_(mutex) {}

    TObject *operator->() const { return object_; }
    TObject &operator*() const { return *object_; }

   private:
    TObject *object_;
    TLock lock_;
  };

  using LockedPtr = Guarded<T, std::unique_lock<TMutex>>;
  using ReadLockedPtr = Guarded<const T, std::shared_lock<TMutex>>;

  LockedPtr Lock() { return LockedPtr(&object_, mutex_); }
  ReadLockedPtr ReadLock() const { return ReadLockedPtr(&object_, mutex_); }

  template <class TCallable>
  decltype(auto) WithLock(TCallable &&callable) {
    auto locked = Lock();
    return std::forward<TCallable>(callable)(*locked);
  }

  template <class TCallable>
  decltype(auto) WithReadLock(TCallable &&callable) const {
    auto locked = ReadLock();
    return std::forward<TCallable>(callable)(*locked);
  }

 private:
  T object_;
  mutable TMutex mutex_;
};

}  // namespace kestrel::utils
