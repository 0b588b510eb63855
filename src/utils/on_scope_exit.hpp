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

#include <type_traits>
#include <utility>

namespace kestrel::utils {

/**
 * Calls a function in its destructor, on every way out of a scope.
 *
 * void Commit() {
 *   OnScopeExit close_on_exit([this] { Close(); });
 *   Validate();  // may throw, the transaction is closed anyway
 *   Apply();
 * }
 */
template <typename Callable>
class [[nodiscard]] OnScopeExit {
 public:
  explicit OnScopeExit(Callable function) : function_(std::move(function)) {}
  OnScopeExit(const OnScopeExit &) = delete;
  OnScopeExit(OnScopeExit &&) = delete;
  OnScopeExit &operator=(const OnScopeExit &) = delete;
  OnScopeExit &operator=(OnScopeExit &&) = delete;
  ~OnScopeExit() {
    if (enabled_) function_();
  }

  /// Cancels the call, e.g. once the guarded work succeeded.
  void Disable() { enabled_ = false; }

 private:
  Callable function_;
  bool enabled_{true};
};

template <typename Callable>
OnScopeExit(Callable) -> OnScopeExit<std::decay_t<Callable>>;

}  // namespace kestrel::utils
