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

#include <chrono>
#include <cstdint>

namespace kestrel::storage {

/// Pass this class to the \ref Kernel constructor to change the behavior of
/// the kernel. This class also defines the default behavior.
struct Config {
  struct Locks {
    // Zero means that lock acquisition waits until the lock is granted or the
    // transaction is terminated.
    std::chrono::milliseconds acquisition_timeout{std::chrono::seconds(60)};
    // How often a blocked acquisition checks whether its transaction was terminated.
    std::chrono::milliseconds poll_interval{10};
  } locks;

  struct Indices {
    uint64_t population_threads{2};
    // Zero means that constraint creation waits for population without a bound.
    std::chrono::milliseconds population_await_timeout{0};
    std::chrono::milliseconds population_poll_interval{10};
  } indices;

  struct Constraints {
    bool validate_existence_on_commit{true};
  } constraints;
};

}  // namespace kestrel::storage
