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

#include "flags/storage.hpp"

#include "utils/flag_validation.hpp"

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_uint64(storage_lock_acquisition_timeout_sec, 60,
              "Maximum time a transaction waits for an entity or schema lock before failing. 0 waits forever.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_uint64(storage_lock_poll_interval_ms, 10,
                        "How often a blocked lock acquisition checks for transaction termination.",
                        FLAG_IN_RANGE(1, 1000));
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_uint64(storage_index_population_threads, 2, "Number of threads used to populate new indexes.",
                        FLAG_IN_RANGE(1, 64));
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_uint64(storage_index_population_await_timeout_sec, 0,
              "Maximum time a constraint creation waits for its backing index to populate. 0 waits without a bound.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_bool(storage_validate_existence_constraints_on_commit, true,
            "Check existence and node key constraints for entities touched by a transaction when it commits.");

kestrel::storage::Config kestrel::flags::StorageConfigFromFlags() {
  storage::Config config;
  config.locks.acquisition_timeout = std::chrono::seconds(FLAGS_storage_lock_acquisition_timeout_sec);
  config.locks.poll_interval = std::chrono::milliseconds(FLAGS_storage_lock_poll_interval_ms);
  config.indices.population_threads = FLAGS_storage_index_population_threads;
  config.indices.population_await_timeout = std::chrono::seconds(FLAGS_storage_index_population_await_timeout_sec);
  config.constraints.validate_existence_on_commit = FLAGS_storage_validate_existence_constraints_on_commit;
  return config;
}
