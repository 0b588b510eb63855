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
#include "storage/kernel.hpp"

#include "utils/logging.hpp"

namespace kestrel::storage {

Kernel::Kernel(Config config) : Kernel(config, std::make_unique<StandardConstraintSemantics>()) {}

Kernel::Kernel(Config config, std::unique_ptr<ConstraintSemantics> constraint_semantics)
    : config_(config),
      indexing_(config_.indices, &store_),
      lock_manager_(config_.locks),
      constraint_semantics_(std::move(constraint_semantics)),
      constraint_index_creator_(this) {
  KS_ASSERT(constraint_semantics_ != nullptr, "The kernel requires constraint semantics");
  spdlog::info("Storage kernel started with {} index population thread(s)", config_.indices.population_threads);
}

Kernel::~Kernel() { spdlog::debug("Storage kernel shutting down"); }

std::unique_ptr<KernelTransaction> Kernel::BeginTransaction(const TransactionType type) {
  return std::make_unique<KernelTransaction>(this, next_transaction_id_.fetch_add(1, std::memory_order_acq_rel),
                                             type);
}

void Kernel::ApplyCommit(const TransactionState &state) {
  auto guard = std::lock_guard{commit_mutex_};
  auto schema_changes = schema_.Apply(state);
  for (const auto index : schema_changes.dropped_indexes) {
    indexing_.DropIndex(index);
  }
  for (const auto &rule : schema_changes.created_indexes) {
    indexing_.CreateIndex(rule);
  }
  store_.Apply(state, [this](const std::vector<NodeUpdate> &updates) { indexing_.ApplyUpdates(updates); });
}

}  // namespace kestrel::storage
