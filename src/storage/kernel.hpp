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
#include <cstdint>
#include <memory>
#include <mutex>

#include "storage/config.hpp"
#include "storage/constraints/constraint_index_creator.hpp"
#include "storage/constraints/constraint_semantics.hpp"
#include "storage/graph_store.hpp"
#include "storage/indices/indexing_service.hpp"
#include "storage/locks/lock_manager.hpp"
#include "storage/schema_store.hpp"
#include "storage/txn/kernel_transaction.hpp"
#include "storage/txn/transaction_state.hpp"

namespace kestrel::storage {

/**
 * Entry point of the storage kernel. Owns the committed graph and schema,
 * the indexes, the lock manager and the constraint rules, and hands out
 * transactions that read and write them.
 *
 * Every transaction must be committed, rolled back or destroyed before the
 * kernel is destroyed.
 */
class Kernel final {
 public:
  explicit Kernel(Config config = {});
  Kernel(Config config, std::unique_ptr<ConstraintSemantics> constraint_semantics);

  Kernel(const Kernel &) = delete;
  Kernel &operator=(const Kernel &) = delete;
  Kernel(Kernel &&) = delete;
  Kernel &operator=(Kernel &&) = delete;
  ~Kernel();

  std::unique_ptr<KernelTransaction> BeginTransaction(TransactionType type = TransactionType::EXPLICIT);

  const Config &config() const { return config_; }
  GraphStore &store() { return store_; }
  SchemaStore &schema() { return schema_; }
  IndexingService &indexing() { return indexing_; }
  locks::LockManager &lock_manager() { return lock_manager_; }
  const ConstraintSemantics &constraint_semantics() const { return *constraint_semantics_; }
  ConstraintIndexCreator &constraint_index_creator() { return constraint_index_creator_; }

  /// Merges a validated transaction: schema rules first, then the index
  /// services those rules start or stop, then the data and its index updates.
  /// Commits are serialized.
  void ApplyCommit(const TransactionState &state);

 private:
  Config config_;
  GraphStore store_;
  SchemaStore schema_;
  IndexingService indexing_;
  locks::LockManager lock_manager_;
  std::unique_ptr<ConstraintSemantics> constraint_semantics_;
  ConstraintIndexCreator constraint_index_creator_;

  std::mutex commit_mutex_;
  std::atomic<uint64_t> next_transaction_id_{1};
};

}  // namespace kestrel::storage
