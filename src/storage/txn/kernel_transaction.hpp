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
#include <shared_mutex>
#include <string>

#include "storage/locks/lock_manager.hpp"
#include "storage/txn/state_view.hpp"
#include "storage/txn/transaction_state.hpp"
#include "utils/synchronized.hpp"

namespace kestrel::storage {

class Kernel;
class Operations;
class EntityWrite;
class SchemaWrite;

/// Implicit transactions are opened by the kernel itself, e.g. to commit the
/// index rule backing a constraint while the caller's transaction stays open.
enum class TransactionType : uint8_t { EXPLICIT, IMPLICIT };

/**
 * A unit of work against the kernel. Owns the transaction state, the lock
 * client and the operations used to mutate the graph and the schema. All of
 * them live from BeginTransaction until Commit or Rollback; a transaction
 * destroyed while open is rolled back.
 */
class KernelTransaction final {
 public:
  KernelTransaction(Kernel *kernel, uint64_t id, TransactionType type);

  KernelTransaction(const KernelTransaction &) = delete;
  KernelTransaction &operator=(const KernelTransaction &) = delete;
  KernelTransaction(KernelTransaction &&) = delete;
  KernelTransaction &operator=(KernelTransaction &&) = delete;
  ~KernelTransaction();

  uint64_t id() const { return id_; }
  TransactionType type() const { return type_; }

  Operations &operations() { return *operations_; }
  EntityWrite &data_write();
  SchemaWrite &schema_write();

  const StateView &view() const { return view_; }
  TransactionState &state() { return state_; }
  const TransactionState &state() const { return state_; }
  locks::LockClient &locks() { return *locks_; }

  /// @throw TransactionTerminatedException if the transaction was marked for termination.
  /// @throw NotInTransactionException if the transaction was committed or rolled back.
  void AssertOpen() const;

  /// @throw TransactionTerminatedException if the transaction was marked for termination.
  void CheckTermination() const;

  bool IsOpen() const { return open_; }
  bool IsTerminated() const { return terminated_.load(std::memory_order_acquire); }

  /// Asks the transaction to stop. Operations in flight, lock waits and waits
  /// for index population notice it and fail. Safe to call from any thread.
  void MarkForTermination(std::string reason);

  /// Validates and applies the changes, then releases every lock. The
  /// transaction is closed afterwards, whether the commit succeeded or not.
  /// @throw ConstraintViolationTransactionFailureException
  /// @throw TransactionTerminatedException
  /// @throw NotInTransactionException
  void Commit();

  /// Discards the changes and releases every lock.
  /// @throw NotInTransactionException
  void Rollback();

 private:
  void ValidateDeletions() const;
  void Close();

  Kernel *kernel_;
  uint64_t id_;
  TransactionType type_;

  TransactionState state_;
  StateView view_;
  std::unique_ptr<locks::LockClient> locks_;
  std::unique_ptr<Operations> operations_;

  bool open_{true};
  std::atomic<bool> terminated_{false};
  utils::Synchronized<std::string, std::shared_mutex> termination_reason_;
};

}  // namespace kestrel::storage
