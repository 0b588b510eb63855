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
#include "storage/txn/kernel_transaction.hpp"

#include "storage/exceptions.hpp"
#include "storage/kernel.hpp"
#include "storage/ops/operations.hpp"
#include "utils/logging.hpp"
#include "utils/on_scope_exit.hpp"

namespace kestrel::storage {

KernelTransaction::KernelTransaction(Kernel *kernel, const uint64_t id, const TransactionType type)
    : kernel_(kernel),
      id_(id),
      type_(type),
      view_(&kernel->store(), &kernel->schema(), &kernel->indexing(), &state_),
      locks_(kernel->lock_manager().NewClient()) {
  locks_->SetInterruptCheck([this] { CheckTermination(); });
  operations_ = std::make_unique<Operations>(this, kernel_);
  spdlog::trace("Transaction {} ({}) started", id_, type_ == TransactionType::EXPLICIT ? "explicit" : "implicit");
}

KernelTransaction::~KernelTransaction() {
  if (open_) {
    spdlog::trace("Transaction {} closed without commit, rolling back", id_);
    Close();
  }
}

EntityWrite &KernelTransaction::data_write() { return operations_->data_write(); }

SchemaWrite &KernelTransaction::schema_write() { return operations_->schema_write(); }

void KernelTransaction::CheckTermination() const {
  if (IsTerminated()) {
    throw TransactionTerminatedException(*termination_reason_.ReadLock());
  }
}

void KernelTransaction::AssertOpen() const {
  CheckTermination();
  if (!open_) throw NotInTransactionException();
}

void KernelTransaction::MarkForTermination(std::string reason) {
  spdlog::debug("Transaction {} marked for termination: {}", id_, reason);
  *termination_reason_.Lock() = std::move(reason);
  terminated_.store(true, std::memory_order_release);
}

void KernelTransaction::ValidateDeletions() const {
  for (const auto node : state_.deleted_nodes()) {
    if (!view_.NodeRelationships(node).empty()) {
      throw ConstraintViolationTransactionFailureException(
          fmt::format("Cannot delete node<{}>, because it still has relationships. To delete this node, you must "
                      "first delete its relationships.",
                      node.AsUint()));
    }
  }
  for (const auto &[relationship, created] : state_.created_relationships()) {
    if (!view_.NodeExists(created.from) || !view_.NodeExists(created.to)) {
      throw ConstraintViolationTransactionFailureException(fmt::format(
          "Relationship {} connects a node that was deleted in the same transaction.", relationship.AsUint()));
    }
  }
}

void KernelTransaction::Commit() {
  AssertOpen();
  utils::OnScopeExit close_on_exit([this] { Close(); });

  if (!state_.HasChanges()) {
    spdlog::trace("Transaction {} committed without changes", id_);
    return;
  }
  ValidateDeletions();
  if (kernel_->config().constraints.validate_existence_on_commit) {
    kernel_->constraint_semantics().ValidateTransactionState(view_, state_);
  }
  kernel_->ApplyCommit(state_);
  spdlog::trace("Transaction {} committed", id_);
}

void KernelTransaction::Rollback() {
  if (!open_) throw NotInTransactionException();
  Close();
  spdlog::trace("Transaction {} rolled back", id_);
}

void KernelTransaction::Close() {
  open_ = false;
  state_ = TransactionState{};
  locks_->Close();
}

}  // namespace kestrel::storage
