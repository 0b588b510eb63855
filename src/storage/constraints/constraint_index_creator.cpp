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
#include "storage/constraints/constraint_index_creator.hpp"

#include <exception>
#include <vector>

#include "storage/exceptions.hpp"
#include "storage/kernel.hpp"
#include "storage/schema_rules.hpp"
#include "storage/txn/kernel_transaction.hpp"
#include "utils/logging.hpp"

namespace kestrel::storage {

namespace {

std::optional<IndexEntryConflict> ConflictOf(const std::exception_ptr &cause) {
  if (!cause) return std::nullopt;
  try {
    std::rethrow_exception(cause);
  } catch (const IndexEntryConflictException &e) {
    return e.conflict();
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

}  // namespace

IndexId ConstraintIndexCreator::CreateUniquenessConstraintIndex(KernelTransaction &transaction,
                                                                const ConstraintDescriptor &constraint) {
  CreationState state{.constraint = constraint, .index = std::nullopt, .released_label_holds = 0};
  try {
    state.index = GetOrCreateUniquenessConstraintIndex(transaction, constraint);
  } catch (const AlreadyConstrainedException &) {
    throw;
  } catch (const SchemaKernelException &) {
    throw CreateConstraintFailureException(constraint, std::current_exception());
  }

  try {
    return PopulateAndVerify(transaction, state);
  } catch (const KernelException &e) {
    spdlog::debug("Creating the index for {} failed: {}", constraint.ToString(), e.what());
    Compensate(transaction, state);
    throw;
  }
}

IndexReference ConstraintIndexCreator::GetOrCreateUniquenessConstraintIndex(KernelTransaction &transaction,
                                                                            const ConstraintDescriptor &constraint) {
  const auto &view = transaction.view();
  const auto &schema = constraint.schema();
  if (auto existing = view.IndexGetForSchema(schema)) {
    if (!existing->IsUnique()) {
      throw AlreadyIndexedException(schema, OperationContext::CONSTRAINT_CREATION);
    }
    if (view.IndexGetOwningConstraint(*existing)) {
      throw AlreadyConstrainedException(constraint, OperationContext::CONSTRAINT_CREATION);
    }
    // Left over by a constraint creation that did not finish.
    spdlog::debug("Reusing unowned unique index {} for {}", existing->id().AsUint(), constraint.ToString());
    return *existing;
  }
  return CreateConstraintIndex(schema);
}

IndexReference ConstraintIndexCreator::CreateConstraintIndex(const SchemaDescriptor &schema) {
  auto transaction = kernel_->BeginTransaction(TransactionType::IMPLICIT);
  IndexRule rule{.id = kernel_->schema().ReserveIndexId(), .schema = schema, .unique = true, .owning_constraint = {}};
  auto reference = rule.Reference();
  transaction->state().IndexRuleDoAdd(std::move(rule));
  transaction->Commit();
  spdlog::debug("Created unique index {} on {}", reference.id().AsUint(), schema.ToString());
  return reference;
}

IndexId ConstraintIndexCreator::PopulateAndVerify(KernelTransaction &transaction, CreationState &state) {
  const auto &constraint = state.constraint;
  const auto &index = *state.index;
  const auto label = constraint.schema().label().AsUint();
  auto &locks = transaction.locks();
  try {
    auto proxy = kernel_->indexing().GetIndexProxy(index.id());

    state.released_label_holds = locks.ReleaseAllExclusive(locks::ResourceType::LABEL, label);
    spdlog::debug("Waiting for population of index {} backing {}", index.id().AsUint(), constraint.ToString());
    AwaitConstraintIndexPopulation(transaction, constraint, *proxy);

    for (; state.released_label_holds > 0; --state.released_label_holds) {
      locks.AcquireExclusive(locks::ResourceType::LABEL, label);
    }
    kernel_->indexing().GetIndexProxy(index.id())->VerifyDeferredConstraints();
    spdlog::debug("Index {} backing {} verified", index.id().AsUint(), constraint.ToString());
    return index.id();
  } catch (const IndexNotFoundKernelException &) {
    throw TransactionFailureException(
        fmt::format("Index ({}) that we just created does not exist.", index.schema().ToString()),
        std::current_exception());
  } catch (const IndexEntryConflictException &e) {
    throw UniquePropertyValueValidationException(constraint, ConstraintValidationPhase::VERIFICATION,
                                                 std::vector<IndexEntryConflict>{e.conflict()});
  } catch (const TransactionTerminatedException &) {
    throw CreateConstraintFailureException(constraint, std::current_exception());
  } catch (const LockAcquisitionTimeoutException &) {
    throw CreateConstraintFailureException(constraint, std::current_exception());
  }
}

void ConstraintIndexCreator::AwaitConstraintIndexPopulation(KernelTransaction &transaction,
                                                            const ConstraintDescriptor &constraint,
                                                            const IndexProxy &proxy) const {
  const auto &config = kernel_->config().indices;
  bool completed = false;
  try {
    completed = proxy.AwaitStoreScanCompleted([&transaction] { transaction.CheckTermination(); },
                                              config.population_await_timeout, config.population_poll_interval);
  } catch (const IndexPopulationFailedException &e) {
    if (auto conflict = ConflictOf(e.cause())) {
      throw UniquePropertyValueValidationException(constraint, ConstraintValidationPhase::VERIFICATION,
                                                   std::vector<IndexEntryConflict>{*conflict});
    }
    throw UniquePropertyValueValidationException(constraint, ConstraintValidationPhase::VERIFICATION,
                                                 std::current_exception());
  }
  if (!completed) {
    throw CreateConstraintFailureException(
        constraint, std::make_exception_ptr(TransactionFailureException(
                        fmt::format("Timed out after {} ms waiting for the population of index {}.",
                                    config.population_await_timeout.count(), proxy.schema().ToString()),
                        nullptr, Status::TRANSIENT_ERROR)));
  }
}

void ConstraintIndexCreator::Compensate(KernelTransaction &transaction, CreationState &state) {
  for (; state.released_label_holds > 0; --state.released_label_holds) {
    transaction.locks().AcquireExclusiveUninterruptibly(locks::ResourceType::LABEL,
                                                        state.constraint.schema().label().AsUint());
  }
  if (state.index && IndexStillExists(transaction, *state.index)) {
    spdlog::warn("Dropping index {} after the creation of {} failed", state.index->id().AsUint(),
                 state.constraint.ToString());
    DropUniquenessConstraintIndex(*state.index);
  }
}

bool ConstraintIndexCreator::IndexStillExists(const KernelTransaction &transaction,
                                              const IndexReference &index) const {
  const auto &view = transaction.view();
  auto existing = view.IndexGetForSchema(index.schema());
  return existing && existing->id() == index.id() && existing->IsUnique() && !view.IndexGetOwningConstraint(*existing);
}

void ConstraintIndexCreator::DropUniquenessConstraintIndex(const IndexReference &index) {
  auto transaction = kernel_->BeginTransaction(TransactionType::IMPLICIT);
  transaction->state().IndexDoDrop(index);
  transaction->Commit();
}

}  // namespace kestrel::storage
