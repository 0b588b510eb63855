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
#include "storage/ops/schema_write.hpp"

#include <exception>

#include "storage/kernel.hpp"
#include "storage/locks/resource_types.hpp"
#include "storage/schema_rules.hpp"
#include "storage/txn/kernel_transaction.hpp"
#include "utils/logging.hpp"

namespace kestrel::storage {

using locks::ResourceType;

void SchemaWrite::AcquireExclusiveSchemaLock(const SchemaDescriptor &schema) {
  if (schema.IsNodeSchema()) {
    transaction_->locks().AcquireExclusive(ResourceType::LABEL, schema.label().AsUint());
  } else {
    transaction_->locks().AcquireExclusive(ResourceType::RELATIONSHIP_TYPE, schema.relationship_type().AsUint());
  }
}

void SchemaWrite::AssertNodeSchema(const SchemaDescriptor &schema, const OperationContext context) const {
  if (!schema.IsNodeSchema()) throw UnsupportedSchemaException(schema, context);
}

void SchemaWrite::AssertValidDescriptor(const SchemaDescriptor &schema, const OperationContext context) const {
  if (schema.HasRepeatedProperties()) throw RepeatedPropertyInCompositeSchemaException(schema, context);
}

void SchemaWrite::AssertIndexDoesNotExist(const OperationContext context, const SchemaDescriptor &schema) const {
  const auto &view = transaction_->view();
  auto existing = view.IndexGetForSchema(schema);
  if (!existing) return;
  if (existing->IsUnique()) {
    // A unique index without an owner is left over by a constraint creation
    // that did not finish; a new constraint may take it over.
    if (context != OperationContext::CONSTRAINT_CREATION || view.IndexGetOwningConstraint(*existing)) {
      throw AlreadyConstrainedException(ConstraintDescriptor::Uniqueness(schema), context);
    }
    return;
  }
  throw AlreadyIndexedException(schema, context);
}

void SchemaWrite::AssertConstraintDoesNotExist(const ConstraintDescriptor &constraint) const {
  if (transaction_->view().ConstraintExists(constraint)) {
    throw AlreadyConstrainedException(constraint, OperationContext::CONSTRAINT_CREATION);
  }
}

bool SchemaWrite::ConstraintExists(const ConstraintDescriptor &constraint) {
  AcquireExclusiveSchemaLock(constraint.schema());
  transaction_->AssertOpen();
  return transaction_->view().ConstraintExists(constraint);
}

IndexReference SchemaWrite::IndexCreate(const SchemaDescriptor &schema) {
  AssertNodeSchema(schema, OperationContext::INDEX_CREATION);
  AcquireExclusiveSchemaLock(schema);
  transaction_->AssertOpen();
  AssertValidDescriptor(schema, OperationContext::INDEX_CREATION);

  auto &state = transaction_->state();
  for (const auto &[id, dropped] : state.removed_indexes()) {
    if (dropped.schema() == schema && !dropped.IsUnique()) {
      auto reference = dropped;
      state.IndexDoUnRemove(reference);
      return reference;
    }
  }
  AssertIndexDoesNotExist(OperationContext::INDEX_CREATION, schema);

  IndexRule rule{.id = kernel_->schema().ReserveIndexId(), .schema = schema, .unique = false, .owning_constraint = {}};
  auto reference = rule.Reference();
  state.IndexRuleDoAdd(std::move(rule));
  spdlog::debug("Transaction {} creates index {}", transaction_->id(), reference.ToString());
  return reference;
}

std::pair<IndexReference, bool> SchemaWrite::IndexCreateIfMissing(const SchemaDescriptor &schema) {
  AssertNodeSchema(schema, OperationContext::INDEX_CREATION);
  AcquireExclusiveSchemaLock(schema);
  transaction_->AssertOpen();
  AssertValidDescriptor(schema, OperationContext::INDEX_CREATION);

  const auto &view = transaction_->view();
  if (auto existing = view.IndexGetForSchema(schema); existing && !existing->IsUnique()) {
    if (view.IndexGetState(*existing) == IndexState::FAILED) {
      throw FailedIndexException(schema, view.IndexGetFailure(*existing));
    }
    return {*existing, false};
  }
  return {IndexCreate(schema), true};
}

void SchemaWrite::IndexDrop(const IndexReference &index) {
  const auto &schema = index.schema();
  AssertNodeSchema(schema, OperationContext::INDEX_DROP);
  AcquireExclusiveSchemaLock(schema);
  transaction_->AssertOpen();

  const auto &view = transaction_->view();
  auto existing = view.IndexGetForSchema(schema);
  try {
    if (!existing) {
      throw NoSuchIndexException(schema);
    }
    if (existing->IsUnique() && view.IndexGetOwningConstraint(*existing)) {
      throw IndexBelongsToConstraintException(schema);
    }
  } catch (const SchemaKernelException &) {
    throw DropIndexFailureException(schema, std::current_exception());
  }
  transaction_->state().IndexDoDrop(*existing);
  spdlog::debug("Transaction {} drops index {}", transaction_->id(), existing->ToString());
}

ConstraintDescriptor SchemaWrite::UniquePropertyConstraintCreate(const SchemaDescriptor &schema) {
  AssertNodeSchema(schema, OperationContext::CONSTRAINT_CREATION);
  AcquireExclusiveSchemaLock(schema);
  transaction_->AssertOpen();

  AssertValidDescriptor(schema, OperationContext::CONSTRAINT_CREATION);
  auto constraint = ConstraintDescriptor::Uniqueness(schema);
  AssertConstraintDoesNotExist(constraint);
  AssertIndexDoesNotExist(OperationContext::CONSTRAINT_CREATION, schema);

  IndexBackedConstraintCreate(constraint);
  return constraint;
}

ConstraintDescriptor SchemaWrite::NodeKeyConstraintCreate(const SchemaDescriptor &schema) {
  AssertNodeSchema(schema, OperationContext::CONSTRAINT_CREATION);
  AcquireExclusiveSchemaLock(schema);
  transaction_->AssertOpen();

  AssertValidDescriptor(schema, OperationContext::CONSTRAINT_CREATION);
  auto constraint = ConstraintDescriptor::NodeKey(schema);
  AssertConstraintDoesNotExist(constraint);
  AssertIndexDoesNotExist(OperationContext::CONSTRAINT_CREATION, schema);

  kernel_->constraint_semantics().ValidateNodeKeyConstraint(transaction_->view(), constraint);
  IndexBackedConstraintCreate(constraint);
  return constraint;
}

ConstraintDescriptor SchemaWrite::NodePropertyExistenceConstraintCreate(const SchemaDescriptor &schema) {
  AssertNodeSchema(schema, OperationContext::CONSTRAINT_CREATION);
  AcquireExclusiveSchemaLock(schema);
  transaction_->AssertOpen();

  AssertValidDescriptor(schema, OperationContext::CONSTRAINT_CREATION);
  auto constraint = ConstraintDescriptor::NodeExistence(schema);
  AssertConstraintDoesNotExist(constraint);

  kernel_->constraint_semantics().ValidateNodePropertyExistenceConstraint(transaction_->view(), constraint);
  transaction_->state().ConstraintDoAdd(
      ConstraintRule{.id = kernel_->schema().ReserveConstraintId(), .descriptor = constraint, .owned_index = {}});
  spdlog::debug("Transaction {} creates {}", transaction_->id(), constraint.ToString());
  return constraint;
}

ConstraintDescriptor SchemaWrite::RelationshipPropertyExistenceConstraintCreate(const SchemaDescriptor &schema) {
  if (schema.IsNodeSchema()) throw UnsupportedSchemaException(schema, OperationContext::CONSTRAINT_CREATION);
  AcquireExclusiveSchemaLock(schema);
  transaction_->AssertOpen();

  AssertValidDescriptor(schema, OperationContext::CONSTRAINT_CREATION);
  auto constraint = ConstraintDescriptor::RelationshipExistence(schema);
  AssertConstraintDoesNotExist(constraint);

  kernel_->constraint_semantics().ValidateRelationshipPropertyExistenceConstraint(transaction_->view(), constraint);
  transaction_->state().ConstraintDoAdd(
      ConstraintRule{.id = kernel_->schema().ReserveConstraintId(), .descriptor = constraint, .owned_index = {}});
  spdlog::debug("Transaction {} creates {}", transaction_->id(), constraint.ToString());
  return constraint;
}

bool SchemaWrite::UniqueConstraintCreateIfMissing(const SchemaDescriptor &schema) {
  AssertNodeSchema(schema, OperationContext::CONSTRAINT_CREATION);
  if (ConstraintExists(ConstraintDescriptor::Uniqueness(schema))) return false;
  UniquePropertyConstraintCreate(schema);
  return true;
}

bool SchemaWrite::NodeKeyConstraintCreateIfMissing(const SchemaDescriptor &schema) {
  AssertNodeSchema(schema, OperationContext::CONSTRAINT_CREATION);
  if (ConstraintExists(ConstraintDescriptor::NodeKey(schema))) return false;
  NodeKeyConstraintCreate(schema);
  return true;
}

bool SchemaWrite::NodeExistenceConstraintCreateIfMissing(const SchemaDescriptor &schema) {
  AssertNodeSchema(schema, OperationContext::CONSTRAINT_CREATION);
  if (ConstraintExists(ConstraintDescriptor::NodeExistence(schema))) return false;
  NodePropertyExistenceConstraintCreate(schema);
  return true;
}

bool SchemaWrite::RelationshipExistenceConstraintCreateIfMissing(const SchemaDescriptor &schema) {
  if (schema.IsNodeSchema()) throw UnsupportedSchemaException(schema, OperationContext::CONSTRAINT_CREATION);
  if (ConstraintExists(ConstraintDescriptor::RelationshipExistence(schema))) return false;
  RelationshipPropertyExistenceConstraintCreate(schema);
  return true;
}

void SchemaWrite::ConstraintDrop(const ConstraintDescriptor &constraint) {
  const auto &schema = constraint.schema();
  AcquireExclusiveSchemaLock(schema);
  transaction_->AssertOpen();

  const auto &view = transaction_->view();
  auto rule = view.ConstraintGet(constraint);
  if (!rule) {
    throw DropConstraintFailureException(constraint, std::make_exception_ptr(NoSuchConstraintException(constraint)));
  }

  std::optional<IndexReference> owned_index;
  if (rule->owned_index) {
    if (auto index = view.IndexGetForSchema(schema); index && index->id() == *rule->owned_index) {
      owned_index = std::move(index);
    }
  }
  transaction_->state().ConstraintDoDrop(*rule, owned_index);
  spdlog::debug("Transaction {} drops {}", transaction_->id(), constraint.ToString());
}

bool SchemaWrite::UnRemoveIndexBackedConstraint(const ConstraintDescriptor &constraint) {
  auto &state = transaction_->state();
  std::optional<IndexReference> dropped_index;
  for (const auto &[id, dropped] : state.removed_indexes()) {
    if (dropped.schema() == constraint.schema() && dropped.IsUnique()) {
      dropped_index = dropped;
      break;
    }
  }
  if (!dropped_index || !state.IndexDoUnRemove(*dropped_index)) return false;

  if (!state.ConstraintDoUnRemove(constraint)) {
    // No dropped rule of this kind to restore: the constraint was created in this
    // transaction, or the dropped index belonged to a constraint of another kind
    // on the same schema.
    state.ConstraintDoAdd(ConstraintRule{
        .id = kernel_->schema().ReserveConstraintId(), .descriptor = constraint, .owned_index = dropped_index->id()});
  }
  return true;
}

void SchemaWrite::IndexBackedConstraintCreate(const ConstraintDescriptor &constraint) {
  try {
    if (UnRemoveIndexBackedConstraint(constraint)) return;

    const auto &view = transaction_->view();
    for (const auto &rule : view.ConstraintsGetForSchema(constraint.schema())) {
      if (rule.descriptor == constraint) return;
    }
    const auto index = kernel_->constraint_index_creator().CreateUniquenessConstraintIndex(*transaction_, constraint);
    // The label lock was released while the index populated, so a concurrent
    // transaction may have committed this very constraint in the meantime.
    if (!view.ConstraintExists(constraint)) {
      transaction_->state().ConstraintDoAdd(
          ConstraintRule{
              .id = kernel_->schema().ReserveConstraintId(), .descriptor = constraint, .owned_index = index});
      spdlog::debug("Transaction {} creates {} backed by index {}", transaction_->id(), constraint.ToString(),
                    index.AsUint());
    }
  } catch (const UniquePropertyValueValidationException &) {
    throw CreateConstraintFailureException(constraint, std::current_exception());
  } catch (const TransactionFailureException &) {
    throw CreateConstraintFailureException(constraint, std::current_exception());
  } catch (const AlreadyConstrainedException &) {
    throw CreateConstraintFailureException(constraint, std::current_exception());
  }
}

}  // namespace kestrel::storage
