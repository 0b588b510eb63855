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

#include <utility>

#include "storage/constraint_descriptor.hpp"
#include "storage/exceptions.hpp"
#include "storage/index_reference.hpp"
#include "storage/schema_descriptor.hpp"

namespace kestrel::storage {

class Kernel;
class KernelTransaction;

/**
 * Index and constraint creation and removal on behalf of one transaction.
 *
 * Each operation takes the exclusive lock on the label or relationship type
 * of its schema, rejects schemas that repeat a property and schemas that
 * clash with existing rules, and records the change in the transaction state.
 * Uniqueness and node key constraints are backed by an index built through
 * the ConstraintIndexCreator; existence constraints are validated by a full
 * scan through the ConstraintSemantics.
 */
class SchemaWrite final {
 public:
  SchemaWrite(KernelTransaction *transaction, Kernel *kernel) : transaction_(transaction), kernel_(kernel) {}

  /// @throw AlreadyIndexedException
  /// @throw AlreadyConstrainedException if a constraint index exists on the schema.
  /// @throw RepeatedPropertyInCompositeSchemaException
  /// @throw UnsupportedSchemaException for relationship type schemas.
  IndexReference IndexCreate(const SchemaDescriptor &schema);

  /// @return the index and whether it was created by this call.
  /// @throw FailedIndexException if the existing index failed to populate.
  std::pair<IndexReference, bool> IndexCreateIfMissing(const SchemaDescriptor &schema);

  /// @throw DropIndexFailureException caused by NoSuchIndexException or IndexBelongsToConstraintException.
  void IndexDrop(const IndexReference &index);

  /// @throw AlreadyConstrainedException
  /// @throw AlreadyIndexedException
  /// @throw CreateConstraintFailureException
  /// @throw RepeatedPropertyInCompositeSchemaException
  ConstraintDescriptor UniquePropertyConstraintCreate(const SchemaDescriptor &schema);
  ConstraintDescriptor NodeKeyConstraintCreate(const SchemaDescriptor &schema);
  ConstraintDescriptor NodePropertyExistenceConstraintCreate(const SchemaDescriptor &schema);
  ConstraintDescriptor RelationshipPropertyExistenceConstraintCreate(const SchemaDescriptor &schema);

  /// Variants that return false instead of failing when the constraint exists.
  bool UniqueConstraintCreateIfMissing(const SchemaDescriptor &schema);
  bool NodeKeyConstraintCreateIfMissing(const SchemaDescriptor &schema);
  bool NodeExistenceConstraintCreateIfMissing(const SchemaDescriptor &schema);
  bool RelationshipExistenceConstraintCreateIfMissing(const SchemaDescriptor &schema);

  /// Drops the constraint and the index it owns.
  /// @throw DropConstraintFailureException caused by NoSuchConstraintException.
  void ConstraintDrop(const ConstraintDescriptor &constraint);

 private:
  void AcquireExclusiveSchemaLock(const SchemaDescriptor &schema);
  void AssertNodeSchema(const SchemaDescriptor &schema, OperationContext context) const;
  void AssertValidDescriptor(const SchemaDescriptor &schema, OperationContext context) const;
  void AssertIndexDoesNotExist(OperationContext context, const SchemaDescriptor &schema) const;
  void AssertConstraintDoesNotExist(const ConstraintDescriptor &constraint) const;
  bool ConstraintExists(const ConstraintDescriptor &constraint);

  void IndexBackedConstraintCreate(const ConstraintDescriptor &constraint);
  /// Restores a unique index and its constraint dropped earlier in this transaction.
  bool UnRemoveIndexBackedConstraint(const ConstraintDescriptor &constraint);

  KernelTransaction *transaction_;
  Kernel *kernel_;
};

}  // namespace kestrel::storage
