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
#include <exception>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "storage/constraint_descriptor.hpp"
#include "storage/id_types.hpp"
#include "storage/locks/resource_types.hpp"
#include "storage/property_value.hpp"
#include "storage/schema_descriptor.hpp"
#include "utils/exceptions.hpp"

namespace kestrel::storage {

/// How a caller should treat a failure. Client errors fail again when retried
/// unchanged, transient errors may succeed on retry, database errors point at
/// a broken index or store.
enum class Status : uint8_t { CLIENT_ERROR, TRANSIENT_ERROR, DATABASE_ERROR };

/// The schema operation during which a schema error was raised.
enum class OperationContext : uint8_t { INDEX_CREATION, CONSTRAINT_CREATION, INDEX_DROP, CONSTRAINT_DROP };

enum class ConstraintValidationPhase : uint8_t { VALIDATION, VERIFICATION };

std::string_view StatusToString(Status status);
std::string_view OperationContextToString(OperationContext context);

/// Message of the exception held by \p cause. Exceptions that do not derive
/// from std::exception are rethrown.
std::string DescribeCause(const std::exception_ptr &cause);

/**
 * Base class of all exceptions raised by the kernel. Wrapping exceptions keep
 * the exception that caused them, reachable through cause().
 */
class KernelException : public utils::BasicException {
 public:
  KernelException(Status status, std::string message, std::exception_ptr cause = nullptr)
      : utils::BasicException(std::move(message)), status_(status), cause_(std::move(cause)) {}

  Status status() const { return status_; }
  const std::exception_ptr &cause() const { return cause_; }

  SPECIALIZE_GET_EXCEPTION_NAME(KernelException)

 private:
  Status status_;
  std::exception_ptr cause_;
};

class EntityNotFoundException : public KernelException {
 public:
  EntityNotFoundException(EntityType entity_type, Gid entity_id)
      : KernelException(Status::CLIENT_ERROR, fmt::format("Unable to load {} with id {}.",
                                                          EntityTypeToString(entity_type), entity_id.AsUint())),
        entity_type_(entity_type),
        entity_id_(entity_id) {}

  EntityType entity_type() const { return entity_type_; }
  Gid entity_id() const { return entity_id_; }

  SPECIALIZE_GET_EXCEPTION_NAME(EntityNotFoundException)

 private:
  EntityType entity_type_;
  Gid entity_id_;
};

class TransactionTerminatedException : public KernelException {
 public:
  explicit TransactionTerminatedException(std::string_view reason)
      : KernelException(Status::TRANSIENT_ERROR, fmt::format("The transaction has been terminated: {}", reason)) {}
  SPECIALIZE_GET_EXCEPTION_NAME(TransactionTerminatedException)
};

class NotInTransactionException : public KernelException {
 public:
  NotInTransactionException() : KernelException(Status::CLIENT_ERROR, "This transaction has already been closed.") {}
  SPECIALIZE_GET_EXCEPTION_NAME(NotInTransactionException)
};

class LockAcquisitionTimeoutException : public KernelException {
 public:
  LockAcquisitionTimeoutException(locks::ResourceType type, uint64_t resource_id, locks::LockMode mode,
                                  std::chrono::milliseconds timeout)
      : KernelException(Status::TRANSIENT_ERROR,
                        fmt::format("Unable to acquire {} lock on {}({}) within {} ms.", locks::LockModeToString(mode),
                                    locks::ResourceTypeToString(type), resource_id, timeout.count())) {}
  SPECIALIZE_GET_EXCEPTION_NAME(LockAcquisitionTimeoutException)
};

/**
 * Base class of errors raised by schema operations: malformed descriptors and
 * index or constraint definitions that clash with existing ones.
 */
class SchemaKernelException : public KernelException {
 public:
  explicit SchemaKernelException(std::string message, std::exception_ptr cause = nullptr,
                                 Status status = Status::CLIENT_ERROR)
      : KernelException(status, std::move(message), std::move(cause)) {}
  SPECIALIZE_GET_EXCEPTION_NAME(SchemaKernelException)
};

class AlreadyIndexedException : public SchemaKernelException {
 public:
  AlreadyIndexedException(const SchemaDescriptor &schema, OperationContext context)
      : SchemaKernelException(context == OperationContext::CONSTRAINT_CREATION
                                  ? fmt::format("There already exists an index {}. A constraint cannot be created "
                                                "until the index has been dropped.",
                                                schema.ToString())
                                  : fmt::format("There already exists an index {}.", schema.ToString())),
        schema_(schema),
        context_(context) {}

  const SchemaDescriptor &schema() const { return schema_; }
  OperationContext context() const { return context_; }

  SPECIALIZE_GET_EXCEPTION_NAME(AlreadyIndexedException)

 private:
  SchemaDescriptor schema_;
  OperationContext context_;
};

class AlreadyConstrainedException : public SchemaKernelException {
 public:
  AlreadyConstrainedException(const ConstraintDescriptor &constraint, OperationContext context)
      : SchemaKernelException(context == OperationContext::INDEX_CREATION
                                  ? fmt::format("There is a uniqueness constraint on {}, so an index is already "
                                                "created that matches this.",
                                                constraint.schema().ToString())
                                  : fmt::format("Constraint already exists: {}", constraint.ToString())),
        constraint_(constraint),
        context_(context) {}

  const ConstraintDescriptor &constraint() const { return constraint_; }
  OperationContext context() const { return context_; }

  SPECIALIZE_GET_EXCEPTION_NAME(AlreadyConstrainedException)

 private:
  ConstraintDescriptor constraint_;
  OperationContext context_;
};

class RepeatedPropertyInCompositeSchemaException : public SchemaKernelException {
 public:
  RepeatedPropertyInCompositeSchemaException(const SchemaDescriptor &schema, OperationContext context)
      : SchemaKernelException(fmt::format("{} failed: schema {} contains a property more than once.",
                                          OperationContextToString(context), schema.ToString())),
        schema_(schema),
        context_(context) {}

  const SchemaDescriptor &schema() const { return schema_; }
  OperationContext context() const { return context_; }

  SPECIALIZE_GET_EXCEPTION_NAME(RepeatedPropertyInCompositeSchemaException)

 private:
  SchemaDescriptor schema_;
  OperationContext context_;
};

/// A schema of the wrong entity kind was passed, e.g. a relationship type
/// schema to an operation that indexes labels.
class UnsupportedSchemaException : public SchemaKernelException {
 public:
  UnsupportedSchemaException(const SchemaDescriptor &schema, OperationContext context)
      : SchemaKernelException(fmt::format("{} failed: schema {} is not supported by this operation.",
                                          OperationContextToString(context), schema.ToString())) {}
  SPECIALIZE_GET_EXCEPTION_NAME(UnsupportedSchemaException)
};

class NoSuchIndexException : public SchemaKernelException {
 public:
  explicit NoSuchIndexException(const SchemaDescriptor &schema)
      : SchemaKernelException(fmt::format("No such INDEX ON {}.", schema.ToString())), schema_(schema) {}

  const SchemaDescriptor &schema() const { return schema_; }

  SPECIALIZE_GET_EXCEPTION_NAME(NoSuchIndexException)

 private:
  SchemaDescriptor schema_;
};

class IndexBelongsToConstraintException : public SchemaKernelException {
 public:
  explicit IndexBelongsToConstraintException(const SchemaDescriptor &schema)
      : SchemaKernelException(fmt::format("Index belongs to constraint: {}", schema.ToString())), schema_(schema) {}

  const SchemaDescriptor &schema() const { return schema_; }

  SPECIALIZE_GET_EXCEPTION_NAME(IndexBelongsToConstraintException)

 private:
  SchemaDescriptor schema_;
};

class NoSuchConstraintException : public SchemaKernelException {
 public:
  explicit NoSuchConstraintException(const ConstraintDescriptor &constraint)
      : SchemaKernelException(fmt::format("No such constraint {}.", constraint.ToString())), constraint_(constraint) {}

  const ConstraintDescriptor &constraint() const { return constraint_; }

  SPECIALIZE_GET_EXCEPTION_NAME(NoSuchConstraintException)

 private:
  ConstraintDescriptor constraint_;
};

/// An index that was asked to be created exists but its population failed.
class FailedIndexException : public SchemaKernelException {
 public:
  FailedIndexException(const SchemaDescriptor &schema, std::string_view failure)
      : SchemaKernelException(fmt::format("The index {} has failed: {}", schema.ToString(), failure), nullptr,
                              Status::DATABASE_ERROR) {}
  SPECIALIZE_GET_EXCEPTION_NAME(FailedIndexException)
};

class DropIndexFailureException : public SchemaKernelException {
 public:
  DropIndexFailureException(const SchemaDescriptor &schema, std::exception_ptr cause)
      : SchemaKernelException(fmt::format("Unable to drop INDEX ON {}: {}", schema.ToString(), DescribeCause(cause)),
                              cause) {}
  SPECIALIZE_GET_EXCEPTION_NAME(DropIndexFailureException)
};

class DropConstraintFailureException : public SchemaKernelException {
 public:
  DropConstraintFailureException(const ConstraintDescriptor &constraint, std::exception_ptr cause)
      : SchemaKernelException(
            fmt::format("Unable to drop {}: {}", constraint.ToString(), DescribeCause(cause)), cause),
        constraint_(constraint) {}

  const ConstraintDescriptor &constraint() const { return constraint_; }

  SPECIALIZE_GET_EXCEPTION_NAME(DropConstraintFailureException)

 private:
  ConstraintDescriptor constraint_;
};

class CreateConstraintFailureException : public SchemaKernelException {
 public:
  CreateConstraintFailureException(const ConstraintDescriptor &constraint, std::exception_ptr cause)
      : SchemaKernelException(
            fmt::format("Unable to create {}:\n{}", constraint.ToString(), DescribeCause(cause)), cause),
        constraint_(constraint) {}

  const ConstraintDescriptor &constraint() const { return constraint_; }

  SPECIALIZE_GET_EXCEPTION_NAME(CreateConstraintFailureException)

 private:
  ConstraintDescriptor constraint_;
};

/// Two nodes holding the same value tuple in a unique index.
struct IndexEntryConflict {
  Gid existing_node;
  Gid added_node;
  std::vector<PropertyValue> values;
};

class IndexEntryConflictException : public KernelException {
 public:
  explicit IndexEntryConflictException(IndexEntryConflict conflict);

  const IndexEntryConflict &conflict() const { return conflict_; }

  SPECIALIZE_GET_EXCEPTION_NAME(IndexEntryConflictException)

 private:
  IndexEntryConflict conflict_;
};

/**
 * Base class of constraint violations found while validating data, either
 * while writing (VALIDATION) or while checking a freshly built index
 * (VERIFICATION).
 */
class ConstraintValidationException : public KernelException {
 public:
  ConstraintValidationException(const ConstraintDescriptor &constraint, ConstraintValidationPhase phase,
                                std::string message, std::exception_ptr cause = nullptr)
      : KernelException(Status::CLIENT_ERROR, std::move(message), std::move(cause)),
        constraint_(constraint),
        phase_(phase) {}

  const ConstraintDescriptor &constraint() const { return constraint_; }
  ConstraintValidationPhase phase() const { return phase_; }

  SPECIALIZE_GET_EXCEPTION_NAME(ConstraintValidationException)

 private:
  ConstraintDescriptor constraint_;
  ConstraintValidationPhase phase_;
};

class UniquePropertyValueValidationException : public ConstraintValidationException {
 public:
  UniquePropertyValueValidationException(const ConstraintDescriptor &constraint, ConstraintValidationPhase phase,
                                         std::vector<IndexEntryConflict> conflicts);
  /// Validation that failed for a reason other than a conflicting entry.
  UniquePropertyValueValidationException(const ConstraintDescriptor &constraint, ConstraintValidationPhase phase,
                                         std::exception_ptr cause);

  const std::vector<IndexEntryConflict> &conflicts() const { return conflicts_; }

  SPECIALIZE_GET_EXCEPTION_NAME(UniquePropertyValueValidationException)

 private:
  std::vector<IndexEntryConflict> conflicts_;
};

class NodePropertyExistenceException : public ConstraintValidationException {
 public:
  NodePropertyExistenceException(const ConstraintDescriptor &constraint, ConstraintValidationPhase phase, Gid node,
                                 PropertyId missing_property)
      : ConstraintValidationException(constraint, phase,
                                      fmt::format("Node({}) with label {} must have the property {}", node.AsUint(),
                                                  constraint.schema().entity_token(), missing_property.AsUint())),
        node_(node) {}

  Gid node() const { return node_; }

  SPECIALIZE_GET_EXCEPTION_NAME(NodePropertyExistenceException)

 private:
  Gid node_;
};

class RelationshipPropertyExistenceException : public ConstraintValidationException {
 public:
  RelationshipPropertyExistenceException(const ConstraintDescriptor &constraint, ConstraintValidationPhase phase,
                                         Gid relationship, PropertyId missing_property)
      : ConstraintValidationException(
            constraint, phase,
            fmt::format("Relationship({}) with type {} must have the property {}", relationship.AsUint(),
                        constraint.schema().entity_token(), missing_property.AsUint())),
        relationship_(relationship) {}

  Gid relationship() const { return relationship_; }

  SPECIALIZE_GET_EXCEPTION_NAME(RelationshipPropertyExistenceException)

 private:
  Gid relationship_;
};

/// A conflict check could not be run because the backing index is unusable.
class UnableToValidateConstraintException : public KernelException {
 public:
  UnableToValidateConstraintException(const ConstraintDescriptor &constraint, std::exception_ptr cause)
      : KernelException(Status::CLIENT_ERROR,
                        fmt::format("Unable to validate constraint {}: {}", constraint.ToString(),
                                    DescribeCause(cause)),
                        cause) {}
  SPECIALIZE_GET_EXCEPTION_NAME(UnableToValidateConstraintException)
};

class IndexNotFoundKernelException : public KernelException {
 public:
  explicit IndexNotFoundKernelException(std::string message)
      : KernelException(Status::DATABASE_ERROR, std::move(message)) {}
  SPECIALIZE_GET_EXCEPTION_NAME(IndexNotFoundKernelException)
};

class IndexBrokenKernelException : public KernelException {
 public:
  explicit IndexBrokenKernelException(std::string message)
      : KernelException(Status::DATABASE_ERROR, std::move(message)) {}
  SPECIALIZE_GET_EXCEPTION_NAME(IndexBrokenKernelException)
};

class IndexNotApplicableKernelException : public KernelException {
 public:
  explicit IndexNotApplicableKernelException(std::string message)
      : KernelException(Status::DATABASE_ERROR, std::move(message)) {}
  SPECIALIZE_GET_EXCEPTION_NAME(IndexNotApplicableKernelException)
};

class IndexPopulationFailedException : public KernelException {
 public:
  IndexPopulationFailedException(const SchemaDescriptor &schema, std::exception_ptr cause)
      : KernelException(Status::DATABASE_ERROR,
                        fmt::format("Failed to populate index {}: {}", schema.ToString(), DescribeCause(cause)),
                        cause) {}
  SPECIALIZE_GET_EXCEPTION_NAME(IndexPopulationFailedException)
};

class TransactionFailureException : public KernelException {
 public:
  explicit TransactionFailureException(std::string message, std::exception_ptr cause = nullptr,
                                       Status status = Status::DATABASE_ERROR)
      : KernelException(status, std::move(message), std::move(cause)) {}
  SPECIALIZE_GET_EXCEPTION_NAME(TransactionFailureException)
};

/// Commit was refused because the transaction's changes violate a constraint.
class ConstraintViolationTransactionFailureException : public TransactionFailureException {
 public:
  explicit ConstraintViolationTransactionFailureException(std::exception_ptr cause)
      : TransactionFailureException(DescribeCause(cause), cause, Status::CLIENT_ERROR) {}
  explicit ConstraintViolationTransactionFailureException(std::string message)
      : TransactionFailureException(std::move(message), nullptr, Status::CLIENT_ERROR) {}
  SPECIALIZE_GET_EXCEPTION_NAME(ConstraintViolationTransactionFailureException)
};

}  // namespace kestrel::storage
