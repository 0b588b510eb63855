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

#include "storage/constraint_descriptor.hpp"
#include "storage/txn/state_view.hpp"
#include "storage/txn/transaction_state.hpp"

namespace kestrel::storage {

/**
 * Validation rules for constraints that require properties to exist. Schema
 * operations call the Validate*Constraint methods with a full scan of the
 * entities under the constraint before the constraint is recorded; commit
 * calls ValidateTransactionState for the entities a transaction touched.
 */
class ConstraintSemantics {
 public:
  ConstraintSemantics() = default;
  ConstraintSemantics(const ConstraintSemantics &) = delete;
  ConstraintSemantics &operator=(const ConstraintSemantics &) = delete;
  ConstraintSemantics(ConstraintSemantics &&) = delete;
  ConstraintSemantics &operator=(ConstraintSemantics &&) = delete;
  virtual ~ConstraintSemantics() = default;

  /// @throw CreateConstraintFailureException caused by NodePropertyExistenceException
  virtual void ValidateNodePropertyExistenceConstraint(const StateView &view,
                                                       const ConstraintDescriptor &constraint) const = 0;

  /// Validates the existence part of a node key; uniqueness is verified by its index.
  /// @throw CreateConstraintFailureException caused by NodePropertyExistenceException
  virtual void ValidateNodeKeyConstraint(const StateView &view, const ConstraintDescriptor &constraint) const = 0;

  /// @throw CreateConstraintFailureException caused by RelationshipPropertyExistenceException
  virtual void ValidateRelationshipPropertyExistenceConstraint(const StateView &view,
                                                               const ConstraintDescriptor &constraint) const = 0;

  /// @throw ConstraintViolationTransactionFailureException
  virtual void ValidateTransactionState(const StateView &view, const TransactionState &state) const = 0;
};

/// Enforces existence constraints by scanning the nodes with the label or the
/// relationships of the type.
class StandardConstraintSemantics final : public ConstraintSemantics {
 public:
  void ValidateNodePropertyExistenceConstraint(const StateView &view,
                                               const ConstraintDescriptor &constraint) const override;
  void ValidateNodeKeyConstraint(const StateView &view, const ConstraintDescriptor &constraint) const override;
  void ValidateRelationshipPropertyExistenceConstraint(const StateView &view,
                                                       const ConstraintDescriptor &constraint) const override;
  void ValidateTransactionState(const StateView &view, const TransactionState &state) const override;

 private:
  void ValidateNodesHaveProperties(const StateView &view, const ConstraintDescriptor &constraint) const;
};

}  // namespace kestrel::storage
