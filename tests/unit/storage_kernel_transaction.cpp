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
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <exception>

#include "storage/exceptions.hpp"
#include "storage/kernel.hpp"
#include "storage/ops/entity_write.hpp"
#include "storage/ops/operations.hpp"
#include "storage/ops/schema_write.hpp"
#include "storage/txn/kernel_transaction.hpp"
#include "storage_test_utils.hpp"

using namespace kestrel::storage;
using namespace kestrel::storage::tests;
using testing::HasSubstr;

class KernelTransactionTest : public testing::Test {
 protected:
  void CommitExistenceConstraint(Kernel &kernel) {
    auto tx = kernel.BeginTransaction();
    tx->schema_write().NodePropertyExistenceConstraintCreate(schema_);
    tx->Commit();
  }

  Kernel kernel_{TestConfig()};

  const LabelId label_ = LabelId::FromUint(1);
  const PropertyId prop_ = PropertyId::FromUint(1);
  const SchemaDescriptor schema_ = SchemaDescriptor::ForLabel(label_, {prop_});
};

TEST_F(KernelTransactionTest, CommitAppliesChanges) {
  auto tx = kernel_.BeginTransaction();
  ASSERT_EQ(tx->type(), TransactionType::EXPLICIT);
  const auto node = tx->data_write().NodeCreate();
  tx->data_write().NodeAddLabel(node, label_);
  ASSERT_EQ(kernel_.store().NodeCount(), 0);
  tx->Commit();

  ASSERT_FALSE(tx->IsOpen());
  ASSERT_EQ(kernel_.store().NodeCount(), 1);
  auto record = kernel_.store().GetNode(node);
  ASSERT_TRUE(record.has_value());
  ASSERT_TRUE(record->labels.contains(label_));
}

TEST_F(KernelTransactionTest, ReadsSeeOwnUncommittedWrites) {
  auto tx = kernel_.BeginTransaction();
  auto &ops = tx->operations();
  const auto node = ops.data_write().NodeCreate();
  ops.data_write().NodeAddLabel(node, label_);

  ASSERT_TRUE(ops.read().NodeExists(node));
  ASSERT_THAT(ops.read().NodesWithLabel(label_), testing::ElementsAre(node));

  auto other = kernel_.BeginTransaction();
  ASSERT_FALSE(other->operations().read().NodeExists(node));
}

TEST_F(KernelTransactionTest, RollbackDiscardsChanges) {
  auto tx = kernel_.BeginTransaction();
  tx->data_write().NodeCreate();
  tx->Rollback();
  ASSERT_FALSE(tx->IsOpen());
  ASSERT_EQ(kernel_.store().NodeCount(), 0);
}

TEST_F(KernelTransactionTest, ClosedTransactionRejectsCommitAndRollback) {
  auto tx = kernel_.BeginTransaction();
  tx->Commit();
  ASSERT_THROW(tx->Commit(), NotInTransactionException);
  ASSERT_THROW(tx->Rollback(), NotInTransactionException);
  ASSERT_THROW(tx->AssertOpen(), NotInTransactionException);
}

TEST_F(KernelTransactionTest, TransactionIdsIncrease) {
  auto first = kernel_.BeginTransaction();
  auto second = kernel_.BeginTransaction(TransactionType::IMPLICIT);
  ASSERT_LT(first->id(), second->id());
  ASSERT_EQ(second->type(), TransactionType::IMPLICIT);
}

TEST_F(KernelTransactionTest, TerminationFailsOperations) {
  const auto node = CommitNode(kernel_, {label_});
  auto tx = kernel_.BeginTransaction();
  tx->data_write().NodeAddLabel(node, LabelId::FromUint(2));

  tx->MarkForTermination("shutting down");
  ASSERT_TRUE(tx->IsTerminated());
  try {
    tx->data_write().NodeCreate();
    FAIL() << "operations on a terminated transaction must fail";
  } catch (const TransactionTerminatedException &e) {
    ASSERT_THAT(e.what(), HasSubstr("shutting down"));
    ASSERT_EQ(e.status(), Status::TRANSIENT_ERROR);
  }
  ASSERT_THROW(tx->schema_write().IndexCreate(schema_), TransactionTerminatedException);
  ASSERT_THROW(tx->Commit(), TransactionTerminatedException);

  // The transaction stays open until it is rolled back.
  ASSERT_TRUE(tx->IsOpen());
  tx->Rollback();
  ASSERT_EQ(kernel_.lock_manager().ActiveLockCount(), 0);
  ASSERT_FALSE(kernel_.store().GetNode(node)->labels.contains(LabelId::FromUint(2)));
}

TEST_F(KernelTransactionTest, ExistenceViolationFailsCommitAndAppliesNothing) {
  CommitExistenceConstraint(kernel_);

  auto tx = kernel_.BeginTransaction();
  auto &write = tx->data_write();
  const auto unrelated = write.NodeCreate();
  write.NodeSetProperty(unrelated, prop_, PropertyValue(1));
  const auto node = write.NodeCreate();
  write.NodeAddLabel(node, label_);

  try {
    tx->Commit();
    FAIL() << "a labeled node without the required property must not commit";
  } catch (const ConstraintViolationTransactionFailureException &e) {
    ASSERT_EQ(e.status(), Status::CLIENT_ERROR);
    try {
      std::rethrow_exception(e.cause());
    } catch (const NodePropertyExistenceException &violation) {
      ASSERT_EQ(violation.node(), node);
      ASSERT_EQ(violation.phase(), ConstraintValidationPhase::VALIDATION);
    }
  }
  ASSERT_FALSE(tx->IsOpen());
  ASSERT_EQ(kernel_.store().NodeCount(), 0);
  ASSERT_EQ(kernel_.lock_manager().ActiveLockCount(), 0);
}

TEST_F(KernelTransactionTest, RemovingRequiredPropertyFailsCommit) {
  CommitExistenceConstraint(kernel_);
  const auto node = CommitNode(kernel_, {label_}, {{prop_, PropertyValue("x")}});

  auto tx = kernel_.BeginTransaction();
  ASSERT_EQ(tx->data_write().NodeRemoveProperty(node, prop_), PropertyValue("x"));
  ASSERT_THROW(tx->Commit(), ConstraintViolationTransactionFailureException);
  ASSERT_EQ(kernel_.store().GetNode(node)->properties.at(prop_), PropertyValue("x"));
}

TEST_F(KernelTransactionTest, CommitValidationCanBeDisabled) {
  auto config = TestConfig();
  config.constraints.validate_existence_on_commit = false;
  Kernel kernel(config);
  CommitExistenceConstraint(kernel);

  CommitNode(kernel, {label_});
  ASSERT_EQ(kernel.store().NodeCount(), 1);
}

TEST_F(KernelTransactionTest, DestroyingOpenTransactionRollsBack) {
  const auto node = CommitNode(kernel_, {label_}, {{prop_, PropertyValue(1)}});
  {
    auto tx = kernel_.BeginTransaction();
    tx->data_write().NodeSetProperty(node, prop_, PropertyValue(2));
    ASSERT_GT(kernel_.lock_manager().ActiveLockCount(), 0);
  }
  ASSERT_EQ(kernel_.lock_manager().ActiveLockCount(), 0);
  ASSERT_EQ(kernel_.store().GetNode(node)->properties.at(prop_), PropertyValue(1));
}
