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
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <thread>
#include <vector>

#include "storage/constraints/constraint_index_creator.hpp"
#include "storage/exceptions.hpp"
#include "storage/kernel.hpp"
#include "storage/locks/resource_types.hpp"
#include "storage/ops/schema_write.hpp"
#include "storage/txn/kernel_transaction.hpp"
#include "storage_test_utils.hpp"

using namespace kestrel::storage;
using namespace kestrel::storage::tests;
using namespace std::chrono_literals;

namespace {

bool WaitFor(const std::function<bool()> &condition, std::chrono::milliseconds timeout = 10s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!condition()) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

}  // namespace

class ConstraintIndexCreatorTest : public testing::Test {
 protected:
  Kernel kernel_{TestConfig()};

  const LabelId label_ = LabelId::FromUint(1);
  const PropertyId prop_ = PropertyId::FromUint(1);
  const SchemaDescriptor schema_ = SchemaDescriptor::ForLabel(label_, {prop_});
};

TEST_F(ConstraintIndexCreatorTest, CreateConstraintIndexCommitsUnownedUniqueIndex) {
  auto index = kernel_.constraint_index_creator().CreateConstraintIndex(schema_);
  ASSERT_TRUE(index.IsUnique());

  auto rule = kernel_.schema().GetIndex(index.id());
  ASSERT_TRUE(rule.has_value());
  ASSERT_TRUE(rule->unique);
  ASSERT_FALSE(rule->owning_constraint.has_value());
  ASSERT_TRUE(kernel_.indexing().HasIndex(index.id()));

  // A general index cannot be created over it.
  auto tx = kernel_.BeginTransaction();
  ASSERT_THROW(tx->schema_write().IndexCreate(schema_), AlreadyConstrainedException);
}

TEST_F(ConstraintIndexCreatorTest, LeftoverIndexIsReused) {
  CommitNode(kernel_, {label_}, {{prop_, PropertyValue(1)}});
  auto leftover = kernel_.constraint_index_creator().CreateConstraintIndex(schema_);

  auto constraint = CommitUniqueConstraint(kernel_, schema_);
  auto rule = kernel_.schema().ConstraintForDescriptor(constraint);
  ASSERT_TRUE(rule.has_value());
  ASSERT_EQ(rule->owned_index, leftover.id());
  ASSERT_EQ(CommittedIndexCount(kernel_, schema_), 1);
  ASSERT_EQ(kernel_.schema().GetIndex(leftover.id())->owning_constraint, rule->id);
}

TEST_F(ConstraintIndexCreatorTest, FailedCreationOnLeftoverIndexDropsIt) {
  CommitNode(kernel_, {label_}, {{prop_, PropertyValue(1)}});
  CommitNode(kernel_, {label_}, {{prop_, PropertyValue(1)}});
  auto leftover = kernel_.constraint_index_creator().CreateConstraintIndex(schema_);

  auto tx = kernel_.BeginTransaction();
  ASSERT_THROW(tx->schema_write().UniquePropertyConstraintCreate(schema_), CreateConstraintFailureException);
  ASSERT_TRUE(tx->locks().HoldsExclusive(locks::ResourceType::LABEL, label_.AsUint()));
  tx->Rollback();

  ASSERT_EQ(CommittedIndexCount(kernel_, schema_), 0);
  ASSERT_FALSE(kernel_.indexing().HasIndex(leftover.id()));
}

TEST_F(ConstraintIndexCreatorTest, LabelLockIsReleasedDuringPopulation) {
  kernel_.indexing().PausePopulation();

  std::atomic<bool> created{false};
  std::jthread creator([&] {
    auto tx = kernel_.BeginTransaction();
    tx->schema_write().UniquePropertyConstraintCreate(schema_);
    tx->Commit();
    created.store(true);
  });

  ASSERT_TRUE(WaitFor([&] { return CommittedIndexCount(kernel_, schema_) == 1; }));
  // The label lock is free while the index populates, so writers to the label proceed.
  const auto node = CommitNode(kernel_, {label_}, {{prop_, PropertyValue("v")}});
  ASSERT_FALSE(created.load());

  kernel_.indexing().ResumePopulation();
  creator.join();
  ASSERT_TRUE(created.load());

  auto tx = kernel_.BeginTransaction();
  auto index = tx->view().IndexGetForSchema(schema_);
  ASSERT_TRUE(index.has_value());
  ASSERT_EQ(tx->view().NodeIndexSeek(*index, {PropertyValue("v")}), std::vector<Gid>{node});
}

TEST_F(ConstraintIndexCreatorTest, LabelLockIsReleasedDuringPopulationWhenHeldTwice) {
  const std::vector<std::function<bool(SchemaWrite &)>> creations{
      [this](SchemaWrite &write) { return write.UniqueConstraintCreateIfMissing(schema_); },
      [this](SchemaWrite &write) { return write.NodeKeyConstraintCreateIfMissing(schema_); },
  };
  const auto label = label_.AsUint();
  for (size_t i = 0; i < creations.size(); ++i) {
    SCOPED_TRACE(i);
    Kernel kernel{TestConfig()};
    kernel.indexing().PausePopulation();

    std::atomic<bool> created{false};
    std::atomic<bool> relocked{false};
    std::jthread creator([&] {
      auto tx = kernel.BeginTransaction();
      ASSERT_TRUE(creations[i](tx->schema_write()));
      // Both exclusive holds taken before population are restored.
      tx->locks().ReleaseExclusive(locks::ResourceType::LABEL, label);
      relocked.store(tx->locks().HoldsExclusive(locks::ResourceType::LABEL, label));
      tx->Commit();
      created.store(true);
    });

    ASSERT_TRUE(WaitFor([&] { return CommittedIndexCount(kernel, schema_) == 1; }));
    const auto node = CommitNode(kernel, {label_}, {{prop_, PropertyValue(static_cast<int>(i))}});
    ASSERT_FALSE(created.load());

    kernel.indexing().ResumePopulation();
    creator.join();
    ASSERT_TRUE(created.load());
    ASSERT_TRUE(relocked.load());

    auto tx = kernel.BeginTransaction();
    auto index = tx->view().IndexGetForSchema(schema_);
    ASSERT_TRUE(index.has_value());
    ASSERT_EQ(tx->view().NodeIndexSeek(*index, {PropertyValue(static_cast<int>(i))}), std::vector<Gid>{node});
  }
}

TEST_F(ConstraintIndexCreatorTest, TerminationDuringPopulationCleansUp) {
  kernel_.indexing().PausePopulation();
  auto tx = kernel_.BeginTransaction();

  std::exception_ptr failure;
  std::jthread creator([&] {
    try {
      tx->schema_write().UniquePropertyConstraintCreate(schema_);
    } catch (const CreateConstraintFailureException &) {
      failure = std::current_exception();
    }
  });

  ASSERT_TRUE(WaitFor([&] { return CommittedIndexCount(kernel_, schema_) == 1; }));
  tx->MarkForTermination("test termination");
  creator.join();
  kernel_.indexing().ResumePopulation();

  ASSERT_TRUE(failure);
  try {
    std::rethrow_exception(failure);
  } catch (const CreateConstraintFailureException &e) {
    try {
      std::rethrow_exception(e.cause());
    } catch (const TransactionTerminatedException &) {
    }
  }
  ASSERT_EQ(CommittedIndexCount(kernel_, schema_), 0);
  ASSERT_TRUE(kernel_.schema().AllConstraints().empty());

  ASSERT_TRUE(tx->IsTerminated());
  ASSERT_THROW(tx->data_write().NodeCreate(), TransactionTerminatedException);
  ASSERT_THROW(tx->Commit(), TransactionTerminatedException);
  tx->Rollback();
}

TEST_F(ConstraintIndexCreatorTest, PopulationTimeoutFailsCreation) {
  auto config = TestConfig();
  config.indices.population_await_timeout = 50ms;
  Kernel kernel(config);
  kernel.indexing().PausePopulation();

  auto tx = kernel.BeginTransaction();
  try {
    tx->schema_write().UniquePropertyConstraintCreate(schema_);
    FAIL() << "population never completes";
  } catch (const CreateConstraintFailureException &e) {
    try {
      std::rethrow_exception(e.cause());
    } catch (const TransactionFailureException &timeout) {
      ASSERT_EQ(timeout.status(), Status::TRANSIENT_ERROR);
    }
  }
  kernel.indexing().ResumePopulation();
  tx->Rollback();
  ASSERT_EQ(CommittedIndexCount(kernel, schema_), 0);
}
