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

#include <chrono>
#include <exception>

#include "storage/exceptions.hpp"
#include "storage/graph_store.hpp"
#include "storage/indices/index_proxy.hpp"
#include "storage/indices/indexing_service.hpp"
#include "storage/txn/transaction_state.hpp"

using namespace kestrel::storage;
using namespace std::chrono_literals;

class IndexingTest : public testing::Test {
 protected:
  IndexingTest() : indexing_(IndexConfig(), &store_) {}

  static Config::Indices IndexConfig() {
    Config::Indices config;
    config.population_threads = 1;
    config.population_poll_interval = 5ms;
    return config;
  }

  Gid CommitNode(const std::set<LabelId> &labels, const std::map<PropertyId, PropertyValue> &properties) {
    TransactionState state;
    const auto node = store_.ReserveNodeId();
    state.NodeDoCreate(node);
    for (const auto label : labels) state.NodeDoAddLabel(label, node);
    for (const auto &[property, value] : properties) state.NodeDoSetProperty(node, property, value);
    store_.Apply(state, [this](const std::vector<NodeUpdate> &updates) { indexing_.ApplyUpdates(updates); });
    return node;
  }

  IndexRule Rule(uint64_t id, bool unique) {
    return IndexRule{.id = IndexId::FromUint(id), .schema = schema_, .unique = unique, .owning_constraint = {}};
  }

  const LabelId label_ = LabelId::FromUint(1);
  const PropertyId prop_ = PropertyId::FromUint(1);
  const SchemaDescriptor schema_ = SchemaDescriptor::ForLabel(label_, {prop_});

  GraphStore store_;
  IndexingService indexing_;
};

TEST(IndexTupleOf, RequiresLabelAndEveryProperty) {
  const auto label = LabelId::FromUint(1);
  const auto a = PropertyId::FromUint(1);
  const auto b = PropertyId::FromUint(2);
  auto schema = SchemaDescriptor::ForLabel(label, {a, b});

  auto tuple = IndexTupleOf(schema, {label}, {{a, PropertyValue(1)}, {b, PropertyValue("x")}});
  ASSERT_TRUE(tuple.has_value());
  ASSERT_EQ(*tuple, (ValueTuple{PropertyValue(1), PropertyValue("x")}));

  ASSERT_FALSE(IndexTupleOf(schema, {}, {{a, PropertyValue(1)}, {b, PropertyValue("x")}}).has_value());
  ASSERT_FALSE(IndexTupleOf(schema, {label}, {{a, PropertyValue(1)}}).has_value());
  ASSERT_FALSE(IndexTupleOf(schema, {label}, {{a, PropertyValue(1)}, {b, PropertyValue()}}).has_value());
}

TEST_F(IndexingTest, PopulatesFromCommittedStore) {
  const auto first = CommitNode({label_}, {{prop_, PropertyValue(1)}});
  const auto second = CommitNode({label_}, {{prop_, PropertyValue(2)}});
  CommitNode({LabelId::FromUint(2)}, {{prop_, PropertyValue(1)}});
  CommitNode({label_}, {});

  auto proxy = indexing_.CreateIndex(Rule(1, false));
  ASSERT_TRUE(proxy->AwaitStoreScanCompleted({}, 0ms, 5ms));
  ASSERT_EQ(proxy->State(), IndexState::ONLINE);
  ASSERT_EQ(proxy->EntryCount(), 2);
  ASSERT_EQ(proxy->Seek({PropertyValue(1)}), std::vector<Gid>{first});
  ASSERT_EQ(proxy->Seek({PropertyValue(2)}), std::vector<Gid>{second});
  ASSERT_TRUE(proxy->Seek({PropertyValue(3)}).empty());
  ASSERT_TRUE(indexing_.HasIndex(IndexId::FromUint(1)));
  ASSERT_EQ(indexing_.GetIndexProxy(IndexId::FromUint(1)), proxy);
}

TEST_F(IndexingTest, UniquePopulationFailsOnDuplicates) {
  const auto first = CommitNode({label_}, {{prop_, PropertyValue(5)}});
  const auto second = CommitNode({label_}, {{prop_, PropertyValue(5.0)}});

  auto proxy = indexing_.CreateIndex(Rule(1, true));
  indexing_.AwaitPopulationIdle();
  ASSERT_EQ(proxy->State(), IndexState::FAILED);
  ASSERT_FALSE(proxy->FailureMessage().empty());

  try {
    proxy->AwaitStoreScanCompleted({}, 0ms, 5ms);
    FAIL() << "population should have failed";
  } catch (const IndexPopulationFailedException &e) {
    try {
      std::rethrow_exception(e.cause());
    } catch (const IndexEntryConflictException &conflict) {
      ASSERT_EQ(conflict.conflict().existing_node, first);
      ASSERT_EQ(conflict.conflict().added_node, second);
    }
  }
}

TEST_F(IndexingTest, NonUniqueIndexAcceptsDuplicates) {
  CommitNode({label_}, {{prop_, PropertyValue(5)}});
  CommitNode({label_}, {{prop_, PropertyValue(5)}});
  auto proxy = indexing_.CreateIndex(Rule(1, false));
  indexing_.AwaitPopulationIdle();
  ASSERT_EQ(proxy->State(), IndexState::ONLINE);
  ASSERT_EQ(proxy->Seek({PropertyValue(5)}).size(), 2);
}

TEST_F(IndexingTest, UpdatesNeverRejectDuplicatesButVerificationDoes) {
  auto proxy = indexing_.CreateIndex(Rule(1, true));
  indexing_.AwaitPopulationIdle();
  ASSERT_EQ(proxy->State(), IndexState::ONLINE);
  proxy->VerifyDeferredConstraints();

  CommitNode({label_}, {{prop_, PropertyValue("a")}});
  CommitNode({label_}, {{prop_, PropertyValue("a")}});
  ASSERT_EQ(proxy->Seek({PropertyValue("a")}).size(), 2);
  ASSERT_THROW(proxy->VerifyDeferredConstraints(), IndexEntryConflictException);
}

TEST_F(IndexingTest, ApplyUpdatesMovesEntries) {
  auto proxy = indexing_.CreateIndex(Rule(1, false));
  indexing_.AwaitPopulationIdle();
  const auto node = CommitNode({label_}, {{prop_, PropertyValue(1)}});
  ASSERT_EQ(proxy->Seek({PropertyValue(1)}), std::vector<Gid>{node});

  TransactionState change;
  change.NodeDoSetProperty(node, prop_, PropertyValue(2));
  store_.Apply(change, [this](const std::vector<NodeUpdate> &updates) { indexing_.ApplyUpdates(updates); });
  ASSERT_TRUE(proxy->Seek({PropertyValue(1)}).empty());
  ASSERT_EQ(proxy->Seek({PropertyValue(2)}), std::vector<Gid>{node});

  TransactionState unlabel;
  unlabel.NodeDoRemoveLabel(label_, node);
  store_.Apply(unlabel, [this](const std::vector<NodeUpdate> &updates) { indexing_.ApplyUpdates(updates); });
  ASSERT_EQ(proxy->EntryCount(), 0);
}

TEST_F(IndexingTest, PausedPopulationStaysPopulating) {
  CommitNode({label_}, {{prop_, PropertyValue(1)}});
  indexing_.PausePopulation();
  auto proxy = indexing_.CreateIndex(Rule(1, false));
  ASSERT_EQ(proxy->State(), IndexState::POPULATING);
  ASSERT_FALSE(proxy->AwaitStoreScanCompleted({}, 30ms, 5ms));

  int checks = 0;
  ASSERT_THROW(proxy->AwaitStoreScanCompleted(
                   [&] {
                     if (++checks > 2) throw TransactionTerminatedException("test");
                   },
                   0ms, 5ms),
               TransactionTerminatedException);

  indexing_.ResumePopulation();
  ASSERT_TRUE(proxy->AwaitStoreScanCompleted({}, 0ms, 5ms));
  ASSERT_EQ(proxy->State(), IndexState::ONLINE);
}

TEST_F(IndexingTest, DropDuringPopulationFailsIndex) {
  indexing_.PausePopulation();
  auto proxy = indexing_.CreateIndex(Rule(1, false));
  indexing_.DropIndex(IndexId::FromUint(1));
  ASSERT_FALSE(indexing_.HasIndex(IndexId::FromUint(1)));
  ASSERT_THROW(indexing_.GetIndexProxy(IndexId::FromUint(1)), IndexNotFoundKernelException);
  ASSERT_TRUE(proxy->IsDropped());
  ASSERT_EQ(proxy->State(), IndexState::FAILED);
  ASSERT_THROW(proxy->AwaitStoreScanCompleted({}, 0ms, 5ms), IndexPopulationFailedException);

  indexing_.ResumePopulation();
  indexing_.AwaitPopulationIdle();
  ASSERT_EQ(proxy->State(), IndexState::FAILED);
}

TEST_F(IndexingTest, DroppingUnknownIndexIsNoop) { indexing_.DropIndex(IndexId::FromUint(42)); }
