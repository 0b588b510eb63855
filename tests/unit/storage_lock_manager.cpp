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

#include <atomic>
#include <chrono>
#include <thread>
#include <tuple>
#include <vector>

#include "storage/exceptions.hpp"
#include "storage/locks/lock_manager.hpp"
#include "storage/locks/resource_types.hpp"

using namespace kestrel::storage;
using namespace kestrel::storage::locks;
using namespace std::chrono_literals;

namespace {

class RecordingTracer : public LockTracer {
 public:
  void OnAcquired(ResourceType type, uint64_t resource_id, LockMode mode) override {
    acquired.emplace_back(type, resource_id, mode);
  }

  std::vector<std::tuple<ResourceType, uint64_t, LockMode>> acquired;
};

}  // namespace

class LockManagerTest : public testing::Test {
 protected:
  static Config::Locks ShortTimeout() {
    Config::Locks config;
    config.acquisition_timeout = 100ms;
    config.poll_interval = 5ms;
    return config;
  }

  LockManager manager_{ShortTimeout()};
};

TEST_F(LockManagerTest, SharedLocksAreCompatible) {
  auto first = manager_.NewClient();
  auto second = manager_.NewClient();
  first->AcquireShared(ResourceType::LABEL, 1);
  second->AcquireShared(ResourceType::LABEL, 1);
  ASSERT_TRUE(first->HoldsShared(ResourceType::LABEL, 1));
  ASSERT_TRUE(second->HoldsShared(ResourceType::LABEL, 1));
  ASSERT_EQ(manager_.ActiveLockCount(), 1);
}

TEST_F(LockManagerTest, ExclusiveBlocksOthersUntilTimeout) {
  auto first = manager_.NewClient();
  auto second = manager_.NewClient();
  first->AcquireExclusive(ResourceType::NODE, 7);
  ASSERT_THROW(second->AcquireShared(ResourceType::NODE, 7), LockAcquisitionTimeoutException);
  ASSERT_THROW(second->AcquireExclusive(ResourceType::NODE, 7), LockAcquisitionTimeoutException);
  ASSERT_FALSE(second->HoldsShared(ResourceType::NODE, 7));

  first->ReleaseExclusive(ResourceType::NODE, 7);
  second->AcquireExclusive(ResourceType::NODE, 7);
  ASSERT_TRUE(second->HoldsExclusive(ResourceType::NODE, 7));
}

TEST_F(LockManagerTest, ReentrantAndUpgrade) {
  auto client = manager_.NewClient();
  client->AcquireShared(ResourceType::LABEL, 3);
  client->AcquireShared(ResourceType::LABEL, 3);
  // Sole shared holder may upgrade.
  client->AcquireExclusive(ResourceType::LABEL, 3);
  ASSERT_TRUE(client->HoldsExclusive(ResourceType::LABEL, 3));

  client->ReleaseExclusive(ResourceType::LABEL, 3);
  client->ReleaseShared(ResourceType::LABEL, 3);
  ASSERT_TRUE(client->HoldsShared(ResourceType::LABEL, 3));
  client->ReleaseShared(ResourceType::LABEL, 3);
  ASSERT_FALSE(client->HoldsShared(ResourceType::LABEL, 3));
  ASSERT_EQ(manager_.ActiveLockCount(), 0);
}

TEST_F(LockManagerTest, ReleaseAllExclusiveDropsEveryHold) {
  auto client = manager_.NewClient();
  auto other = manager_.NewClient();
  client->AcquireShared(ResourceType::LABEL, 3);
  client->AcquireExclusive(ResourceType::LABEL, 3);
  client->AcquireExclusive(ResourceType::LABEL, 3);

  ASSERT_EQ(client->ReleaseAllExclusive(ResourceType::LABEL, 3), 2);
  ASSERT_FALSE(client->HoldsExclusive(ResourceType::LABEL, 3));
  ASSERT_TRUE(client->HoldsShared(ResourceType::LABEL, 3));
  other->AcquireShared(ResourceType::LABEL, 3);
  other->ReleaseShared(ResourceType::LABEL, 3);

  ASSERT_EQ(client->ReleaseAllExclusive(ResourceType::LABEL, 3), 0);
  ASSERT_EQ(client->ReleaseAllExclusive(ResourceType::NODE, 9), 0);
  client->ReleaseShared(ResourceType::LABEL, 3);
  ASSERT_EQ(manager_.ActiveLockCount(), 0);
}

TEST_F(LockManagerTest, UpgradeBlockedByOtherSharedHolder) {
  auto first = manager_.NewClient();
  auto second = manager_.NewClient();
  first->AcquireShared(ResourceType::LABEL, 3);
  second->AcquireShared(ResourceType::LABEL, 3);
  ASSERT_THROW(first->AcquireExclusive(ResourceType::LABEL, 3), LockAcquisitionTimeoutException);
}

TEST_F(LockManagerTest, CloseReleasesEverything) {
  auto client = manager_.NewClient();
  client->AcquireShared(ResourceType::LABEL, 1);
  client->AcquireExclusive(ResourceType::NODE, 2);
  client->AcquireExclusive(ResourceType::NODE, 2);
  client->AcquireShared(ResourceType::GRAPH_PROPERTIES, kGraphPropertiesResourceId);
  ASSERT_EQ(manager_.ActiveLockCount(), 3);
  client->Close();
  ASSERT_EQ(manager_.ActiveLockCount(), 0);

  auto other = manager_.NewClient();
  other->AcquireExclusive(ResourceType::NODE, 2);

  ASSERT_THROW(client->AcquireShared(ResourceType::LABEL, 1), NotInTransactionException);
}

TEST_F(LockManagerTest, DestructorReleases) {
  {
    auto client = manager_.NewClient();
    client->AcquireExclusive(ResourceType::RELATIONSHIP, 5);
  }
  ASSERT_EQ(manager_.ActiveLockCount(), 0);
}

TEST_F(LockManagerTest, WaiterIsGrantedAfterRelease) {
  auto holder = manager_.NewClient();
  holder->AcquireExclusive(ResourceType::INDEX_ENTRY, 11);

  std::atomic<bool> granted{false};
  std::jthread blocked([&] {
    auto client = manager_.NewClient();
    client->AcquireExclusive(ResourceType::INDEX_ENTRY, 11);
    granted.store(true);
  });
  std::this_thread::sleep_for(20ms);
  ASSERT_FALSE(granted.load());
  holder->ReleaseExclusive(ResourceType::INDEX_ENTRY, 11);
  blocked.join();
  ASSERT_TRUE(granted.load());
}

TEST_F(LockManagerTest, InterruptCheckAbortsWait) {
  Config::Locks config;
  config.acquisition_timeout = 0ms;
  config.poll_interval = 5ms;
  LockManager manager(config);

  auto holder = manager.NewClient();
  holder->AcquireExclusive(ResourceType::LABEL, 1);

  auto waiter = manager.NewClient();
  std::atomic<int> checks{0};
  waiter->SetInterruptCheck([&] {
    if (checks.fetch_add(1) >= 2) throw TransactionTerminatedException("test");
  });
  ASSERT_THROW(waiter->AcquireShared(ResourceType::LABEL, 1), TransactionTerminatedException);
  ASSERT_GE(checks.load(), 3);

  // The uninterruptible path ignores the check and only waits for the holder.
  std::jthread releaser([&] {
    std::this_thread::sleep_for(20ms);
    holder->ReleaseExclusive(ResourceType::LABEL, 1);
  });
  waiter->AcquireExclusiveUninterruptibly(ResourceType::LABEL, 1);
  ASSERT_TRUE(waiter->HoldsExclusive(ResourceType::LABEL, 1));
}

TEST_F(LockManagerTest, TracerSeesAcquisitionOrder) {
  RecordingTracer tracer;
  auto client = manager_.NewClient();
  client->SetTracer(&tracer);
  client->AcquireShared(ResourceType::LABEL, 4);
  client->AcquireExclusive(ResourceType::NODE, 9);
  ASSERT_THAT(tracer.acquired,
              testing::ElementsAre(std::make_tuple(ResourceType::LABEL, uint64_t{4}, LockMode::SHARED),
                                   std::make_tuple(ResourceType::NODE, uint64_t{9}, LockMode::EXCLUSIVE)));
}

TEST(IndexEntryResourceId, EqualValuesShareResource) {
  const auto label = LabelId::FromUint(1);
  const std::vector<PropertyId> properties{PropertyId::FromUint(2)};
  ASSERT_EQ(IndexEntryResourceId(label, properties, {PropertyValue(5)}),
            IndexEntryResourceId(label, properties, {PropertyValue(5.0)}));
  ASSERT_NE(IndexEntryResourceId(label, properties, {PropertyValue(5)}),
            IndexEntryResourceId(label, properties, {PropertyValue(6)}));
  ASSERT_NE(IndexEntryResourceId(label, properties, {PropertyValue(5)}),
            IndexEntryResourceId(LabelId::FromUint(2), properties, {PropertyValue(5)}));
}
