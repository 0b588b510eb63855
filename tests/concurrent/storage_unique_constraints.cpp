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
#include <atomic>
#include <thread>
#include <vector>

#include <gflags/gflags.h>
#include <gtest/gtest.h>

#include "flags/storage.hpp"
#include "storage/exceptions.hpp"
#include "storage/kernel.hpp"
#include "storage/ops/entity_write.hpp"
#include "storage/ops/schema_write.hpp"
#include "storage/txn/kernel_transaction.hpp"
#include "utils/logging.hpp"

const int kNumThreads = 8;

using kestrel::storage::Gid;
using kestrel::storage::KernelException;
using kestrel::storage::LabelId;
using kestrel::storage::PropertyId;
using kestrel::storage::PropertyValue;
using kestrel::storage::SchemaDescriptor;

class StorageUniqueConstraints : public ::testing::Test {
 protected:
  void SetUp() override {
    auto tx = kernel.BeginTransaction();
    // NOLINTNEXTLINE(modernize-loop-convert)
    for (int i = 0; i < kNumThreads; ++i) {
      gids[i] = tx->data_write().NodeCreate();
    }
    tx->Commit();
  }

  void CreateConstraint(const SchemaDescriptor &schema) {
    auto tx = kernel.BeginTransaction();
    tx->schema_write().UniquePropertyConstraintCreate(schema);
    tx->Commit();
  }

  kestrel::storage::Kernel kernel{kestrel::flags::StorageConfigFromFlags()};
  LabelId label{LabelId::FromUint(1)};
  PropertyId prop1{PropertyId::FromUint(1)};
  PropertyId prop2{PropertyId::FromUint(2)};
  Gid gids[kNumThreads];
};

void SetProperties(kestrel::storage::Kernel *kernel, Gid gid, const std::vector<PropertyId> &properties,
                   const std::vector<PropertyValue> &values, bool *commit_status) {
  ASSERT_EQ(properties.size(), values.size());
  *commit_status = false;
  try {
    auto tx = kernel->BeginTransaction();
    auto &write = tx->data_write();
    int value = 0;
    for (int iter = 0; iter < 1000; ++iter) {
      for (const auto &property : properties) {
        write.NodeSetProperty(gid, property, PropertyValue(value++));
      }
    }
    for (size_t i = 0; i < properties.size(); ++i) {
      write.NodeSetProperty(gid, properties[i], values[i]);
    }
    tx->Commit();
    *commit_status = true;
  } catch (const KernelException &) {
  }
}

void AddLabel(kestrel::storage::Kernel *kernel, Gid gid, LabelId label, bool *commit_status) {
  *commit_status = false;
  try {
    auto tx = kernel->BeginTransaction();
    tx->data_write().NodeAddLabel(gid, label);
    tx->Commit();
    *commit_status = true;
  } catch (const KernelException &) {
  }
}

TEST_F(StorageUniqueConstraints, ChangeProperties) {
  const auto schema = SchemaDescriptor::ForLabel(label, {prop1, prop2});
  CreateConstraint(schema);

  {
    auto tx = kernel.BeginTransaction();
    for (int i = 0; i < kNumThreads; ++i) {
      tx->data_write().NodeAddLabel(gids[i], label);
    }
    tx->Commit();
  }

  const std::vector<PropertyId> properties{prop1, prop2};
  for (int iter = 0; iter < 5; ++iter) {
    std::vector<std::thread> threads;
    threads.reserve(kNumThreads);
    bool status[kNumThreads];
    for (int i = 0; i < kNumThreads; ++i) {
      threads.emplace_back(SetProperties, &kernel, gids[i], properties,
                           std::vector<PropertyValue>{PropertyValue(100 + iter), PropertyValue(100 + iter)},
                           &status[i]);
    }
    int committed = 0;
    for (int i = 0; i < kNumThreads; ++i) {
      threads[i].join();
      if (status[i]) ++committed;
    }
    ASSERT_EQ(committed, 1);
  }

  // Distinct values never conflict.
  std::vector<std::thread> threads;
  bool status[kNumThreads];
  for (int i = 0; i < kNumThreads; ++i) {
    threads.emplace_back(SetProperties, &kernel, gids[i], properties,
                         std::vector<PropertyValue>{PropertyValue(1000 + i), PropertyValue("same")}, &status[i]);
  }
  for (int i = 0; i < kNumThreads; ++i) {
    threads[i].join();
    ASSERT_TRUE(status[i]);
  }
}

TEST_F(StorageUniqueConstraints, EquivalentNumericValuesConflict) {
  const auto schema = SchemaDescriptor::ForLabel(label, {prop1});
  CreateConstraint(schema);
  {
    auto tx = kernel.BeginTransaction();
    for (int i = 0; i < kNumThreads; ++i) {
      tx->data_write().NodeAddLabel(gids[i], label);
    }
    tx->Commit();
  }

  std::vector<std::thread> threads;
  bool status[kNumThreads];
  for (int i = 0; i < kNumThreads; ++i) {
    const auto value = i % 2 == 0 ? PropertyValue(7) : PropertyValue(7.0);
    threads.emplace_back(SetProperties, &kernel, gids[i], std::vector<PropertyId>{prop1},
                         std::vector<PropertyValue>{value}, &status[i]);
  }
  int committed = 0;
  for (int i = 0; i < kNumThreads; ++i) {
    threads[i].join();
    if (status[i]) ++committed;
  }
  ASSERT_EQ(committed, 1);
}

TEST_F(StorageUniqueConstraints, ChangeLabels) {
  const auto schema = SchemaDescriptor::ForLabel(label, {prop1});
  CreateConstraint(schema);
  {
    auto tx = kernel.BeginTransaction();
    for (int i = 0; i < kNumThreads; ++i) {
      tx->data_write().NodeSetProperty(gids[i], prop1, PropertyValue(1));
    }
    tx->Commit();
  }

  std::vector<std::thread> threads;
  bool status[kNumThreads];
  for (int i = 0; i < kNumThreads; ++i) {
    threads.emplace_back(AddLabel, &kernel, gids[i], label, &status[i]);
  }
  int committed = 0;
  for (int i = 0; i < kNumThreads; ++i) {
    threads[i].join();
    if (status[i]) ++committed;
  }
  ASSERT_EQ(committed, 1);
}

TEST_F(StorageUniqueConstraints, ConcurrentCreationOfTheSameConstraint) {
  {
    auto tx = kernel.BeginTransaction();
    for (int i = 0; i < kNumThreads; ++i) {
      tx->data_write().NodeAddLabel(gids[i], label);
      tx->data_write().NodeSetProperty(gids[i], prop1, PropertyValue(i));
    }
    tx->Commit();
  }

  const auto schema = SchemaDescriptor::ForLabel(label, {prop1});
  std::atomic<int> created{0};
  std::atomic<int> rejected{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kNumThreads; ++i) {
    threads.emplace_back([&] {
      try {
        CreateConstraint(schema);
        ++created;
      } catch (const kestrel::storage::AlreadyConstrainedException &) {
        ++rejected;
      } catch (const kestrel::storage::CreateConstraintFailureException &) {
        ++rejected;
      }
    });
  }
  for (auto &thread : threads) thread.join();

  ASSERT_GE(created.load(), 1);
  ASSERT_EQ(created.load() + rejected.load(), kNumThreads);
  ASSERT_EQ(kernel.schema().AllConstraints().size(), 1);
  ASSERT_EQ(kernel.schema().AllIndexes().size(), 1);

  const auto constraint = kernel.schema().AllConstraints().front();
  ASSERT_EQ(constraint.owned_index, kernel.schema().AllIndexes().front().id);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  kestrel::logging::RedirectToStderr();
  return RUN_ALL_TESTS();
}
