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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <memory>
#include <set>
#include <vector>

#include "storage/config.hpp"
#include "storage/id_types.hpp"
#include "storage/kernel.hpp"
#include "storage/locks/resource_types.hpp"
#include "storage/ops/entity_write.hpp"
#include "storage/ops/schema_write.hpp"
#include "storage/property_value.hpp"
#include "storage/txn/kernel_transaction.hpp"

namespace kestrel::storage::tests {

inline Config TestConfig() {
  Config config;
  config.locks.acquisition_timeout = std::chrono::seconds(10);
  config.locks.poll_interval = std::chrono::milliseconds(5);
  config.indices.population_await_timeout = std::chrono::seconds(30);
  config.indices.population_poll_interval = std::chrono::milliseconds(5);
  return config;
}

class MockLockTracer : public locks::LockTracer {
 public:
  MOCK_METHOD(void, OnAcquired, (locks::ResourceType type, uint64_t resource_id, locks::LockMode mode), (override));
};

/// Creates and commits a node with the given labels and properties.
inline Gid CommitNode(Kernel &kernel, const std::vector<LabelId> &labels,
                      const std::map<PropertyId, PropertyValue> &properties = {}) {
  auto tx = kernel.BeginTransaction();
  auto &write = tx->data_write();
  const auto node = write.NodeCreate();
  write.NodeAddLabels(node, labels);
  for (const auto &[property, value] : properties) {
    write.NodeSetProperty(node, property, value);
  }
  tx->Commit();
  return node;
}

inline Gid CommitRelationship(Kernel &kernel, Gid from, EdgeTypeId type, Gid to,
                              const std::map<PropertyId, PropertyValue> &properties = {}) {
  auto tx = kernel.BeginTransaction();
  auto &write = tx->data_write();
  const auto relationship = write.RelationshipCreate(from, type, to);
  for (const auto &[property, value] : properties) {
    write.RelationshipSetProperty(relationship, property, value);
  }
  tx->Commit();
  return relationship;
}

inline ConstraintDescriptor CommitUniqueConstraint(Kernel &kernel, const SchemaDescriptor &schema) {
  auto tx = kernel.BeginTransaction();
  auto constraint = tx->schema_write().UniquePropertyConstraintCreate(schema);
  tx->Commit();
  return constraint;
}

inline IndexReference CommitIndex(Kernel &kernel, const SchemaDescriptor &schema) {
  auto tx = kernel.BeginTransaction();
  auto index = tx->schema_write().IndexCreate(schema);
  tx->Commit();
  kernel.indexing().AwaitPopulationIdle();
  return index;
}

/// Number of index rules on \p schema in the committed schema store.
inline size_t CommittedIndexCount(Kernel &kernel, const SchemaDescriptor &schema) {
  size_t count = 0;
  for (const auto &rule : kernel.schema().AllIndexes()) {
    if (rule.schema == schema) ++count;
  }
  return count;
}

}  // namespace kestrel::storage::tests
