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
#include <condition_variable>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "storage/id_types.hpp"
#include "storage/index_reference.hpp"
#include "storage/property_value.hpp"
#include "storage/schema_rules.hpp"
#include "storage/txn/transaction_state.hpp"

namespace kestrel::storage {

class GraphStore;

/// Values a node contributes to an index on \p schema, or std::nullopt when
/// the node lacks the label or any of the properties.
std::optional<ValueTuple> IndexTupleOf(const SchemaDescriptor &schema, const std::set<LabelId> &labels,
                                       const std::map<PropertyId, PropertyValue> &properties);

/**
 * One live index: its rule, its population state and its entries. Entries are
 * exact-match buckets from value tuple to nodes. Updates never reject
 * duplicates, even for unique indexes; duplicates are reported by the initial
 * scan and by VerifyDeferredConstraints.
 */
class IndexProxy final {
 public:
  explicit IndexProxy(IndexRule rule) : rule_(std::move(rule)) {}

  IndexId id() const { return rule_.id; }
  const SchemaDescriptor &schema() const { return rule_.schema; }
  bool IsUnique() const { return rule_.unique; }
  IndexReference Reference() const { return rule_.Reference(); }
  IndexCapability Capability() const { return IndexCapability::ForSchema(rule_.schema); }

  IndexState State() const;
  std::exception_ptr FailureCause() const;
  std::string FailureMessage() const;

  std::vector<Gid> Seek(const ValueTuple &values) const;
  size_t EntryCount() const;

  /// Blocks until the initial scan is done, calling \p interrupt_check every
  /// \p poll_interval. A zero \p timeout waits without a bound.
  /// @return false if the timeout expired first.
  /// @throw IndexPopulationFailedException if population failed.
  bool AwaitStoreScanCompleted(const std::function<void()> &interrupt_check, std::chrono::milliseconds timeout,
                               std::chrono::milliseconds poll_interval) const;

  /// @throw IndexEntryConflictException on the first value tuple held by more than one node.
  void VerifyDeferredConstraints() const;

  /// Scans the committed store and turns the index ONLINE, or FAILED with the cause.
  void Populate(const GraphStore &store);
  void ApplyUpdate(Gid node, const std::optional<ValueTuple> &before, const std::optional<ValueTuple> &after);
  /// Fails a population that is still running and discards the entries.
  void MarkDropped();
  bool IsDropped() const;

 private:
  void AddEntry(Gid node, const ValueTuple &values);
  void RemoveEntry(Gid node, const ValueTuple &values);

  IndexRule rule_;

  mutable std::mutex mutex_;
  mutable std::condition_variable state_cv_;
  IndexState state_{IndexState::POPULATING};
  std::exception_ptr failure_;
  bool dropped_{false};
  std::map<ValueTuple, std::set<Gid>> entries_;
};

}  // namespace kestrel::storage
