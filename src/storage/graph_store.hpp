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

#include <atomic>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <vector>

#include "storage/id_types.hpp"
#include "storage/property_value.hpp"
#include "utils/synchronized.hpp"

namespace kestrel::storage {

class TransactionState;

struct NodeRecord {
  std::set<LabelId> labels;
  std::map<PropertyId, PropertyValue> properties;
  std::set<Gid> relationships;
};

struct RelationshipRecord {
  EdgeTypeId type;
  Gid from;
  Gid to;
  std::map<PropertyId, PropertyValue> properties;
};

/// A node as it was before and after a commit. A missing side means the node
/// did not exist on that side of the commit.
struct NodeUpdate {
  Gid node;
  std::optional<NodeRecord> before;
  std::optional<NodeRecord> after;
};

using NodeUpdatesCallback = std::function<void(const std::vector<NodeUpdate> &)>;

/**
 * Committed graph data: nodes, relationships and graph properties. Readers see
 * only committed data; transactions overlay their own changes through
 * StateView and merge them here with Apply at commit.
 */
class GraphStore final {
 public:
  GraphStore() = default;

  Gid ReserveNodeId() { return Gid::FromUint(next_node_id_.fetch_add(1, std::memory_order_acq_rel)); }
  Gid ReserveRelationshipId() {
    return Gid::FromUint(next_relationship_id_.fetch_add(1, std::memory_order_acq_rel));
  }

  bool NodeExists(Gid node) const;
  std::optional<NodeRecord> GetNode(Gid node) const;
  bool RelationshipExists(Gid relationship) const;
  std::optional<RelationshipRecord> GetRelationship(Gid relationship) const;
  std::map<PropertyId, PropertyValue> GraphProperties() const;

  std::vector<Gid> NodesWithLabel(LabelId label) const;
  std::vector<Gid> RelationshipsOfType(EdgeTypeId type) const;
  size_t NodeCount() const;
  size_t RelationshipCount() const;

  /// Calls \p callback for every node carrying \p label while holding the
  /// store's read lock, so no commit interleaves with the scan.
  void ScanNodesWithLabel(LabelId label, const std::function<void(Gid, const NodeRecord &)> &callback) const;

  /// Merges a committed transaction. \p on_node_updates receives the before
  /// and after image of every node the transaction changed and runs before
  /// the store's write lock is released.
  void Apply(const TransactionState &state, const NodeUpdatesCallback &on_node_updates);

 private:
  struct Data {
    std::map<Gid, NodeRecord> nodes;
    std::map<Gid, RelationshipRecord> relationships;
    std::map<PropertyId, PropertyValue> graph_properties;
  };

  utils::Synchronized<Data, std::shared_mutex> data_;
  std::atomic<uint64_t> next_node_id_{0};
  std::atomic<uint64_t> next_relationship_id_{0};
};

}  // namespace kestrel::storage
