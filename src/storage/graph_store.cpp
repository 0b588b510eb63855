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
#include "storage/graph_store.hpp"

#include "storage/txn/transaction_state.hpp"
#include "utils/logging.hpp"

namespace kestrel::storage {

namespace {

template <typename TRecord, typename TState>
void ApplyProperties(TRecord &record, const TState &state) {
  for (const auto &property : state.removed_properties) {
    record.properties.erase(property);
  }
  for (const auto &[property, value] : state.set_properties) {
    record.properties.insert_or_assign(property, value);
  }
}

}  // namespace

bool GraphStore::NodeExists(const Gid node) const {
  return data_.WithReadLock([&](const auto &data) { return data.nodes.contains(node); });
}

std::optional<NodeRecord> GraphStore::GetNode(const Gid node) const {
  return data_.WithReadLock([&](const auto &data) -> std::optional<NodeRecord> {
    auto it = data.nodes.find(node);
    if (it == data.nodes.end()) return std::nullopt;
    return it->second;
  });
}

bool GraphStore::RelationshipExists(const Gid relationship) const {
  return data_.WithReadLock([&](const auto &data) { return data.relationships.contains(relationship); });
}

std::optional<RelationshipRecord> GraphStore::GetRelationship(const Gid relationship) const {
  return data_.WithReadLock([&](const auto &data) -> std::optional<RelationshipRecord> {
    auto it = data.relationships.find(relationship);
    if (it == data.relationships.end()) return std::nullopt;
    return it->second;
  });
}

std::map<PropertyId, PropertyValue> GraphStore::GraphProperties() const {
  return data_.WithReadLock([](const auto &data) { return data.graph_properties; });
}

std::vector<Gid> GraphStore::NodesWithLabel(const LabelId label) const {
  std::vector<Gid> result;
  ScanNodesWithLabel(label, [&](const Gid node, const NodeRecord &) { result.push_back(node); });
  return result;
}

std::vector<Gid> GraphStore::RelationshipsOfType(const EdgeTypeId type) const {
  return data_.WithReadLock([&](const auto &data) {
    std::vector<Gid> result;
    for (const auto &[gid, record] : data.relationships) {
      if (record.type == type) result.push_back(gid);
    }
    return result;
  });
}

size_t GraphStore::NodeCount() const {
  return data_.WithReadLock([](const auto &data) { return data.nodes.size(); });
}

size_t GraphStore::RelationshipCount() const {
  return data_.WithReadLock([](const auto &data) { return data.relationships.size(); });
}

void GraphStore::ScanNodesWithLabel(const LabelId label,
                                    const std::function<void(Gid, const NodeRecord &)> &callback) const {
  data_.WithReadLock([&](const auto &data) {
    for (const auto &[gid, record] : data.nodes) {
      if (record.labels.contains(label)) callback(gid, record);
    }
  });
}

void GraphStore::Apply(const TransactionState &state, const NodeUpdatesCallback &on_node_updates) {
  data_.WithLock([&](auto &data) {
    std::map<Gid, NodeUpdate> updates;
    auto capture_before = [&](const Gid node) {
      if (updates.contains(node)) return;
      auto it = data.nodes.find(node);
      updates.emplace(node, NodeUpdate{node, it == data.nodes.end() ? std::nullopt : std::optional{it->second},
                                       std::nullopt});
    };
    for (const auto node : state.TouchedNodes()) capture_before(node);
    for (const auto node : state.deleted_nodes()) capture_before(node);

    for (const auto relationship : state.deleted_relationships()) {
      auto it = data.relationships.find(relationship);
      if (it == data.relationships.end()) continue;
      if (auto from = data.nodes.find(it->second.from); from != data.nodes.end()) {
        from->second.relationships.erase(relationship);
      }
      if (auto to = data.nodes.find(it->second.to); to != data.nodes.end()) {
        to->second.relationships.erase(relationship);
      }
      data.relationships.erase(it);
    }

    for (const auto node : state.deleted_nodes()) {
      data.nodes.erase(node);
    }

    for (const auto node : state.created_nodes()) {
      data.nodes.try_emplace(node);
    }

    for (const auto &[node, node_state] : state.node_states()) {
      auto it = data.nodes.find(node);
      KS_ASSERT(it != data.nodes.end(), "Changes recorded for node {} which is not in the store", node.AsUint());
      auto &record = it->second;
      for (const auto &label : node_state.removed_labels) record.labels.erase(label);
      for (const auto &label : node_state.added_labels) record.labels.insert(label);
      ApplyProperties(record, node_state);
    }

    for (const auto &[relationship, created] : state.created_relationships()) {
      data.relationships.emplace(relationship, RelationshipRecord{created.type, created.from, created.to, {}});
      data.nodes.at(created.from).relationships.insert(relationship);
      data.nodes.at(created.to).relationships.insert(relationship);
    }

    for (const auto &[relationship, relationship_state] : state.relationship_states()) {
      auto it = data.relationships.find(relationship);
      KS_ASSERT(it != data.relationships.end(), "Changes recorded for relationship {} which is not in the store",
                relationship.AsUint());
      ApplyProperties(it->second, relationship_state);
    }

    for (const auto &property : state.graph_removed_properties()) {
      data.graph_properties.erase(property);
    }
    for (const auto &[property, value] : state.graph_set_properties()) {
      data.graph_properties.insert_or_assign(property, value);
    }

    std::vector<NodeUpdate> node_updates;
    node_updates.reserve(updates.size());
    for (auto &[node, update] : updates) {
      if (auto it = data.nodes.find(node); it != data.nodes.end()) update.after = it->second;
      node_updates.push_back(std::move(update));
    }
    if (on_node_updates) on_node_updates(node_updates);
  });
}

}  // namespace kestrel::storage
