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
#include "storage/txn/transaction_state.hpp"

#include <algorithm>

namespace kestrel::storage {

namespace {

// Diff-set semantics: adding something that was removed in the same
// transaction cancels the removal instead of recording an addition.
template <typename T>
void DiffAdd(std::set<T> &added, std::set<T> &removed, const T &element) {
  if (removed.erase(element) == 0) added.insert(element);
}

template <typename T>
void DiffRemove(std::set<T> &added, std::set<T> &removed, const T &element) {
  if (added.erase(element) == 0) removed.insert(element);
}

}  // namespace

void TransactionState::NodeDoCreate(const Gid node) { created_nodes_.insert(node); }

void TransactionState::NodeDoDelete(const Gid node) {
  if (created_nodes_.erase(node) == 0) {
    deleted_nodes_.insert(node);
  }
  node_states_.erase(node);
}

void TransactionState::NodeDoAddLabel(const LabelId label, const Gid node) {
  auto &state = node_states_[node];
  DiffAdd(state.added_labels, state.removed_labels, label);
}

void TransactionState::NodeDoRemoveLabel(const LabelId label, const Gid node) {
  auto &state = node_states_[node];
  DiffRemove(state.added_labels, state.removed_labels, label);
}

void TransactionState::NodeDoSetProperty(const Gid node, const PropertyId property, const PropertyValue &value) {
  auto &state = node_states_[node];
  state.removed_properties.erase(property);
  state.set_properties.insert_or_assign(property, value);
}

void TransactionState::NodeDoRemoveProperty(const Gid node, const PropertyId property) {
  auto &state = node_states_[node];
  state.set_properties.erase(property);
  state.removed_properties.insert(property);
}

const NodeState *TransactionState::GetNodeState(const Gid node) const {
  auto it = node_states_.find(node);
  return it == node_states_.end() ? nullptr : &it->second;
}

void TransactionState::RelationshipDoCreate(const Gid relationship, const EdgeTypeId type, const Gid from,
                                            const Gid to) {
  created_relationships_.emplace(relationship, CreatedRelationship{type, from, to});
}

void TransactionState::RelationshipDoDelete(const Gid relationship) {
  deleted_relationships_.insert(relationship);
  relationship_states_.erase(relationship);
}

void TransactionState::RelationshipDoDeleteAddedInThisTx(const Gid relationship) {
  created_relationships_.erase(relationship);
  relationship_states_.erase(relationship);
}

void TransactionState::RelationshipDoSetProperty(const Gid relationship, const PropertyId property,
                                                 const PropertyValue &value) {
  auto &state = relationship_states_[relationship];
  state.removed_properties.erase(property);
  state.set_properties.insert_or_assign(property, value);
}

void TransactionState::RelationshipDoRemoveProperty(const Gid relationship, const PropertyId property) {
  auto &state = relationship_states_[relationship];
  state.set_properties.erase(property);
  state.removed_properties.insert(property);
}

const RelationshipState *TransactionState::GetRelationshipState(const Gid relationship) const {
  auto it = relationship_states_.find(relationship);
  return it == relationship_states_.end() ? nullptr : &it->second;
}

void TransactionState::GraphDoSetProperty(const PropertyId property, const PropertyValue &value) {
  graph_removed_properties_.erase(property);
  graph_set_properties_.insert_or_assign(property, value);
}

void TransactionState::GraphDoRemoveProperty(const PropertyId property) {
  graph_set_properties_.erase(property);
  graph_removed_properties_.insert(property);
}

void TransactionState::IndexRuleDoAdd(IndexRule rule) {
  const auto id = rule.id;
  added_indexes_.insert_or_assign(id, std::move(rule));
}

void TransactionState::IndexDoDrop(const IndexReference &index) {
  if (added_indexes_.erase(index.id()) == 0) {
    removed_indexes_.insert_or_assign(index.id(), index);
  }
  index_entry_changes_.erase(index.id());
}

bool TransactionState::IndexDoUnRemove(const IndexReference &index) { return removed_indexes_.erase(index.id()) > 0; }

void TransactionState::ConstraintDoAdd(ConstraintRule rule) {
  const auto id = rule.id;
  added_constraints_.insert_or_assign(id, std::move(rule));
}

void TransactionState::ConstraintDoDrop(const ConstraintRule &rule, const std::optional<IndexReference> &owned_index) {
  if (added_constraints_.erase(rule.id) == 0) {
    removed_constraints_.insert_or_assign(rule.id, rule);
  }
  if (owned_index) {
    IndexDoDrop(*owned_index);
  }
}

std::optional<ConstraintRule> TransactionState::ConstraintDoUnRemove(const ConstraintDescriptor &constraint) {
  auto it = std::find_if(removed_constraints_.begin(), removed_constraints_.end(),
                         [&](const auto &entry) { return entry.second.descriptor == constraint; });
  if (it == removed_constraints_.end()) return std::nullopt;
  auto rule = std::move(it->second);
  removed_constraints_.erase(it);
  return rule;
}

void TransactionState::IndexDoUpdateEntry(const IndexId index, const Gid node, const std::optional<ValueTuple> &before,
                                          const std::optional<ValueTuple> &after) {
  auto &entries = index_entry_changes_[index];
  if (before) {
    auto &changes = entries[*before];
    DiffRemove(changes.added, changes.removed, node);
  }
  if (after) {
    auto &changes = entries[*after];
    DiffAdd(changes.added, changes.removed, node);
  }
}

const IndexEntryChanges *TransactionState::GetIndexEntryChanges(const IndexId index, const ValueTuple &values) const {
  auto index_it = index_entry_changes_.find(index);
  if (index_it == index_entry_changes_.end()) return nullptr;
  auto it = index_it->second.find(values);
  return it == index_it->second.end() ? nullptr : &it->second;
}

bool TransactionState::HasChanges() const {
  return !created_nodes_.empty() || !deleted_nodes_.empty() || !node_states_.empty() ||
         !created_relationships_.empty() || !deleted_relationships_.empty() || !relationship_states_.empty() ||
         !graph_set_properties_.empty() || !graph_removed_properties_.empty() || HasSchemaChanges();
}

bool TransactionState::HasSchemaChanges() const {
  return !added_indexes_.empty() || !removed_indexes_.empty() || !added_constraints_.empty() ||
         !removed_constraints_.empty();
}

std::set<Gid> TransactionState::TouchedNodes() const {
  std::set<Gid> touched = created_nodes_;
  for (const auto &[node, state] : node_states_) {
    touched.insert(node);
  }
  return touched;
}

std::set<Gid> TransactionState::TouchedRelationships() const {
  std::set<Gid> touched;
  for (const auto &[relationship, created] : created_relationships_) {
    touched.insert(relationship);
  }
  for (const auto &[relationship, state] : relationship_states_) {
    touched.insert(relationship);
  }
  return touched;
}

}  // namespace kestrel::storage
