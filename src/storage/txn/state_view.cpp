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
#include "storage/txn/state_view.hpp"

#include <algorithm>

namespace kestrel::storage {

namespace {

template <typename TState>
void OverlayProperties(std::map<PropertyId, PropertyValue> &properties, const TState *state) {
  if (!state) return;
  for (const auto &property : state->removed_properties) properties.erase(property);
  for (const auto &[property, value] : state->set_properties) properties.insert_or_assign(property, value);
}

}  // namespace

bool StateView::NodeExists(const Gid node) const {
  if (state_->NodeIsAddedInThisTx(node)) return true;
  if (state_->NodeIsDeletedInThisTx(node)) return false;
  return store_->NodeExists(node);
}

std::optional<NodeSnapshot> StateView::GetNode(const Gid node) const {
  NodeSnapshot snapshot{.gid = node, .labels = {}, .properties = {}};
  if (!state_->NodeIsAddedInThisTx(node)) {
    if (state_->NodeIsDeletedInThisTx(node)) return std::nullopt;
    auto record = store_->GetNode(node);
    if (!record) return std::nullopt;
    snapshot.labels = std::move(record->labels);
    snapshot.properties = std::move(record->properties);
  }
  if (const auto *node_state = state_->GetNodeState(node)) {
    for (const auto &label : node_state->removed_labels) snapshot.labels.erase(label);
    for (const auto &label : node_state->added_labels) snapshot.labels.insert(label);
    OverlayProperties(snapshot.properties, node_state);
  }
  return snapshot;
}

bool StateView::RelationshipExists(const Gid relationship) const {
  if (state_->RelationshipIsAddedInThisTx(relationship)) return true;
  if (state_->RelationshipIsDeletedInThisTx(relationship)) return false;
  return store_->RelationshipExists(relationship);
}

std::optional<RelationshipSnapshot> StateView::GetRelationship(const Gid relationship) const {
  std::optional<RelationshipSnapshot> snapshot;
  if (auto it = state_->created_relationships().find(relationship); it != state_->created_relationships().end()) {
    snapshot = RelationshipSnapshot{relationship, it->second.type, it->second.from, it->second.to, {}};
  } else {
    if (state_->RelationshipIsDeletedInThisTx(relationship)) return std::nullopt;
    auto record = store_->GetRelationship(relationship);
    if (!record) return std::nullopt;
    snapshot = RelationshipSnapshot{relationship, record->type, record->from, record->to,
                                    std::move(record->properties)};
  }
  OverlayProperties(snapshot->properties, state_->GetRelationshipState(relationship));
  return snapshot;
}

std::map<PropertyId, PropertyValue> StateView::GraphProperties() const {
  auto properties = store_->GraphProperties();
  for (const auto &property : state_->graph_removed_properties()) properties.erase(property);
  for (const auto &[property, value] : state_->graph_set_properties()) properties.insert_or_assign(property, value);
  return properties;
}

std::vector<Gid> StateView::NodesWithLabel(const LabelId label) const {
  std::set<Gid> result;
  for (const auto node : store_->NodesWithLabel(label)) {
    if (state_->NodeIsDeletedInThisTx(node)) continue;
    const auto *node_state = state_->GetNodeState(node);
    if (node_state && node_state->removed_labels.contains(label)) continue;
    result.insert(node);
  }
  for (const auto &[node, node_state] : state_->node_states()) {
    if (node_state.added_labels.contains(label)) result.insert(node);
  }
  return {result.begin(), result.end()};
}

std::vector<Gid> StateView::RelationshipsOfType(const EdgeTypeId type) const {
  std::set<Gid> result;
  for (const auto relationship : store_->RelationshipsOfType(type)) {
    if (!state_->RelationshipIsDeletedInThisTx(relationship)) result.insert(relationship);
  }
  for (const auto &[relationship, created] : state_->created_relationships()) {
    if (created.type == type) result.insert(relationship);
  }
  return {result.begin(), result.end()};
}

std::vector<Gid> StateView::NodeRelationships(const Gid node) const {
  std::set<Gid> result;
  if (!state_->NodeIsAddedInThisTx(node)) {
    if (auto record = store_->GetNode(node)) {
      for (const auto relationship : record->relationships) {
        if (!state_->RelationshipIsDeletedInThisTx(relationship)) result.insert(relationship);
      }
    }
  }
  for (const auto &[relationship, created] : state_->created_relationships()) {
    if (created.from == node || created.to == node) result.insert(relationship);
  }
  return {result.begin(), result.end()};
}

std::optional<IndexReference> StateView::IndexGetForSchema(const SchemaDescriptor &schema) const {
  for (const auto &[id, rule] : state_->added_indexes()) {
    if (rule.schema == schema) return rule.Reference();
  }
  auto committed = schema_->IndexForSchema(schema);
  if (!committed || state_->IndexIsRemovedInThisTx(committed->id)) return std::nullopt;
  return committed->Reference();
}

std::vector<IndexReference> StateView::IndexesGetForLabel(const LabelId label) const {
  std::vector<IndexReference> result;
  for (const auto &rule : schema_->IndexesForLabel(label)) {
    if (!state_->IndexIsRemovedInThisTx(rule.id)) result.push_back(rule.Reference());
  }
  for (const auto &[id, rule] : state_->added_indexes()) {
    if (rule.schema.IsNodeSchema() && rule.schema.label() == label) result.push_back(rule.Reference());
  }
  return result;
}

std::vector<IndexReference> StateView::IndexesGetAll() const {
  std::vector<IndexReference> result;
  for (const auto &rule : schema_->AllIndexes()) {
    if (!state_->IndexIsRemovedInThisTx(rule.id)) result.push_back(rule.Reference());
  }
  for (const auto &[id, rule] : state_->added_indexes()) result.push_back(rule.Reference());
  return result;
}

std::optional<ConstraintId> StateView::IndexGetOwningConstraint(const IndexReference &index) const {
  for (const auto &[id, rule] : state_->added_constraints()) {
    if (rule.owned_index == index.id()) return id;
  }
  auto committed = schema_->GetIndex(index.id());
  if (!committed || !committed->owning_constraint) return std::nullopt;
  if (state_->ConstraintIsRemovedInThisTx(*committed->owning_constraint)) return std::nullopt;
  return committed->owning_constraint;
}

IndexState StateView::IndexGetState(const IndexReference &index) const {
  if (state_->IndexIsAddedInThisTx(index.id())) return IndexState::POPULATING;
  return indexing_->GetIndexProxy(index.id())->State();
}

std::string StateView::IndexGetFailure(const IndexReference &index) const {
  if (state_->IndexIsAddedInThisTx(index.id())) return {};
  return indexing_->GetIndexProxy(index.id())->FailureMessage();
}

std::optional<ConstraintRule> StateView::ConstraintGet(const ConstraintDescriptor &constraint) const {
  for (const auto &[id, rule] : state_->added_constraints()) {
    if (rule.descriptor == constraint) return rule;
  }
  auto committed = schema_->ConstraintForDescriptor(constraint);
  if (!committed || state_->ConstraintIsRemovedInThisTx(committed->id)) return std::nullopt;
  return committed;
}

std::vector<ConstraintRule> StateView::FilterConstraints(
    std::vector<ConstraintRule> committed, const std::function<bool(const ConstraintRule &)> &matches) const {
  std::erase_if(committed, [&](const auto &rule) { return state_->ConstraintIsRemovedInThisTx(rule.id); });
  for (const auto &[id, rule] : state_->added_constraints()) {
    if (matches(rule)) committed.push_back(rule);
  }
  return committed;
}

std::vector<ConstraintRule> StateView::ConstraintsGetForLabel(const LabelId label) const {
  return FilterConstraints(schema_->ConstraintsForEntityToken(EntityType::NODE, label.AsUint()),
                           [&](const ConstraintRule &rule) {
                             const auto &schema = rule.descriptor.schema();
                             return schema.IsNodeSchema() && schema.label() == label;
                           });
}

std::vector<ConstraintRule> StateView::ConstraintsGetForRelationshipType(const EdgeTypeId type) const {
  return FilterConstraints(schema_->ConstraintsForEntityToken(EntityType::RELATIONSHIP, type.AsUint()),
                           [&](const ConstraintRule &rule) {
                             const auto &schema = rule.descriptor.schema();
                             return !schema.IsNodeSchema() && schema.relationship_type() == type;
                           });
}

std::vector<ConstraintRule> StateView::ConstraintsGetForSchema(const SchemaDescriptor &schema) const {
  return FilterConstraints(schema_->ConstraintsForSchema(schema),
                           [&](const ConstraintRule &rule) { return rule.descriptor.schema() == schema; });
}

std::vector<ConstraintRule> StateView::ConstraintsGetAll() const {
  return FilterConstraints(schema_->AllConstraints(), [](const ConstraintRule &) { return true; });
}

std::vector<Gid> StateView::NodeIndexSeek(const IndexReference &index, const ValueTuple &values) const {
  std::set<Gid> result;
  if (!state_->IndexIsAddedInThisTx(index.id())) {
    for (const auto node : indexing_->GetIndexProxy(index.id())->Seek(values)) result.insert(node);
  }
  if (const auto *changes = state_->GetIndexEntryChanges(index.id(), values)) {
    for (const auto node : changes->removed) result.erase(node);
    for (const auto node : changes->added) result.insert(node);
  }
  std::erase_if(result, [&](const Gid node) { return !NodeExists(node); });
  return {result.begin(), result.end()};
}

}  // namespace kestrel::storage
