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
#include "storage/ops/entity_write.hpp"

#include <algorithm>
#include <exception>
#include <map>
#include <set>

#include "storage/exceptions.hpp"
#include "storage/kernel.hpp"
#include "storage/locks/resource_types.hpp"
#include "storage/txn/kernel_transaction.hpp"
#include "utils/logging.hpp"

namespace kestrel::storage {

namespace {

using locks::ResourceType;

PropertyValue ReadProperty(const std::map<PropertyId, PropertyValue> &properties, const PropertyId property) {
  for (const auto &[key, value] : properties) {
    if (key == property) return value;
  }
  return PropertyValue();
}

std::optional<ValueTuple> ExactValues(const SchemaDescriptor &schema,
                                      const std::map<PropertyId, PropertyValue> &properties) {
  ValueTuple values;
  values.reserve(schema.properties().size());
  for (const auto property : schema.properties()) {
    auto it = properties.find(property);
    if (it == properties.end() || it->second.IsNull()) return std::nullopt;
    values.push_back(it->second);
  }
  return values;
}

}  // namespace

void EntityWrite::AcquireExclusiveNodeLock(const Gid node) {
  if (!transaction_->state().NodeIsAddedInThisTx(node)) {
    transaction_->locks().AcquireExclusive(ResourceType::NODE, node.AsUint());
  }
}

void EntityWrite::AcquireExclusiveRelationshipLock(const Gid relationship) {
  if (!transaction_->state().RelationshipIsAddedInThisTx(relationship)) {
    transaction_->locks().AcquireExclusive(ResourceType::RELATIONSHIP, relationship.AsUint());
  }
}

void EntityWrite::LockRelationshipNodes(const Gid first, const Gid second) {
  const auto lower = std::min(first, second);
  const auto upper = std::max(first, second);
  AcquireExclusiveNodeLock(lower);
  if (upper != lower) AcquireExclusiveNodeLock(upper);
}

NodeSnapshot EntityWrite::SingleNode(const Gid node) const {
  auto snapshot = transaction_->view().GetNode(node);
  if (!snapshot) throw EntityNotFoundException(EntityType::NODE, node);
  return std::move(*snapshot);
}

RelationshipSnapshot EntityWrite::SingleRelationship(const Gid relationship) const {
  auto snapshot = transaction_->view().GetRelationship(relationship);
  if (!snapshot) throw EntityNotFoundException(EntityType::RELATIONSHIP, relationship);
  return std::move(*snapshot);
}

Gid EntityWrite::NodeCreate() {
  transaction_->AssertOpen();
  const auto node = kernel_->store().ReserveNodeId();
  transaction_->state().NodeDoCreate(node);
  return node;
}

bool EntityWrite::NodeDelete(const Gid node) {
  transaction_->AssertOpen();
  auto &state = transaction_->state();
  if (state.NodeIsAddedInThisTx(node)) {
    state.NodeDoDelete(node);
    return true;
  }
  if (state.NodeIsDeletedInThisTx(node)) {
    return false;
  }

  AcquireExclusiveNodeLock(node);
  transaction_->AssertOpen();
  if (!kernel_->store().NodeExists(node)) {
    return false;
  }
  state.NodeDoDelete(node);
  return true;
}

uint64_t EntityWrite::NodeDetachDelete(const Gid node) {
  transaction_->AssertOpen();
  const auto &view = transaction_->view();

  std::set<Gid> nodes{node};
  for (const auto relationship : view.NodeRelationships(node)) {
    if (auto snapshot = view.GetRelationship(relationship)) {
      nodes.insert(snapshot->from);
      nodes.insert(snapshot->to);
    }
  }
  for (const auto to_lock : nodes) {
    AcquireExclusiveNodeLock(to_lock);
  }
  transaction_->AssertOpen();
  if (!view.NodeExists(node)) return 0;

  uint64_t deleted = 0;
  for (const auto relationship : view.NodeRelationships(node)) {
    if (RelationshipDelete(relationship)) ++deleted;
  }
  NodeDelete(node);
  return deleted;
}

Gid EntityWrite::RelationshipCreate(const Gid from, const EdgeTypeId type, const Gid to) {
  transaction_->locks().AcquireShared(ResourceType::RELATIONSHIP_TYPE, type.AsUint());
  LockRelationshipNodes(from, to);
  transaction_->AssertOpen();

  const auto &view = transaction_->view();
  if (!view.NodeExists(from)) throw EntityNotFoundException(EntityType::NODE, from);
  if (!view.NodeExists(to)) throw EntityNotFoundException(EntityType::NODE, to);

  const auto relationship = kernel_->store().ReserveRelationshipId();
  transaction_->state().RelationshipDoCreate(relationship, type, from, to);
  return relationship;
}

bool EntityWrite::RelationshipDelete(const Gid relationship) {
  transaction_->AssertOpen();
  const auto &view = transaction_->view();
  // The endpoints are needed to lock them, so read the relationship first and
  // check again once the locks are held.
  auto snapshot = view.GetRelationship(relationship);
  if (!snapshot) return false;

  LockRelationshipNodes(snapshot->from, snapshot->to);
  AcquireExclusiveRelationshipLock(relationship);
  if (!view.RelationshipExists(relationship)) return false;
  transaction_->AssertOpen();

  auto &state = transaction_->state();
  if (state.RelationshipIsAddedInThisTx(relationship)) {
    state.RelationshipDoDeleteAddedInThisTx(relationship);
  } else {
    state.RelationshipDoDelete(relationship);
  }
  return true;
}

bool EntityWrite::NodeAddLabel(const Gid node, const LabelId label) {
  transaction_->locks().AcquireShared(ResourceType::LABEL, label.AsUint());
  AcquireExclusiveNodeLock(node);
  transaction_->AssertOpen();

  auto snapshot = SingleNode(node);
  if (snapshot.labels.contains(label)) {
    return false;
  }

  CheckUniquenessOnLabelAdd(snapshot, label);
  transaction_->state().NodeDoAddLabel(label, node);
  updater_->OnLabelChange(label, snapshot, LabelChangeType::ADDED_LABEL);
  return true;
}

uint64_t EntityWrite::NodeAddLabels(const Gid node, const std::vector<LabelId> &labels) {
  uint64_t added = 0;
  for (const auto label : labels) {
    if (NodeAddLabel(node, label)) ++added;
  }
  return added;
}

bool EntityWrite::NodeRemoveLabel(const Gid node, const LabelId label) {
  AcquireExclusiveNodeLock(node);
  transaction_->AssertOpen();

  auto snapshot = SingleNode(node);
  if (!snapshot.labels.contains(label)) {
    return false;
  }

  transaction_->state().NodeDoRemoveLabel(label, node);
  updater_->OnLabelChange(label, snapshot, LabelChangeType::REMOVED_LABEL);
  return true;
}

uint64_t EntityWrite::NodeRemoveLabels(const Gid node, const std::vector<LabelId> &labels) {
  uint64_t removed = 0;
  for (const auto label : labels) {
    if (NodeRemoveLabel(node, label)) ++removed;
  }
  return removed;
}

void EntityWrite::CheckUniquenessOnLabelAdd(const NodeSnapshot &node, const LabelId label) {
  for (const auto &rule : transaction_->view().ConstraintsGetForLabel(label)) {
    if (!rule.descriptor.EnforcesUniqueness()) continue;
    if (auto values = ExactValues(rule.descriptor.schema(), node.properties)) {
      ValidateNoExistingNodeWithExactValues(rule.descriptor, *values, node.gid);
    }
  }
}

void EntityWrite::CheckUniquenessOnPropertySet(const NodeSnapshot &node, const PropertyId property,
                                               const PropertyValue &value) {
  const auto &view = transaction_->view();
  for (const auto label : node.labels) {
    for (const auto &rule : view.ConstraintsGetForLabel(label)) {
      const auto &constraint = rule.descriptor;
      if (!constraint.EnforcesUniqueness() || !constraint.schema().HasProperty(property)) continue;
      // An identical value was already validated when it was written.
      if (!PropertyValueHasChanged(ReadProperty(node.properties, property), value)) continue;

      auto properties = node.properties;
      properties.insert_or_assign(property, value);
      if (auto values = ExactValues(constraint.schema(), properties)) {
        ValidateNoExistingNodeWithExactValues(constraint, *values, node.gid);
      }
    }
  }
}

void EntityWrite::ValidateNoExistingNodeWithExactValues(const ConstraintDescriptor &constraint,
                                                        const ValueTuple &values, const Gid modified_node) {
  const auto &view = transaction_->view();
  try {
    auto index = view.IndexGetForSchema(constraint.schema());
    if (!index) {
      throw IndexNotFoundKernelException(fmt::format("No index backs {}.", constraint.ToString()));
    }

    transaction_->locks().AcquireExclusive(ResourceType::INDEX_ENTRY,
                                           locks::IndexEntryResourceId(index->label(), index->properties(), values));

    if (const auto state = view.IndexGetState(*index); state != IndexState::ONLINE) {
      throw IndexBrokenKernelException(fmt::format("Index {} is {}. {}", index->ToString(), IndexStateToString(state),
                                                   view.IndexGetFailure(*index)));
    }

    const auto nodes = view.NodeIndexSeek(*index, values);
    auto conflicting = std::find_if(nodes.begin(), nodes.end(), [&](const Gid gid) { return gid != modified_node; });
    if (conflicting != nodes.end()) {
      throw UniquePropertyValueValidationException(
          constraint, ConstraintValidationPhase::VALIDATION,
          std::vector<IndexEntryConflict>{
              IndexEntryConflict{.existing_node = *conflicting, .added_node = modified_node, .values = values}});
    }
  } catch (const IndexNotFoundKernelException &) {
    throw UnableToValidateConstraintException(constraint, std::current_exception());
  } catch (const IndexBrokenKernelException &) {
    throw UnableToValidateConstraintException(constraint, std::current_exception());
  } catch (const IndexNotApplicableKernelException &) {
    throw UnableToValidateConstraintException(constraint, std::current_exception());
  }
}

PropertyValue EntityWrite::NodeSetProperty(const Gid node, const PropertyId property, const PropertyValue &value) {
  if (value.IsNull()) return NodeRemoveProperty(node, property);

  AcquireExclusiveNodeLock(node);
  transaction_->AssertOpen();

  auto snapshot = SingleNode(node);
  for (const auto label : snapshot.labels) {
    transaction_->locks().AcquireShared(ResourceType::LABEL, label.AsUint());
  }
  CheckUniquenessOnPropertySet(snapshot, property, value);

  auto existing = ReadProperty(snapshot.properties, property);
  if (existing.IsNull()) {
    transaction_->state().NodeDoSetProperty(node, property, value);
    updater_->OnPropertyAdd(snapshot, property, value);
    return existing;
  }
  if (PropertyValueHasChanged(existing, value)) {
    transaction_->state().NodeDoSetProperty(node, property, value);
    updater_->OnPropertyChange(snapshot, property, value);
  }
  return existing;
}

PropertyValue EntityWrite::NodeRemoveProperty(const Gid node, const PropertyId property) {
  AcquireExclusiveNodeLock(node);
  transaction_->AssertOpen();

  auto snapshot = SingleNode(node);
  auto existing = ReadProperty(snapshot.properties, property);
  if (!existing.IsNull()) {
    transaction_->state().NodeDoRemoveProperty(node, property);
    updater_->OnPropertyRemove(snapshot, property);
  }
  return existing;
}

PropertyValue EntityWrite::RelationshipSetProperty(const Gid relationship, const PropertyId property,
                                                   const PropertyValue &value) {
  if (value.IsNull()) return RelationshipRemoveProperty(relationship, property);

  AcquireExclusiveRelationshipLock(relationship);
  transaction_->AssertOpen();

  auto snapshot = SingleRelationship(relationship);
  auto existing = ReadProperty(snapshot.properties, property);
  if (existing.IsNull() || PropertyValueHasChanged(existing, value)) {
    transaction_->state().RelationshipDoSetProperty(relationship, property, value);
  }
  return existing;
}

PropertyValue EntityWrite::RelationshipRemoveProperty(const Gid relationship, const PropertyId property) {
  AcquireExclusiveRelationshipLock(relationship);
  transaction_->AssertOpen();

  auto snapshot = SingleRelationship(relationship);
  auto existing = ReadProperty(snapshot.properties, property);
  if (!existing.IsNull()) {
    transaction_->state().RelationshipDoRemoveProperty(relationship, property);
  }
  return existing;
}

PropertyValue EntityWrite::GraphSetProperty(const PropertyId property, const PropertyValue &value) {
  if (value.IsNull()) return GraphRemoveProperty(property);

  transaction_->locks().AcquireExclusive(ResourceType::GRAPH_PROPERTIES, locks::kGraphPropertiesResourceId);
  transaction_->AssertOpen();

  auto existing = ReadProperty(transaction_->view().GraphProperties(), property);
  if (existing.IsNull() || PropertyValueHasChanged(existing, value)) {
    transaction_->state().GraphDoSetProperty(property, value);
  }
  return existing;
}

PropertyValue EntityWrite::GraphRemoveProperty(const PropertyId property) {
  transaction_->locks().AcquireExclusive(ResourceType::GRAPH_PROPERTIES, locks::kGraphPropertiesResourceId);
  transaction_->AssertOpen();

  auto existing = ReadProperty(transaction_->view().GraphProperties(), property);
  if (!existing.IsNull()) {
    transaction_->state().GraphDoRemoveProperty(property);
  }
  return existing;
}

std::optional<Gid> EntityWrite::LockingUniqueIndexSeek(const IndexReference &index, const ValueTuple &values) {
  transaction_->AssertOpen();
  if (!index.IsUnique() || values.size() != index.properties().size()) {
    throw IndexNotApplicableKernelException(
        fmt::format("Index {} cannot answer a unique lookup of {} value(s).", index.ToString(), values.size()));
  }
  const auto &view = transaction_->view();
  if (const auto state = view.IndexGetState(index); state != IndexState::ONLINE) {
    throw IndexBrokenKernelException(
        fmt::format("Index {} is {}. {}", index.ToString(), IndexStateToString(state), view.IndexGetFailure(index)));
  }

  auto &locks = transaction_->locks();
  const auto resource = locks::IndexEntryResourceId(index.label(), index.properties(), values);
  // A shared lock suffices to read an existing entry; an absent entry is
  // locked exclusively so the caller can create it.
  locks.AcquireShared(ResourceType::INDEX_ENTRY, resource);
  auto nodes = view.NodeIndexSeek(index, values);
  if (!nodes.empty()) return nodes.front();

  locks.ReleaseShared(ResourceType::INDEX_ENTRY, resource);
  locks.AcquireExclusive(ResourceType::INDEX_ENTRY, resource);
  nodes = view.NodeIndexSeek(index, values);
  if (nodes.empty()) return std::nullopt;
  return nodes.front();
}

void EntityWrite::LockNodes(const std::vector<Gid> &nodes) {
  std::set<Gid> ordered(nodes.begin(), nodes.end());
  for (const auto node : ordered) {
    AcquireExclusiveNodeLock(node);
  }
  transaction_->AssertOpen();
}

void EntityWrite::LockRelationships(const std::vector<Gid> &relationships) {
  std::set<Gid> ordered(relationships.begin(), relationships.end());
  for (const auto relationship : ordered) {
    AcquireExclusiveRelationshipLock(relationship);
  }
  transaction_->AssertOpen();
}

}  // namespace kestrel::storage
