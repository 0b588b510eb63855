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

#include <map>
#include <optional>
#include <set>
#include <vector>

#include "storage/constraint_descriptor.hpp"
#include "storage/id_types.hpp"
#include "storage/index_reference.hpp"
#include "storage/property_value.hpp"
#include "storage/schema_rules.hpp"

namespace kestrel::storage {

using ValueTuple = std::vector<PropertyValue>;

/// Label and property changes a transaction made to one node.
struct NodeState {
  std::set<LabelId> added_labels;
  std::set<LabelId> removed_labels;
  std::map<PropertyId, PropertyValue> set_properties;
  std::set<PropertyId> removed_properties;
};

struct RelationshipState {
  std::map<PropertyId, PropertyValue> set_properties;
  std::set<PropertyId> removed_properties;
};

struct CreatedRelationship {
  EdgeTypeId type;
  Gid from;
  Gid to;
};

/// Nodes that entered and left one value tuple of an index within a transaction.
struct IndexEntryChanges {
  std::set<Gid> added;
  std::set<Gid> removed;
};

/**
 * In-memory diff of everything a transaction changed: created and deleted
 * entities, label and property changes, graph properties, index and
 * constraint rules, and the index entries that moved because of the data
 * changes. Discarded on rollback, applied to the store on commit.
 *
 * Recording operations do no validation; callers hold the locks and have
 * checked existence before recording a change.
 */
class TransactionState final {
 public:
  void NodeDoCreate(Gid node);
  /// Forgets a node created in this transaction, or marks a committed node as deleted.
  void NodeDoDelete(Gid node);
  bool NodeIsAddedInThisTx(Gid node) const { return created_nodes_.contains(node); }
  bool NodeIsDeletedInThisTx(Gid node) const { return deleted_nodes_.contains(node); }

  void NodeDoAddLabel(LabelId label, Gid node);
  void NodeDoRemoveLabel(LabelId label, Gid node);
  void NodeDoSetProperty(Gid node, PropertyId property, const PropertyValue &value);
  void NodeDoRemoveProperty(Gid node, PropertyId property);
  const NodeState *GetNodeState(Gid node) const;

  void RelationshipDoCreate(Gid relationship, EdgeTypeId type, Gid from, Gid to);
  void RelationshipDoDelete(Gid relationship);
  void RelationshipDoDeleteAddedInThisTx(Gid relationship);
  bool RelationshipIsAddedInThisTx(Gid relationship) const { return created_relationships_.contains(relationship); }
  bool RelationshipIsDeletedInThisTx(Gid relationship) const { return deleted_relationships_.contains(relationship); }

  void RelationshipDoSetProperty(Gid relationship, PropertyId property, const PropertyValue &value);
  void RelationshipDoRemoveProperty(Gid relationship, PropertyId property);
  const RelationshipState *GetRelationshipState(Gid relationship) const;

  void GraphDoSetProperty(PropertyId property, const PropertyValue &value);
  void GraphDoRemoveProperty(PropertyId property);

  void IndexRuleDoAdd(IndexRule rule);
  /// Forgets an index added in this transaction, or marks a committed index as dropped.
  void IndexDoDrop(const IndexReference &index);
  /// Reverts a drop of a committed index. Returns false if it was not dropped.
  bool IndexDoUnRemove(const IndexReference &index);
  bool IndexIsAddedInThisTx(IndexId index) const { return added_indexes_.contains(index); }
  bool IndexIsRemovedInThisTx(IndexId index) const { return removed_indexes_.contains(index); }

  void ConstraintDoAdd(ConstraintRule rule);
  /// Drops the constraint and, in the same transaction, the index it owns.
  void ConstraintDoDrop(const ConstraintRule &rule, const std::optional<IndexReference> &owned_index);
  /// Reverts a drop of a committed constraint, returning its rule.
  std::optional<ConstraintRule> ConstraintDoUnRemove(const ConstraintDescriptor &constraint);
  bool ConstraintIsAddedInThisTx(ConstraintId constraint) const { return added_constraints_.contains(constraint); }
  bool ConstraintIsRemovedInThisTx(ConstraintId constraint) const {
    return removed_constraints_.contains(constraint);
  }

  /// Moves \p node from the \p before tuple to the \p after tuple of \p index.
  void IndexDoUpdateEntry(IndexId index, Gid node, const std::optional<ValueTuple> &before,
                          const std::optional<ValueTuple> &after);
  const IndexEntryChanges *GetIndexEntryChanges(IndexId index, const ValueTuple &values) const;

  bool HasChanges() const;
  bool HasSchemaChanges() const;

  /// Nodes whose existence constraints must hold at commit.
  std::set<Gid> TouchedNodes() const;
  std::set<Gid> TouchedRelationships() const;

  const std::set<Gid> &created_nodes() const { return created_nodes_; }
  const std::set<Gid> &deleted_nodes() const { return deleted_nodes_; }
  const std::map<Gid, NodeState> &node_states() const { return node_states_; }
  const std::map<Gid, CreatedRelationship> &created_relationships() const { return created_relationships_; }
  const std::set<Gid> &deleted_relationships() const { return deleted_relationships_; }
  const std::map<Gid, RelationshipState> &relationship_states() const { return relationship_states_; }
  const std::map<PropertyId, PropertyValue> &graph_set_properties() const { return graph_set_properties_; }
  const std::set<PropertyId> &graph_removed_properties() const { return graph_removed_properties_; }
  const std::map<IndexId, IndexRule> &added_indexes() const { return added_indexes_; }
  const std::map<IndexId, IndexReference> &removed_indexes() const { return removed_indexes_; }
  const std::map<ConstraintId, ConstraintRule> &added_constraints() const { return added_constraints_; }
  const std::map<ConstraintId, ConstraintRule> &removed_constraints() const { return removed_constraints_; }

 private:
  std::set<Gid> created_nodes_;
  std::set<Gid> deleted_nodes_;
  std::map<Gid, NodeState> node_states_;

  std::map<Gid, CreatedRelationship> created_relationships_;
  std::set<Gid> deleted_relationships_;
  std::map<Gid, RelationshipState> relationship_states_;

  std::map<PropertyId, PropertyValue> graph_set_properties_;
  std::set<PropertyId> graph_removed_properties_;

  std::map<IndexId, IndexRule> added_indexes_;
  std::map<IndexId, IndexReference> removed_indexes_;
  std::map<ConstraintId, ConstraintRule> added_constraints_;
  std::map<ConstraintId, ConstraintRule> removed_constraints_;

  std::map<IndexId, std::map<ValueTuple, IndexEntryChanges>> index_entry_changes_;
};

}  // namespace kestrel::storage
