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

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "storage/constraint_descriptor.hpp"
#include "storage/graph_store.hpp"
#include "storage/id_types.hpp"
#include "storage/index_reference.hpp"
#include "storage/indices/indexing_service.hpp"
#include "storage/property_value.hpp"
#include "storage/schema_rules.hpp"
#include "storage/schema_store.hpp"
#include "storage/txn/transaction_state.hpp"

namespace kestrel::storage {

struct NodeSnapshot {
  Gid gid;
  std::set<LabelId> labels;
  std::map<PropertyId, PropertyValue> properties;
};

struct RelationshipSnapshot {
  Gid gid;
  EdgeTypeId type;
  Gid from;
  Gid to;
  std::map<PropertyId, PropertyValue> properties;
};

/// Reads the committed store and schema through the overlay of one
/// transaction's state, so a transaction sees its own changes.
class StateView final {
 public:
  StateView(const GraphStore *store, const SchemaStore *schema, const IndexingService *indexing,
            const TransactionState *state)
      : store_(store), schema_(schema), indexing_(indexing), state_(state) {}

  bool NodeExists(Gid node) const;
  std::optional<NodeSnapshot> GetNode(Gid node) const;
  bool RelationshipExists(Gid relationship) const;
  std::optional<RelationshipSnapshot> GetRelationship(Gid relationship) const;
  std::map<PropertyId, PropertyValue> GraphProperties() const;

  std::vector<Gid> NodesWithLabel(LabelId label) const;
  std::vector<Gid> RelationshipsOfType(EdgeTypeId type) const;
  std::vector<Gid> NodeRelationships(Gid node) const;

  std::optional<IndexReference> IndexGetForSchema(const SchemaDescriptor &schema) const;
  std::vector<IndexReference> IndexesGetForLabel(LabelId label) const;
  std::vector<IndexReference> IndexesGetAll() const;
  std::optional<ConstraintId> IndexGetOwningConstraint(const IndexReference &index) const;
  /// Indexes created by this transaction report POPULATING.
  /// @throw IndexNotFoundKernelException
  IndexState IndexGetState(const IndexReference &index) const;
  std::string IndexGetFailure(const IndexReference &index) const;

  std::optional<ConstraintRule> ConstraintGet(const ConstraintDescriptor &constraint) const;
  bool ConstraintExists(const ConstraintDescriptor &constraint) const { return ConstraintGet(constraint).has_value(); }
  std::vector<ConstraintRule> ConstraintsGetForLabel(LabelId label) const;
  std::vector<ConstraintRule> ConstraintsGetForRelationshipType(EdgeTypeId type) const;
  std::vector<ConstraintRule> ConstraintsGetForSchema(const SchemaDescriptor &schema) const;
  std::vector<ConstraintRule> ConstraintsGetAll() const;

  /// Nodes holding exactly \p values in \p index, as seen by this transaction.
  /// @throw IndexNotFoundKernelException when a committed index has no proxy.
  std::vector<Gid> NodeIndexSeek(const IndexReference &index, const ValueTuple &values) const;

 private:
  std::vector<ConstraintRule> FilterConstraints(std::vector<ConstraintRule> committed,
                                                const std::function<bool(const ConstraintRule &)> &matches) const;

  const GraphStore *store_;
  const SchemaStore *schema_;
  const IndexingService *indexing_;
  const TransactionState *state_;
};

}  // namespace kestrel::storage
