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

#include <cstdint>
#include <optional>
#include <vector>

#include "storage/constraint_descriptor.hpp"
#include "storage/id_types.hpp"
#include "storage/index_reference.hpp"
#include "storage/indices/index_tx_state_updater.hpp"
#include "storage/property_value.hpp"
#include "storage/txn/state_view.hpp"
#include "storage/txn/transaction_state.hpp"

namespace kestrel::storage {

class Kernel;
class KernelTransaction;

/**
 * Writes to nodes, relationships and graph properties on behalf of one
 * transaction.
 *
 * Every operation first takes its locks and then checks that the transaction
 * is still open. Entity locks are exclusive and held until the transaction
 * ends. When both endpoints of a relationship are locked, the lower node id is
 * always locked first. Label and relationship type locks are taken before the
 * index entry locks used by uniqueness checks.
 */
class EntityWrite final {
 public:
  EntityWrite(KernelTransaction *transaction, Kernel *kernel, IndexTxStateUpdater *updater)
      : transaction_(transaction), kernel_(kernel), updater_(updater) {}

  Gid NodeCreate();

  /// @return false if the node did not exist or was already deleted.
  bool NodeDelete(Gid node);

  /// Deletes the node together with all of its relationships.
  /// @return number of relationships deleted.
  uint64_t NodeDetachDelete(Gid node);

  /// @throw EntityNotFoundException if either endpoint does not exist.
  Gid RelationshipCreate(Gid from, EdgeTypeId type, Gid to);

  /// @return false if the relationship did not exist or was already deleted.
  bool RelationshipDelete(Gid relationship);

  /// @return false if the node already has the label.
  /// @throw EntityNotFoundException
  /// @throw UniquePropertyValueValidationException
  /// @throw UnableToValidateConstraintException
  bool NodeAddLabel(Gid node, LabelId label);
  uint64_t NodeAddLabels(Gid node, const std::vector<LabelId> &labels);

  /// @return false if the node does not have the label.
  /// @throw EntityNotFoundException
  bool NodeRemoveLabel(Gid node, LabelId label);
  uint64_t NodeRemoveLabels(Gid node, const std::vector<LabelId> &labels);

  /// Setting a Null value removes the property.
  /// @return the previous value, Null if there was none.
  /// @throw EntityNotFoundException
  /// @throw UniquePropertyValueValidationException
  /// @throw UnableToValidateConstraintException
  PropertyValue NodeSetProperty(Gid node, PropertyId property, const PropertyValue &value);
  PropertyValue NodeRemoveProperty(Gid node, PropertyId property);

  PropertyValue RelationshipSetProperty(Gid relationship, PropertyId property, const PropertyValue &value);
  PropertyValue RelationshipRemoveProperty(Gid relationship, PropertyId property);

  PropertyValue GraphSetProperty(PropertyId property, const PropertyValue &value);
  PropertyValue GraphRemoveProperty(PropertyId property);

  /// Looks up a node in a unique index while holding the lock on the index
  /// entry for \p values, so no other transaction can take the entry until
  /// this one ends.
  /// @throw IndexNotApplicableKernelException if \p values do not fit the index.
  /// @throw IndexBrokenKernelException if the index is not online.
  std::optional<Gid> LockingUniqueIndexSeek(const IndexReference &index, const ValueTuple &values);

  /// Takes exclusive locks held until the transaction ends.
  void LockNodes(const std::vector<Gid> &nodes);
  void LockRelationships(const std::vector<Gid> &relationships);

 private:
  void AcquireExclusiveNodeLock(Gid node);
  void AcquireExclusiveRelationshipLock(Gid relationship);
  void LockRelationshipNodes(Gid first, Gid second);

  /// @throw EntityNotFoundException
  NodeSnapshot SingleNode(Gid node) const;
  RelationshipSnapshot SingleRelationship(Gid relationship) const;

  void CheckUniquenessOnLabelAdd(const NodeSnapshot &node, LabelId label);
  void CheckUniquenessOnPropertySet(const NodeSnapshot &node, PropertyId property, const PropertyValue &value);

  /// Fails if a node other than \p modified_node holds \p values in the index
  /// backing \p constraint.
  void ValidateNoExistingNodeWithExactValues(const ConstraintDescriptor &constraint, const ValueTuple &values,
                                             Gid modified_node);

  KernelTransaction *transaction_;
  Kernel *kernel_;
  IndexTxStateUpdater *updater_;
};

}  // namespace kestrel::storage
