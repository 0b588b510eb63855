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
#include <vector>

#include "storage/id_types.hpp"
#include "storage/index_reference.hpp"
#include "storage/property_value.hpp"
#include "storage/txn/state_view.hpp"
#include "storage/txn/transaction_state.hpp"

namespace kestrel::storage {

enum class LabelChangeType : uint8_t { ADDED_LABEL, REMOVED_LABEL };

/**
 * Records in the transaction state how a node moves between index entries
 * when its labels or properties change, so that index seeks in the same
 * transaction see the change. Every callback takes the node as it was before
 * the change.
 */
class IndexTxStateUpdater final {
 public:
  IndexTxStateUpdater(const StateView *view, TransactionState *state) : view_(view), state_(state) {}

  void OnLabelChange(LabelId label, const NodeSnapshot &node, LabelChangeType change_type);
  void OnPropertyAdd(const NodeSnapshot &node, PropertyId property, const PropertyValue &value);
  void OnPropertyRemove(const NodeSnapshot &node, PropertyId property);
  void OnPropertyChange(const NodeSnapshot &node, PropertyId property, const PropertyValue &after_value);

 private:
  void UpdateIndexes(const std::vector<IndexReference> &indexes, const NodeSnapshot &before,
                     const NodeSnapshot &after);
  std::vector<IndexReference> IndexesWithProperty(const NodeSnapshot &node, PropertyId property) const;

  const StateView *view_;
  TransactionState *state_;
};

}  // namespace kestrel::storage
