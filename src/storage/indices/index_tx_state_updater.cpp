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
#include "storage/indices/index_tx_state_updater.hpp"

#include "storage/indices/index_proxy.hpp"

namespace kestrel::storage {

void IndexTxStateUpdater::OnLabelChange(const LabelId label, const NodeSnapshot &node,
                                        const LabelChangeType change_type) {
  auto after = node;
  if (change_type == LabelChangeType::ADDED_LABEL) {
    after.labels.insert(label);
  } else {
    after.labels.erase(label);
  }
  UpdateIndexes(view_->IndexesGetForLabel(label), node, after);
}

void IndexTxStateUpdater::OnPropertyAdd(const NodeSnapshot &node, const PropertyId property,
                                        const PropertyValue &value) {
  OnPropertyChange(node, property, value);
}

void IndexTxStateUpdater::OnPropertyRemove(const NodeSnapshot &node, const PropertyId property) {
  auto after = node;
  after.properties.erase(property);
  UpdateIndexes(IndexesWithProperty(node, property), node, after);
}

void IndexTxStateUpdater::OnPropertyChange(const NodeSnapshot &node, const PropertyId property,
                                           const PropertyValue &after_value) {
  auto after = node;
  after.properties.insert_or_assign(property, after_value);
  UpdateIndexes(IndexesWithProperty(node, property), node, after);
}

void IndexTxStateUpdater::UpdateIndexes(const std::vector<IndexReference> &indexes, const NodeSnapshot &before,
                                        const NodeSnapshot &after) {
  for (const auto &index : indexes) {
    auto before_values = IndexTupleOf(index.schema(), before.labels, before.properties);
    auto after_values = IndexTupleOf(index.schema(), after.labels, after.properties);
    if (!before_values && !after_values) continue;
    if (before_values && after_values && *before_values == *after_values) continue;
    state_->IndexDoUpdateEntry(index.id(), before.gid, before_values, after_values);
  }
}

std::vector<IndexReference> IndexTxStateUpdater::IndexesWithProperty(const NodeSnapshot &node,
                                                                     const PropertyId property) const {
  std::vector<IndexReference> result;
  for (const auto &label : node.labels) {
    for (auto &index : view_->IndexesGetForLabel(label)) {
      if (index.schema().HasProperty(property)) result.push_back(std::move(index));
    }
  }
  return result;
}

}  // namespace kestrel::storage
