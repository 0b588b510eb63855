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
#include "storage/index_reference.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace kestrel::storage {

namespace {

bool IsOrderable(const ValueGroup group) {
  switch (group) {
    case ValueGroup::NUMBER:
    case ValueGroup::TEXT:
    case ValueGroup::TEMPORAL:
    case ValueGroup::BOOLEAN:
      return true;
    case ValueGroup::NO_VALUE:
    case ValueGroup::GEOMETRY:
    case ValueGroup::LIST:
      return false;
  }
  return false;
}

}  // namespace

std::string_view IndexStateToString(const IndexState state) {
  switch (state) {
    case IndexState::POPULATING:
      return "POPULATING";
    case IndexState::ONLINE:
      return "ONLINE";
    case IndexState::FAILED:
      return "FAILED";
  }
  return "UNKNOWN";
}

IndexCapability IndexCapability::ForSchema(const SchemaDescriptor &schema) {
  return IndexCapability{schema.properties().size() == 1 ? Kind::SINGLE_PROPERTY : Kind::COMPOSITE};
}

IndexCapability NoIndexCapability() { return IndexCapability{IndexCapability::Kind::NONE}; }

std::vector<IndexOrder> IndexCapability::OrderCapability(std::span<const ValueGroup> value_groups) const {
  if (kind_ != Kind::SINGLE_PROPERTY || value_groups.size() != 1 || !IsOrderable(value_groups.front())) {
    return {};
  }
  return {IndexOrder::ASCENDING, IndexOrder::DESCENDING};
}

IndexValueCapability IndexCapability::ValueCapability(std::span<const ValueGroup> value_groups) const {
  if (kind_ == Kind::NONE || value_groups.empty()) return IndexValueCapability::NO;
  // A composite answer is as good as its weakest group.
  auto result = IndexValueCapability::YES;
  for (const auto group : value_groups) {
    IndexValueCapability group_capability = IndexValueCapability::NO;
    if (IsOrderable(group)) {
      group_capability = IndexValueCapability::YES;
    } else if (group == ValueGroup::GEOMETRY) {
      group_capability = IndexValueCapability::PARTIAL;
    }
    result = std::min(result, group_capability);
  }
  return result;
}

std::string IndexReference::ToString() const {
  return fmt::format("{}INDEX {} ON {} [{}-{}]", unique_ ? "UNIQUE " : "", id_.AsUint(), schema_.ToString(),
                     provider_.key, provider_.version);
}

}  // namespace kestrel::storage
