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
#include "storage/locks/resource_types.hpp"

#include "utils/fnv.hpp"

namespace kestrel::storage::locks {

std::string_view ResourceTypeToString(const ResourceType type) {
  switch (type) {
    case ResourceType::NODE:
      return "NODE";
    case ResourceType::RELATIONSHIP:
      return "RELATIONSHIP";
    case ResourceType::LABEL:
      return "LABEL";
    case ResourceType::RELATIONSHIP_TYPE:
      return "RELATIONSHIP_TYPE";
    case ResourceType::GRAPH_PROPERTIES:
      return "GRAPH_PROPERTIES";
    case ResourceType::INDEX_ENTRY:
      return "INDEX_ENTRY";
  }
  return "UNKNOWN";
}

std::string_view LockModeToString(const LockMode mode) {
  switch (mode) {
    case LockMode::SHARED:
      return "SHARED";
    case LockMode::EXCLUSIVE:
      return "EXCLUSIVE";
  }
  return "UNKNOWN";
}

uint64_t IndexEntryResourceId(const LabelId label, const std::vector<PropertyId> &properties,
                              const std::vector<PropertyValue> &values) {
  uint64_t hash = utils::FnvCombine(utils::kFnvOffset, label.AsUint());
  for (const auto &property : properties) {
    hash = utils::FnvCombine(hash, property.AsUint());
  }
  for (const auto &value : values) {
    hash = utils::FnvCombine(hash, PropertyValueHash(value));
  }
  return hash;
}

}  // namespace kestrel::storage::locks
