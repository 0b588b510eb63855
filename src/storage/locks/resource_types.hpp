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
#include <string_view>
#include <vector>

#include "storage/id_types.hpp"
#include "storage/property_value.hpp"

namespace kestrel::storage::locks {

enum class ResourceType : uint8_t { NODE, RELATIONSHIP, LABEL, RELATIONSHIP_TYPE, GRAPH_PROPERTIES, INDEX_ENTRY };

enum class LockMode : uint8_t { SHARED, EXCLUSIVE };

std::string_view ResourceTypeToString(ResourceType type);
std::string_view LockModeToString(LockMode mode);

/// The graph properties are guarded by a single resource.
inline constexpr uint64_t kGraphPropertiesResourceId = 0;

/// Resource id of the index entry a node would occupy in a label index when it
/// holds \p values for \p properties. Values that compare equal produce the
/// same id, so writers racing to insert the same tuple contend on one lock.
uint64_t IndexEntryResourceId(LabelId label, const std::vector<PropertyId> &properties,
                              const std::vector<PropertyValue> &values);

/// Observer of lock acquisitions, notified in acquisition order.
class LockTracer {
 public:
  LockTracer() = default;
  LockTracer(const LockTracer &) = delete;
  LockTracer &operator=(const LockTracer &) = delete;
  LockTracer(LockTracer &&) = delete;
  LockTracer &operator=(LockTracer &&) = delete;
  virtual ~LockTracer() = default;

  virtual void OnAcquired(ResourceType type, uint64_t resource_id, LockMode mode) = 0;
};

}  // namespace kestrel::storage::locks
