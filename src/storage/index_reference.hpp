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
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "storage/id_types.hpp"
#include "storage/property_value.hpp"
#include "storage/schema_descriptor.hpp"

namespace kestrel::storage {

enum class IndexOrder : uint8_t { ASCENDING, DESCENDING };

/// Whether an index can hand back the exact values it indexes.
enum class IndexValueCapability : uint8_t { NO, PARTIAL, YES };

enum class IndexState : uint8_t { POPULATING, ONLINE, FAILED };

std::string_view IndexStateToString(IndexState state);

struct IndexProviderDescriptor {
  std::string key;
  std::string version;

  friend bool operator==(const IndexProviderDescriptor &, const IndexProviderDescriptor &) = default;
};

inline const IndexProviderDescriptor kNativeIndexProvider{"kestrel-native", "1.0"};

/// Answers which orderings and value retrieval an index supports for a
/// combination of value groups, one group per schema property.
class IndexCapability final {
 public:
  static IndexCapability ForSchema(const SchemaDescriptor &schema);

  std::vector<IndexOrder> OrderCapability(std::span<const ValueGroup> value_groups) const;
  IndexValueCapability ValueCapability(std::span<const ValueGroup> value_groups) const;

  friend bool operator==(const IndexCapability &, const IndexCapability &) = default;

 private:
  friend IndexCapability NoIndexCapability();

  enum class Kind : uint8_t { NONE, SINGLE_PROPERTY, COMPOSITE };

  explicit IndexCapability(Kind kind) : kind_(kind) {}

  Kind kind_;
};

/// Capability of an absent index: no ordering and no values for any group.
IndexCapability NoIndexCapability();

/// Immutable handle to an index: its id, schema, uniqueness and provider.
/// Absence of an index is expressed with std::optional<IndexReference>. The
/// population state is not part of the handle, it is asked for separately.
class IndexReference final {
 public:
  IndexReference(IndexId id, SchemaDescriptor schema, bool unique,
                 IndexProviderDescriptor provider = kNativeIndexProvider)
      : id_(id), schema_(std::move(schema)), unique_(unique), provider_(std::move(provider)) {}

  IndexId id() const { return id_; }
  const SchemaDescriptor &schema() const { return schema_; }
  LabelId label() const { return schema_.label(); }
  const std::vector<PropertyId> &properties() const { return schema_.properties(); }
  bool IsUnique() const { return unique_; }
  const IndexProviderDescriptor &provider() const { return provider_; }

  IndexCapability Capability() const { return IndexCapability::ForSchema(schema_); }

  std::string ToString() const;

  friend bool operator==(const IndexReference &, const IndexReference &) = default;

 private:
  IndexId id_;
  SchemaDescriptor schema_;
  bool unique_;
  IndexProviderDescriptor provider_;
};

}  // namespace kestrel::storage
