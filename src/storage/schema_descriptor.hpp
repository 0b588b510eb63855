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

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "storage/id_types.hpp"

namespace kestrel::storage {

enum class EntityType : uint8_t { NODE, RELATIONSHIP };

std::string_view EntityTypeToString(EntityType type);

/// A label or a relationship type together with an ordered list of property
/// keys. The list is expected to hold distinct keys; use
/// HasRepeatedProperties() to reject malformed descriptors before using them.
class SchemaDescriptor final {
 public:
  static SchemaDescriptor ForLabel(LabelId label, std::vector<PropertyId> properties);
  static SchemaDescriptor ForRelationshipType(EdgeTypeId type, std::vector<PropertyId> properties);

  EntityType entity_type() const { return entity_type_; }
  bool IsNodeSchema() const { return entity_type_ == EntityType::NODE; }

  LabelId label() const;
  EdgeTypeId relationship_type() const;

  /// Raw id of the label or the relationship type, used as a lock resource id.
  uint64_t entity_token() const { return entity_token_; }

  const std::vector<PropertyId> &properties() const { return properties_; }

  bool HasRepeatedProperties() const;
  bool HasProperty(PropertyId property) const;

  std::string ToString() const;

  friend bool operator==(const SchemaDescriptor &, const SchemaDescriptor &) = default;
  friend auto operator<=>(const SchemaDescriptor &, const SchemaDescriptor &) = default;

 private:
  SchemaDescriptor(EntityType entity_type, uint64_t entity_token, std::vector<PropertyId> properties)
      : entity_type_(entity_type), entity_token_(entity_token), properties_(std::move(properties)) {}

  EntityType entity_type_;
  uint64_t entity_token_;
  std::vector<PropertyId> properties_;
};

}  // namespace kestrel::storage
