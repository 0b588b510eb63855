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
#include "storage/schema_descriptor.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "utils/logging.hpp"

namespace kestrel::storage {

std::string_view EntityTypeToString(const EntityType type) {
  switch (type) {
    case EntityType::NODE:
      return "NODE";
    case EntityType::RELATIONSHIP:
      return "RELATIONSHIP";
  }
  return "UNKNOWN";
}

SchemaDescriptor SchemaDescriptor::ForLabel(const LabelId label, std::vector<PropertyId> properties) {
  return {EntityType::NODE, label.AsUint(), std::move(properties)};
}

SchemaDescriptor SchemaDescriptor::ForRelationshipType(const EdgeTypeId type, std::vector<PropertyId> properties) {
  return {EntityType::RELATIONSHIP, type.AsUint(), std::move(properties)};
}

LabelId SchemaDescriptor::label() const {
  KS_ASSERT(entity_type_ == EntityType::NODE, "Schema {} is not a label schema", ToString());
  return LabelId::FromUint(entity_token_);
}

EdgeTypeId SchemaDescriptor::relationship_type() const {
  KS_ASSERT(entity_type_ == EntityType::RELATIONSHIP, "Schema {} is not a relationship type schema", ToString());
  return EdgeTypeId::FromUint(entity_token_);
}

bool SchemaDescriptor::HasRepeatedProperties() const {
  auto sorted = properties_;
  std::sort(sorted.begin(), sorted.end());
  return std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end();
}

bool SchemaDescriptor::HasProperty(const PropertyId property) const {
  return std::find(properties_.begin(), properties_.end(), property) != properties_.end();
}

std::string SchemaDescriptor::ToString() const {
  std::vector<uint64_t> raw_properties;
  raw_properties.reserve(properties_.size());
  for (const auto &property : properties_) raw_properties.push_back(property.AsUint());
  return fmt::format("{}({})({})", entity_type_ == EntityType::NODE ? ":Label" : ":RelationshipType", entity_token_,
                     fmt::join(raw_properties, ", "));
}

}  // namespace kestrel::storage
