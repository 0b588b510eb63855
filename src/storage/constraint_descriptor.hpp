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
#include <string>
#include <string_view>
#include <variant>

#include "storage/schema_descriptor.hpp"

namespace kestrel::storage {

struct UniquenessConstraint {
  SchemaDescriptor schema;
  friend bool operator==(const UniquenessConstraint &, const UniquenessConstraint &) = default;
};

/// Uniqueness plus existence of every property of the schema.
struct NodeKeyConstraint {
  SchemaDescriptor schema;
  friend bool operator==(const NodeKeyConstraint &, const NodeKeyConstraint &) = default;
};

struct NodeExistenceConstraint {
  SchemaDescriptor schema;
  friend bool operator==(const NodeExistenceConstraint &, const NodeExistenceConstraint &) = default;
};

struct RelationshipExistenceConstraint {
  SchemaDescriptor schema;
  friend bool operator==(const RelationshipExistenceConstraint &, const RelationshipExistenceConstraint &) = default;
};

enum class ConstraintKind : uint8_t { UNIQUENESS, NODE_KEY, NODE_EXISTENCE, RELATIONSHIP_EXISTENCE };

std::string_view ConstraintKindToString(ConstraintKind kind);

/// Immutable description of a constraint: its kind and the schema it applies
/// to. Uniqueness and node key constraints are index-backed.
class ConstraintDescriptor final {
 public:
  using Variant =
      std::variant<UniquenessConstraint, NodeKeyConstraint, NodeExistenceConstraint, RelationshipExistenceConstraint>;

  static ConstraintDescriptor Uniqueness(SchemaDescriptor schema);
  static ConstraintDescriptor NodeKey(SchemaDescriptor schema);
  static ConstraintDescriptor NodeExistence(SchemaDescriptor schema);
  static ConstraintDescriptor RelationshipExistence(SchemaDescriptor schema);

  const Variant &variant() const { return constraint_; }
  const SchemaDescriptor &schema() const;
  ConstraintKind kind() const;

  /// True for the constraint kinds that own a unique index.
  bool EnforcesUniqueness() const;
  /// True for the constraint kinds that require every schema property to be present.
  bool EnforcesPropertyExistence() const;

  std::string ToString() const;

  friend bool operator==(const ConstraintDescriptor &, const ConstraintDescriptor &) = default;

 private:
  explicit ConstraintDescriptor(Variant constraint) : constraint_(std::move(constraint)) {}

  Variant constraint_;
};

}  // namespace kestrel::storage
