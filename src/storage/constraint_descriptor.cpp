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
#include "storage/constraint_descriptor.hpp"

#include <fmt/format.h>

#include "utils/logging.hpp"
#include "utils/variant_helpers.hpp"

namespace kestrel::storage {

std::string_view ConstraintKindToString(const ConstraintKind kind) {
  switch (kind) {
    case ConstraintKind::UNIQUENESS:
      return "UNIQUENESS";
    case ConstraintKind::NODE_KEY:
      return "NODE KEY";
    case ConstraintKind::NODE_EXISTENCE:
      return "NODE PROPERTY EXISTENCE";
    case ConstraintKind::RELATIONSHIP_EXISTENCE:
      return "RELATIONSHIP PROPERTY EXISTENCE";
  }
  return "UNKNOWN";
}

ConstraintDescriptor ConstraintDescriptor::Uniqueness(SchemaDescriptor schema) {
  KS_ASSERT(schema.IsNodeSchema(), "Uniqueness constraints apply to labels only");
  return ConstraintDescriptor{UniquenessConstraint{std::move(schema)}};
}

ConstraintDescriptor ConstraintDescriptor::NodeKey(SchemaDescriptor schema) {
  KS_ASSERT(schema.IsNodeSchema(), "Node key constraints apply to labels only");
  return ConstraintDescriptor{NodeKeyConstraint{std::move(schema)}};
}

ConstraintDescriptor ConstraintDescriptor::NodeExistence(SchemaDescriptor schema) {
  KS_ASSERT(schema.IsNodeSchema(), "Node property existence constraints apply to labels only");
  return ConstraintDescriptor{NodeExistenceConstraint{std::move(schema)}};
}

ConstraintDescriptor ConstraintDescriptor::RelationshipExistence(SchemaDescriptor schema) {
  KS_ASSERT(!schema.IsNodeSchema(), "Relationship property existence constraints apply to relationship types only");
  return ConstraintDescriptor{RelationshipExistenceConstraint{std::move(schema)}};
}

const SchemaDescriptor &ConstraintDescriptor::schema() const {
  return std::visit([](const auto &constraint) -> const SchemaDescriptor & { return constraint.schema; },
                    constraint_);
}

ConstraintKind ConstraintDescriptor::kind() const {
  return std::visit(utils::Overloaded{
                        [](const UniquenessConstraint &) { return ConstraintKind::UNIQUENESS; },
                        [](const NodeKeyConstraint &) { return ConstraintKind::NODE_KEY; },
                        [](const NodeExistenceConstraint &) { return ConstraintKind::NODE_EXISTENCE; },
                        [](const RelationshipExistenceConstraint &) { return ConstraintKind::RELATIONSHIP_EXISTENCE; },
                    },
                    constraint_);
}

bool ConstraintDescriptor::EnforcesUniqueness() const {
  const auto constraint_kind = kind();
  return constraint_kind == ConstraintKind::UNIQUENESS || constraint_kind == ConstraintKind::NODE_KEY;
}

bool ConstraintDescriptor::EnforcesPropertyExistence() const { return kind() != ConstraintKind::UNIQUENESS; }

std::string ConstraintDescriptor::ToString() const {
  return fmt::format("CONSTRAINT ON {} ASSERT {}", schema().ToString(), ConstraintKindToString(kind()));
}

}  // namespace kestrel::storage
