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
#include "storage/constraints/constraint_semantics.hpp"

#include <exception>
#include <map>
#include <optional>

#include "storage/exceptions.hpp"
#include "utils/logging.hpp"

namespace kestrel::storage {

namespace {

std::optional<PropertyId> FirstMissingProperty(const SchemaDescriptor &schema,
                                               const std::map<PropertyId, PropertyValue> &properties) {
  for (const auto property : schema.properties()) {
    auto it = properties.find(property);
    if (it == properties.end() || it->second.IsNull()) return property;
  }
  return std::nullopt;
}

}  // namespace

void StandardConstraintSemantics::ValidateNodesHaveProperties(const StateView &view,
                                                              const ConstraintDescriptor &constraint) const {
  const auto &schema = constraint.schema();
  for (const auto gid : view.NodesWithLabel(schema.label())) {
    auto node = view.GetNode(gid);
    if (!node) continue;
    if (auto missing = FirstMissingProperty(schema, node->properties)) {
      throw CreateConstraintFailureException(
          constraint, std::make_exception_ptr(NodePropertyExistenceException(
                          constraint, ConstraintValidationPhase::VERIFICATION, gid, *missing)));
    }
  }
}

void StandardConstraintSemantics::ValidateNodePropertyExistenceConstraint(
    const StateView &view, const ConstraintDescriptor &constraint) const {
  KS_ASSERT(constraint.kind() == ConstraintKind::NODE_EXISTENCE, "Expected a node existence constraint, got {}",
            constraint.ToString());
  ValidateNodesHaveProperties(view, constraint);
}

void StandardConstraintSemantics::ValidateNodeKeyConstraint(const StateView &view,
                                                            const ConstraintDescriptor &constraint) const {
  KS_ASSERT(constraint.kind() == ConstraintKind::NODE_KEY, "Expected a node key constraint, got {}",
            constraint.ToString());
  ValidateNodesHaveProperties(view, constraint);
}

void StandardConstraintSemantics::ValidateRelationshipPropertyExistenceConstraint(
    const StateView &view, const ConstraintDescriptor &constraint) const {
  KS_ASSERT(constraint.kind() == ConstraintKind::RELATIONSHIP_EXISTENCE,
            "Expected a relationship existence constraint, got {}", constraint.ToString());
  const auto &schema = constraint.schema();
  for (const auto gid : view.RelationshipsOfType(schema.relationship_type())) {
    auto relationship = view.GetRelationship(gid);
    if (!relationship) continue;
    if (auto missing = FirstMissingProperty(schema, relationship->properties)) {
      throw CreateConstraintFailureException(
          constraint, std::make_exception_ptr(RelationshipPropertyExistenceException(
                          constraint, ConstraintValidationPhase::VERIFICATION, gid, *missing)));
    }
  }
}

void StandardConstraintSemantics::ValidateTransactionState(const StateView &view,
                                                           const TransactionState &state) const {
  for (const auto gid : state.TouchedNodes()) {
    auto node = view.GetNode(gid);
    if (!node) continue;
    for (const auto label : node->labels) {
      for (const auto &rule : view.ConstraintsGetForLabel(label)) {
        if (!rule.descriptor.EnforcesPropertyExistence()) continue;
        if (auto missing = FirstMissingProperty(rule.descriptor.schema(), node->properties)) {
          throw ConstraintViolationTransactionFailureException(std::make_exception_ptr(
              NodePropertyExistenceException(rule.descriptor, ConstraintValidationPhase::VALIDATION, gid, *missing)));
        }
      }
    }
  }

  for (const auto gid : state.TouchedRelationships()) {
    auto relationship = view.GetRelationship(gid);
    if (!relationship) continue;
    for (const auto &rule : view.ConstraintsGetForRelationshipType(relationship->type)) {
      if (!rule.descriptor.EnforcesPropertyExistence()) continue;
      if (auto missing = FirstMissingProperty(rule.descriptor.schema(), relationship->properties)) {
        throw ConstraintViolationTransactionFailureException(
            std::make_exception_ptr(RelationshipPropertyExistenceException(
                rule.descriptor, ConstraintValidationPhase::VALIDATION, gid, *missing)));
      }
    }
  }
}

}  // namespace kestrel::storage
