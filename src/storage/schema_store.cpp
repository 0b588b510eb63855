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
#include "storage/schema_store.hpp"

#include "storage/txn/transaction_state.hpp"
#include "utils/logging.hpp"

namespace kestrel::storage {

std::optional<IndexRule> SchemaStore::GetIndex(const IndexId index) const {
  return rules_.WithReadLock([&](const auto &rules) -> std::optional<IndexRule> {
    auto it = rules.indexes.find(index);
    if (it == rules.indexes.end()) return std::nullopt;
    return it->second;
  });
}

std::optional<IndexRule> SchemaStore::IndexForSchema(const SchemaDescriptor &schema) const {
  return rules_.WithReadLock([&](const auto &rules) -> std::optional<IndexRule> {
    for (const auto &[id, rule] : rules.indexes) {
      if (rule.schema == schema) return rule;
    }
    return std::nullopt;
  });
}

std::vector<IndexRule> SchemaStore::IndexesForLabel(const LabelId label) const {
  return rules_.WithReadLock([&](const auto &rules) {
    std::vector<IndexRule> result;
    for (const auto &[id, rule] : rules.indexes) {
      if (rule.schema.IsNodeSchema() && rule.schema.label() == label) result.push_back(rule);
    }
    return result;
  });
}

std::vector<IndexRule> SchemaStore::AllIndexes() const {
  return rules_.WithReadLock([](const auto &rules) {
    std::vector<IndexRule> result;
    result.reserve(rules.indexes.size());
    for (const auto &[id, rule] : rules.indexes) result.push_back(rule);
    return result;
  });
}

std::optional<ConstraintRule> SchemaStore::GetConstraint(const ConstraintId constraint) const {
  return rules_.WithReadLock([&](const auto &rules) -> std::optional<ConstraintRule> {
    auto it = rules.constraints.find(constraint);
    if (it == rules.constraints.end()) return std::nullopt;
    return it->second;
  });
}

std::optional<ConstraintRule> SchemaStore::ConstraintForDescriptor(const ConstraintDescriptor &constraint) const {
  return rules_.WithReadLock([&](const auto &rules) -> std::optional<ConstraintRule> {
    for (const auto &[id, rule] : rules.constraints) {
      if (rule.descriptor == constraint) return rule;
    }
    return std::nullopt;
  });
}

std::vector<ConstraintRule> SchemaStore::ConstraintsForSchema(const SchemaDescriptor &schema) const {
  return rules_.WithReadLock([&](const auto &rules) {
    std::vector<ConstraintRule> result;
    for (const auto &[id, rule] : rules.constraints) {
      if (rule.descriptor.schema() == schema) result.push_back(rule);
    }
    return result;
  });
}

std::vector<ConstraintRule> SchemaStore::ConstraintsForEntityToken(const EntityType entity_type,
                                                                   const uint64_t token) const {
  return rules_.WithReadLock([&](const auto &rules) {
    std::vector<ConstraintRule> result;
    for (const auto &[id, rule] : rules.constraints) {
      const auto &schema = rule.descriptor.schema();
      if (schema.entity_type() == entity_type && schema.entity_token() == token) result.push_back(rule);
    }
    return result;
  });
}

std::vector<ConstraintRule> SchemaStore::AllConstraints() const {
  return rules_.WithReadLock([](const auto &rules) {
    std::vector<ConstraintRule> result;
    result.reserve(rules.constraints.size());
    for (const auto &[id, rule] : rules.constraints) result.push_back(rule);
    return result;
  });
}

SchemaChanges SchemaStore::Apply(const TransactionState &state) {
  SchemaChanges changes;
  rules_.WithLock([&](auto &rules) {
    for (const auto &[id, rule] : state.removed_constraints()) {
      if (rule.owned_index) {
        if (auto index = rules.indexes.find(*rule.owned_index); index != rules.indexes.end()) {
          index->second.owning_constraint.reset();
        }
      }
      rules.constraints.erase(id);
      spdlog::info("Dropped {}", rule.descriptor.ToString());
    }

    for (const auto &[id, index] : state.removed_indexes()) {
      if (rules.indexes.erase(id) > 0) {
        changes.dropped_indexes.push_back(id);
        spdlog::info("Dropped {}", index.ToString());
      }
    }

    for (const auto &[id, rule] : state.added_indexes()) {
      auto [it, inserted] = rules.indexes.emplace(id, rule);
      KS_ASSERT(inserted, "Index {} is already in the schema store", id.AsUint());
      changes.created_indexes.push_back(rule);
      spdlog::info("Created {}", it->second.Reference().ToString());
    }

    for (const auto &[id, rule] : state.added_constraints()) {
      if (rule.owned_index) {
        auto index = rules.indexes.find(*rule.owned_index);
        KS_ASSERT(index != rules.indexes.end(), "Constraint {} references missing index {}", id.AsUint(),
                  rule.owned_index->AsUint());
        index->second.owning_constraint = id;
      }
      rules.constraints.emplace(id, rule);
      spdlog::info("Created {}", rule.descriptor.ToString());
    }
  });
  return changes;
}

}  // namespace kestrel::storage
