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

#include <atomic>
#include <map>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "storage/constraint_descriptor.hpp"
#include "storage/id_types.hpp"
#include "storage/schema_descriptor.hpp"
#include "storage/schema_rules.hpp"
#include "utils/synchronized.hpp"

namespace kestrel::storage {

class TransactionState;

/// Index rules created and dropped by one committed transaction.
struct SchemaChanges {
  std::vector<IndexRule> created_indexes;
  std::vector<IndexId> dropped_indexes;
};

/// Committed index and constraint rules.
class SchemaStore final {
 public:
  IndexId ReserveIndexId() { return IndexId::FromUint(next_index_id_.fetch_add(1, std::memory_order_acq_rel)); }
  ConstraintId ReserveConstraintId() {
    return ConstraintId::FromUint(next_constraint_id_.fetch_add(1, std::memory_order_acq_rel));
  }

  std::optional<IndexRule> GetIndex(IndexId index) const;
  std::optional<IndexRule> IndexForSchema(const SchemaDescriptor &schema) const;
  std::vector<IndexRule> IndexesForLabel(LabelId label) const;
  std::vector<IndexRule> AllIndexes() const;

  std::optional<ConstraintRule> GetConstraint(ConstraintId constraint) const;
  std::optional<ConstraintRule> ConstraintForDescriptor(const ConstraintDescriptor &constraint) const;
  std::vector<ConstraintRule> ConstraintsForSchema(const SchemaDescriptor &schema) const;
  /// Constraints on a label (EntityType::NODE) or a relationship type.
  std::vector<ConstraintRule> ConstraintsForEntityToken(EntityType entity_type, uint64_t token) const;
  std::vector<ConstraintRule> AllConstraints() const;

  /// Merges the schema part of a committed transaction. Constraints take
  /// ownership of the indexes they reference.
  SchemaChanges Apply(const TransactionState &state);

 private:
  struct Rules {
    std::map<IndexId, IndexRule> indexes;
    std::map<ConstraintId, ConstraintRule> constraints;
  };

  utils::Synchronized<Rules, std::shared_mutex> rules_;
  std::atomic<uint64_t> next_index_id_{1};
  std::atomic<uint64_t> next_constraint_id_{1};
};

}  // namespace kestrel::storage
