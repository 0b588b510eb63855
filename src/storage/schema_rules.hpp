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

#include <optional>

#include "storage/constraint_descriptor.hpp"
#include "storage/id_types.hpp"
#include "storage/index_reference.hpp"
#include "storage/schema_descriptor.hpp"

namespace kestrel::storage {

/// A stored index definition. Unique indexes are owned by the constraint that
/// they back, once that constraint is committed.
struct IndexRule {
  IndexId id;
  SchemaDescriptor schema;
  bool unique{false};
  std::optional<ConstraintId> owning_constraint;

  IndexReference Reference() const { return {id, schema, unique}; }
};

struct ConstraintRule {
  ConstraintId id;
  ConstraintDescriptor descriptor;
  std::optional<IndexId> owned_index;
};

}  // namespace kestrel::storage
