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

#include "storage/constraint_descriptor.hpp"
#include "storage/id_types.hpp"
#include "storage/index_reference.hpp"
#include "storage/indices/index_proxy.hpp"
#include "storage/schema_descriptor.hpp"

namespace kestrel::storage {

class Kernel;
class KernelTransaction;

/**
 * Builds the unique index backing a uniqueness or node key constraint.
 *
 * The index rule is committed right away by an implicit transaction so that
 * population starts. The exclusive lock on the label is released while the
 * index populates and reacquired before the index is verified, so no other
 * transaction can write a conflicting value between verification and the
 * commit of the constraint. Every failure after the index was created runs
 * the same compensation: reacquire the label lock if needed and drop the
 * index unless another constraint creation has claimed or replaced it.
 */
class ConstraintIndexCreator final {
 public:
  explicit ConstraintIndexCreator(Kernel *kernel) : kernel_(kernel) {}

  /// Must be called with the exclusive lock on the constraint's label held by
  /// \p transaction. Returns with the lock held.
  /// @return id of the online, verified index.
  /// @throw AlreadyConstrainedException if the index already belongs to a constraint.
  /// @throw CreateConstraintFailureException
  /// @throw UniquePropertyValueValidationException if existing data violates uniqueness.
  /// @throw TransactionFailureException
  IndexId CreateUniquenessConstraintIndex(KernelTransaction &transaction, const ConstraintDescriptor &constraint);

  /// Creates and commits a unique index on \p schema that no constraint owns.
  IndexReference CreateConstraintIndex(const SchemaDescriptor &schema);

 private:
  struct CreationState {
    ConstraintDescriptor constraint;
    std::optional<IndexReference> index;
    // Exclusive holds on the label released for population and not yet restored.
    uint64_t released_label_holds{0};
  };

  IndexReference GetOrCreateUniquenessConstraintIndex(KernelTransaction &transaction,
                                                      const ConstraintDescriptor &constraint);
  IndexId PopulateAndVerify(KernelTransaction &transaction, CreationState &state);
  void AwaitConstraintIndexPopulation(KernelTransaction &transaction, const ConstraintDescriptor &constraint,
                                      const IndexProxy &proxy) const;
  void Compensate(KernelTransaction &transaction, CreationState &state);
  bool IndexStillExists(const KernelTransaction &transaction, const IndexReference &index) const;
  void DropUniquenessConstraintIndex(const IndexReference &index);

  Kernel *kernel_;
};

}  // namespace kestrel::storage
