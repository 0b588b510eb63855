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

#include "storage/indices/index_tx_state_updater.hpp"
#include "storage/ops/entity_write.hpp"
#include "storage/ops/schema_write.hpp"
#include "storage/txn/state_view.hpp"

namespace kestrel::storage {

class Kernel;
class KernelTransaction;

/// The operations one transaction runs against the kernel. Composes the entity
/// and schema writes over a shared index updater; created when the transaction
/// begins and destroyed with it.
class Operations final {
 public:
  Operations(KernelTransaction *transaction, Kernel *kernel);

  Operations(const Operations &) = delete;
  Operations &operator=(const Operations &) = delete;
  Operations(Operations &&) = delete;
  Operations &operator=(Operations &&) = delete;
  ~Operations() = default;

  const StateView &read() const;
  EntityWrite &data_write() { return entity_write_; }
  SchemaWrite &schema_write() { return schema_write_; }

 private:
  KernelTransaction *transaction_;
  IndexTxStateUpdater updater_;
  EntityWrite entity_write_;
  SchemaWrite schema_write_;
};

}  // namespace kestrel::storage
