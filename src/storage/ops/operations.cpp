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
#include "storage/ops/operations.hpp"

#include "storage/txn/kernel_transaction.hpp"

namespace kestrel::storage {

Operations::Operations(KernelTransaction *transaction, Kernel *kernel)
    : transaction_(transaction),
      updater_(&transaction->view(), &transaction->state()),
      entity_write_(transaction, kernel, &updater_),
      schema_write_(transaction, kernel) {}

const StateView &Operations::read() const { return transaction_->view(); }

}  // namespace kestrel::storage
