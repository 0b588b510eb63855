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
#include "storage/indices/index_proxy.hpp"

#include "storage/exceptions.hpp"
#include "storage/graph_store.hpp"
#include "utils/logging.hpp"

namespace kestrel::storage {

std::optional<ValueTuple> IndexTupleOf(const SchemaDescriptor &schema, const std::set<LabelId> &labels,
                                       const std::map<PropertyId, PropertyValue> &properties) {
  if (!schema.IsNodeSchema() || !labels.contains(schema.label())) return std::nullopt;
  ValueTuple values;
  values.reserve(schema.properties().size());
  for (const auto &property : schema.properties()) {
    auto it = properties.find(property);
    if (it == properties.end() || it->second.IsNull()) return std::nullopt;
    values.push_back(it->second);
  }
  return values;
}

IndexState IndexProxy::State() const {
  auto guard = std::lock_guard{mutex_};
  return state_;
}

std::exception_ptr IndexProxy::FailureCause() const {
  auto guard = std::lock_guard{mutex_};
  return failure_;
}

std::string IndexProxy::FailureMessage() const {
  auto cause = FailureCause();
  return cause ? DescribeCause(cause) : std::string{};
}

std::vector<Gid> IndexProxy::Seek(const ValueTuple &values) const {
  auto guard = std::lock_guard{mutex_};
  auto it = entries_.find(values);
  if (it == entries_.end()) return {};
  return {it->second.begin(), it->second.end()};
}

size_t IndexProxy::EntryCount() const {
  auto guard = std::lock_guard{mutex_};
  size_t count = 0;
  for (const auto &[values, nodes] : entries_) count += nodes.size();
  return count;
}

bool IndexProxy::AwaitStoreScanCompleted(const std::function<void()> &interrupt_check,
                                         const std::chrono::milliseconds timeout,
                                         const std::chrono::milliseconds poll_interval) const {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  auto lock = std::unique_lock{mutex_};
  while (state_ == IndexState::POPULATING) {
    lock.unlock();
    if (interrupt_check) interrupt_check();
    lock.lock();
    if (state_ != IndexState::POPULATING) break;
    if (timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline) return false;
    state_cv_.wait_for(lock, poll_interval);
  }
  if (state_ == IndexState::FAILED) {
    throw IndexPopulationFailedException(rule_.schema, failure_);
  }
  return true;
}

void IndexProxy::VerifyDeferredConstraints() const {
  auto guard = std::lock_guard{mutex_};
  for (const auto &[values, nodes] : entries_) {
    if (nodes.size() > 1) {
      auto it = nodes.begin();
      const auto existing = *it++;
      throw IndexEntryConflictException({existing, *it, values});
    }
  }
}

void IndexProxy::Populate(const GraphStore &store) {
  spdlog::debug("Populating index {}", rule_.Reference().ToString());
  try {
    store.ScanNodesWithLabel(rule_.schema.label(), [&](const Gid node, const NodeRecord &record) {
      auto values = IndexTupleOf(rule_.schema, record.labels, record.properties);
      if (!values) return;
      auto guard = std::lock_guard{mutex_};
      if (dropped_) {
        throw IndexNotFoundKernelException(
            fmt::format("Index {} was dropped during population.", rule_.id.AsUint()));
      }
      auto &nodes = entries_[*values];
      if (rule_.unique) {
        for (const auto other : nodes) {
          if (other != node) throw IndexEntryConflictException({other, node, *values});
        }
      }
      nodes.insert(node);
    });
  } catch (const KernelException &e) {
    spdlog::warn("Population of index {} failed: {}", rule_.id.AsUint(), e.what());
    {
      auto guard = std::lock_guard{mutex_};
      state_ = IndexState::FAILED;
      failure_ = std::current_exception();
    }
    state_cv_.notify_all();
    return;
  }
  {
    auto guard = std::lock_guard{mutex_};
    // A drop during the scan already failed the index.
    if (!dropped_) state_ = IndexState::ONLINE;
  }
  state_cv_.notify_all();
  spdlog::debug("Index {} is {}", rule_.id.AsUint(), IndexStateToString(State()));
}

void IndexProxy::ApplyUpdate(const Gid node, const std::optional<ValueTuple> &before,
                             const std::optional<ValueTuple> &after) {
  auto guard = std::lock_guard{mutex_};
  if (dropped_) return;
  if (before) RemoveEntry(node, *before);
  if (after) AddEntry(node, *after);
}

void IndexProxy::MarkDropped() {
  {
    auto guard = std::lock_guard{mutex_};
    dropped_ = true;
    entries_.clear();
    if (state_ == IndexState::POPULATING) {
      state_ = IndexState::FAILED;
      failure_ = std::make_exception_ptr(
          IndexNotFoundKernelException(fmt::format("Index {} was dropped during population.", rule_.id.AsUint())));
    }
  }
  state_cv_.notify_all();
}

bool IndexProxy::IsDropped() const {
  auto guard = std::lock_guard{mutex_};
  return dropped_;
}

void IndexProxy::AddEntry(const Gid node, const ValueTuple &values) { entries_[values].insert(node); }

void IndexProxy::RemoveEntry(const Gid node, const ValueTuple &values) {
  auto it = entries_.find(values);
  if (it == entries_.end()) return;
  it->second.erase(node);
  if (it->second.empty()) entries_.erase(it);
}

}  // namespace kestrel::storage
