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
#include "storage/indices/indexing_service.hpp"

#include "storage/exceptions.hpp"
#include "utils/logging.hpp"

namespace kestrel::storage {

IndexingService::IndexingService(Config::Indices config, const GraphStore *store)
    : config_(config), store_(store), population_pool_(config.population_threads, "index-population") {}

IndexingService::~IndexingService() {
  // Populations waiting on the pause would otherwise keep the pool from shutting down.
  ResumePopulation();
  population_pool_.ShutDown();
}

std::shared_ptr<IndexProxy> IndexingService::CreateIndex(const IndexRule &rule) {
  auto proxy = std::make_shared<IndexProxy>(rule);
  proxies_.WithLock([&](auto &proxies) { proxies.insert_or_assign(rule.id, proxy); });
  population_pool_.AddTask([this, proxy] { RunPopulation(proxy); });
  return proxy;
}

std::shared_ptr<IndexProxy> IndexingService::GetIndexProxy(const IndexId index) const {
  auto proxy = proxies_.WithReadLock([&](const auto &proxies) -> std::shared_ptr<IndexProxy> {
    auto it = proxies.find(index);
    return it == proxies.end() ? nullptr : it->second;
  });
  if (!proxy) {
    throw IndexNotFoundKernelException(fmt::format("No index with id {} exists.", index.AsUint()));
  }
  return proxy;
}

bool IndexingService::HasIndex(const IndexId index) const {
  return proxies_.WithReadLock([&](const auto &proxies) { return proxies.contains(index); });
}

void IndexingService::DropIndex(const IndexId index) {
  auto proxy = proxies_.WithLock([&](auto &proxies) -> std::shared_ptr<IndexProxy> {
    auto it = proxies.find(index);
    if (it == proxies.end()) return nullptr;
    auto dropped = std::move(it->second);
    proxies.erase(it);
    return dropped;
  });
  if (proxy) proxy->MarkDropped();
}

void IndexingService::ApplyUpdates(const std::vector<NodeUpdate> &updates) {
  proxies_.WithReadLock([&](const auto &proxies) {
    for (const auto &[id, proxy] : proxies) {
      for (const auto &update : updates) {
        std::optional<ValueTuple> before;
        std::optional<ValueTuple> after;
        if (update.before) before = IndexTupleOf(proxy->schema(), update.before->labels, update.before->properties);
        if (update.after) after = IndexTupleOf(proxy->schema(), update.after->labels, update.after->properties);
        if (!before && !after) continue;
        if (before && after && *before == *after) continue;
        proxy->ApplyUpdate(update.node, before, after);
      }
    }
  });
}

void IndexingService::PausePopulation() {
  auto guard = std::lock_guard{pause_mutex_};
  paused_ = true;
}

void IndexingService::ResumePopulation() {
  {
    auto guard = std::lock_guard{pause_mutex_};
    paused_ = false;
  }
  pause_cv_.notify_all();
}

void IndexingService::AwaitPopulationIdle() { population_pool_.AwaitIdle(); }

void IndexingService::RunPopulation(const std::shared_ptr<IndexProxy> &proxy) {
  {
    auto lock = std::unique_lock{pause_mutex_};
    while (paused_ && !proxy->IsDropped()) {
      pause_cv_.wait_for(lock, config_.population_poll_interval);
    }
  }
  if (proxy->IsDropped()) return;
  proxy->Populate(*store_);
}

}  // namespace kestrel::storage
