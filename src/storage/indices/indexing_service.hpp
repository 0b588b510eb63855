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

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

#include "storage/config.hpp"
#include "storage/graph_store.hpp"
#include "storage/indices/index_proxy.hpp"
#include "storage/schema_rules.hpp"
#include "utils/synchronized.hpp"
#include "utils/thread_pool.hpp"

namespace kestrel::storage {

/**
 * Owns one IndexProxy per committed index rule. New indexes are populated in
 * the background from the committed store; committed data changes are pushed
 * to every proxy through ApplyUpdates.
 */
class IndexingService final {
 public:
  IndexingService(Config::Indices config, const GraphStore *store);

  IndexingService(const IndexingService &) = delete;
  IndexingService &operator=(const IndexingService &) = delete;
  IndexingService(IndexingService &&) = delete;
  IndexingService &operator=(IndexingService &&) = delete;
  ~IndexingService();

  /// Registers a proxy for \p rule and schedules its population.
  std::shared_ptr<IndexProxy> CreateIndex(const IndexRule &rule);

  /// @throw IndexNotFoundKernelException
  std::shared_ptr<IndexProxy> GetIndexProxy(IndexId index) const;
  bool HasIndex(IndexId index) const;

  void DropIndex(IndexId index);

  /// Moves every affected node between value tuples of the indexes on its labels.
  void ApplyUpdates(const std::vector<NodeUpdate> &updates);

  /// While paused, scheduled populations wait before scanning the store.
  void PausePopulation();
  void ResumePopulation();
  /// Blocks until every scheduled population has finished.
  void AwaitPopulationIdle();

 private:
  void RunPopulation(const std::shared_ptr<IndexProxy> &proxy);

  Config::Indices config_;
  const GraphStore *store_;

  utils::Synchronized<std::map<IndexId, std::shared_ptr<IndexProxy>>, std::shared_mutex> proxies_;

  std::mutex pause_mutex_;
  std::condition_variable pause_cv_;
  bool paused_{false};

  utils::ThreadPool population_pool_;
};

}  // namespace kestrel::storage
