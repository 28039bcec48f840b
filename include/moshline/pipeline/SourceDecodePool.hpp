// Repository: Moshline
// Component: Source Decode Pool
// Purpose: Load distinct source media into chunk arrays with a fixed
//          concurrency cap; all results are joined before expansion.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_PIPELINE_SOURCE_DECODE_POOL_HPP_
#define MOSHLINE_PIPELINE_SOURCE_DECODE_POOL_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "moshline/timeline/MoshTypes.hpp"

namespace moshline::pipeline {

struct SourceLoadResult {
  bool ok;
  std::string detail;
  timeline::ChunkList chunks;
  timeline::DecoderConfig config;

  static SourceLoadResult Success(timeline::ChunkList c, timeline::DecoderConfig cfg) {
    return {true, "", std::move(c), std::move(cfg)};
  }
  static SourceLoadResult Failure(std::string d) {
    return {false, std::move(d), {}, {}};
  }
};

// Called from worker threads; must be safe to run concurrently for
// different source ids.
using SourceLoaderFn = std::function<SourceLoadResult(const std::string& source_id)>;

struct PoolResult {
  bool ok;
  timeline::RenderError error;
  std::string detail;
  timeline::SourceMap sources;
  std::map<std::string, timeline::DecoderConfig> configs;
};

class SourceDecodePool {
 public:
  explicit SourceDecodePool(int32_t max_concurrent);

  SourceDecodePool(const SourceDecodePool&) = delete;
  SourceDecodePool& operator=(const SourceDecodePool&) = delete;

  // Load every distinct id (duplicates are loaded once). Blocks until all
  // workers have joined. Fails with kSourceLoadError naming the first
  // failing id in input order.
  PoolResult LoadAll(const std::vector<std::string>& source_ids, const SourceLoaderFn& loader);

  int32_t max_concurrent() const { return max_concurrent_; }

  // Highest number of loader calls observed in flight during the last
  // LoadAll().
  int32_t peak_in_flight() const { return peak_in_flight_.load(std::memory_order_acquire); }

 private:
  const int32_t max_concurrent_;
  std::atomic<int32_t> in_flight_{0};
  std::atomic<int32_t> peak_in_flight_{0};
};

}  // namespace moshline::pipeline

#endif  // MOSHLINE_PIPELINE_SOURCE_DECODE_POOL_HPP_
