// Repository: Moshline
// Component: Source Decode Pool
// Purpose: Load distinct source media into chunk arrays with a fixed
//          concurrency cap; all results are joined before expansion.
// Copyright (c) 2025 RetroVue

#include "moshline/pipeline/SourceDecodePool.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <sstream>
#include <thread>

#include "moshline/util/Logger.hpp"

namespace moshline::pipeline {

using timeline::RenderError;
using util::Logger;

SourceDecodePool::SourceDecodePool(int32_t max_concurrent)
    : max_concurrent_(std::max(1, max_concurrent)) {}

PoolResult SourceDecodePool::LoadAll(const std::vector<std::string>& source_ids,
                                     const SourceLoaderFn& loader) {
  std::vector<std::string> ids;
  std::set<std::string> seen;
  for (const auto& id : source_ids) {
    if (seen.insert(id).second) ids.push_back(id);
  }

  in_flight_.store(0, std::memory_order_release);
  peak_in_flight_.store(0, std::memory_order_release);

  std::vector<SourceLoadResult> results(ids.size(), SourceLoadResult::Failure("not loaded"));
  std::atomic<size_t> next{0};

  auto worker = [&]() {
    for (;;) {
      const size_t i = next.fetch_add(1, std::memory_order_acq_rel);
      if (i >= ids.size()) return;

      const int32_t now = in_flight_.fetch_add(1, std::memory_order_acq_rel) + 1;
      int32_t peak = peak_in_flight_.load(std::memory_order_acquire);
      while (now > peak &&
             !peak_in_flight_.compare_exchange_weak(peak, now, std::memory_order_acq_rel)) {
      }

      try {
        results[i] = loader(ids[i]);
      } catch (const std::exception& e) {
        results[i] = SourceLoadResult::Failure(std::string("loader threw: ") + e.what());
      }

      in_flight_.fetch_sub(1, std::memory_order_acq_rel);
    }
  };

  const size_t worker_count = std::min(ids.size(), static_cast<size_t>(max_concurrent_));
  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for (size_t w = 0; w < worker_count; ++w) {
    workers.emplace_back(worker);
  }
  for (auto& t : workers) {
    t.join();
  }

  PoolResult out{true, RenderError::kNone, "", {}, {}};
  for (size_t i = 0; i < ids.size(); ++i) {
    if (!results[i].ok) {
      std::ostringstream oss;
      oss << "source '" << ids[i] << "' failed to load: " << results[i].detail;
      Logger::Error("[SourceDecodePool] " + oss.str());
      return PoolResult{false, RenderError::kSourceLoadError, oss.str(), {}, {}};
    }
    out.sources.emplace(ids[i], std::move(results[i].chunks));
    out.configs.emplace(ids[i], std::move(results[i].config));
  }

  std::ostringstream oss;
  oss << "[SourceDecodePool] Loaded " << ids.size() << " sources with " << worker_count
      << " workers (peak in flight " << peak_in_flight() << ")";
  Logger::Info(oss.str());
  return out;
}

}  // namespace moshline::pipeline
