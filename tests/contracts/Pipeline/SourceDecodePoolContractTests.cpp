// Repository: Moshline
// Component: Source Decode Pool Contract Tests
// Purpose: Bounded parallel source loading joined before expansion.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "fixtures/ChunkFactory.hpp"
#include "moshline/pipeline/SourceDecodePool.hpp"

using namespace moshline::pipeline;
using moshline::testing::MakeChunks;
using moshline::testing::MakeDecoderConfig;
using moshline::timeline::RenderError;

namespace {

// Counts calls per id; sleeps so workers overlap.
class CountingLoader {
 public:
  SourceLoaderFn Fn() {
    return [this](const std::string& id) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls[id];
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      if (failing.count(id) != 0) {
        return SourceLoadResult::Failure("unreadable " + id);
      }
      return SourceLoadResult::Success(
          MakeChunks(static_cast<int64_t>(id.size()) * 5, 5, static_cast<uint8_t>(id[0])),
          MakeDecoderConfig());
    };
  }

  std::map<std::string, int> calls;
  std::map<std::string, bool> failing;

 private:
  std::mutex mutex_;
};

}  // namespace

TEST(SourceDecodePoolContract, LoadsEveryDistinctSource) {
  SourceDecodePool pool(2);
  CountingLoader loader;
  PoolResult result = pool.LoadAll({"a", "bb", "a", "ccc", "bb"}, loader.Fn());

  ASSERT_TRUE(result.ok) << result.detail;
  ASSERT_EQ(result.sources.size(), 3u);
  EXPECT_EQ(result.sources.at("a").size(), 5u);
  EXPECT_EQ(result.sources.at("bb").size(), 10u);
  EXPECT_EQ(result.sources.at("ccc").size(), 15u);
  EXPECT_EQ(result.sources.at("ccc")[0].payload[0], 'c');
  EXPECT_EQ(result.configs.at("bb").codec, "avc1.64001f");

  EXPECT_EQ(loader.calls["a"], 1);
  EXPECT_EQ(loader.calls["bb"], 1);
  EXPECT_EQ(loader.calls["ccc"], 1);
}

TEST(SourceDecodePoolContract, ConcurrencyIsBounded) {
  for (int32_t cap : {1, 2, 3}) {
    SourceDecodePool pool(cap);
    CountingLoader loader;
    PoolResult result = pool.LoadAll({"a", "b", "c", "d", "e", "f", "g", "h"}, loader.Fn());
    ASSERT_TRUE(result.ok);
    EXPECT_GE(pool.peak_in_flight(), 1);
    EXPECT_LE(pool.peak_in_flight(), cap);
  }
  EXPECT_EQ(SourceDecodePool(0).max_concurrent(), 1);
}

TEST(SourceDecodePoolContract, FirstFailureInInputOrderIsReported) {
  SourceDecodePool pool(4);
  CountingLoader loader;
  loader.failing["d"] = true;
  loader.failing["b"] = true;
  PoolResult result = pool.LoadAll({"a", "b", "c", "d"}, loader.Fn());

  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, RenderError::kSourceLoadError);
  EXPECT_NE(result.detail.find("'b'"), std::string::npos);
  EXPECT_TRUE(result.sources.empty());
  // Every worker ran to completion before the result was returned.
  EXPECT_EQ(loader.calls.size(), 4u);
}

TEST(SourceDecodePoolContract, ThrowingLoaderBecomesLoadError) {
  SourceDecodePool pool(2);
  PoolResult result = pool.LoadAll({"x"}, [](const std::string&) -> SourceLoadResult {
    throw std::runtime_error("disk on fire");
  });
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, RenderError::kSourceLoadError);
  EXPECT_NE(result.detail.find("disk on fire"), std::string::npos);
}

TEST(SourceDecodePoolContract, EmptyInputSucceeds) {
  SourceDecodePool pool(2);
  std::atomic<int> calls{0};
  PoolResult result = pool.LoadAll({}, [&calls](const std::string&) {
    ++calls;
    return SourceLoadResult::Failure("unused");
  });
  EXPECT_TRUE(result.ok);
  EXPECT_TRUE(result.sources.empty());
  EXPECT_EQ(calls.load(), 0);
}
