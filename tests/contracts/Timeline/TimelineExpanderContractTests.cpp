// Repository: Moshline
// Component: Timeline Expander Contract Tests
// Purpose: Clamping policy, expansion length and ordering, error reporting.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include "fixtures/ChunkFactory.hpp"
#include "moshline/timeline/TimelineExpander.hpp"

using namespace moshline;
using namespace moshline::timeline;
using moshline::testing::MakeChunks;
using moshline::testing::MakeSegment;

// =============================================================================
// Clamping
// =============================================================================

TEST(TimelineExpanderContract, ClampsWildBoundsToSource) {
  Segment seg = ClampSegment(MakeSegment("a", -5, 1'000'000), 50);
  EXPECT_EQ(seg.from, 0);
  EXPECT_EQ(seg.to, 50);
}

TEST(TimelineExpanderContract, ClampNeverProducesEmptyRangeOnNonEmptySource) {
  // from past the end, to before from, to == from
  const Segment cases[] = {
      MakeSegment("a", 70, 80),
      MakeSegment("a", 10, 3),
      MakeSegment("a", 7, 7),
      MakeSegment("a", -10, -2),
  };
  for (const auto& c : cases) {
    Segment seg = ClampSegment(c, 20);
    EXPECT_GE(seg.from, 0);
    EXPECT_LT(seg.from, 20);
    EXPECT_GT(seg.to, seg.from) << "from=" << c.from << " to=" << c.to;
    EXPECT_LE(seg.to, 20);
  }
}

TEST(TimelineExpanderContract, FromPastEndSnapsToLastChunk) {
  Segment seg = ClampSegment(MakeSegment("a", 70, 80), 20);
  EXPECT_EQ(seg.from, 19);
  EXPECT_EQ(seg.to, 20);
}

TEST(TimelineExpanderContract, ExtremeBoundsClampWithoutOverflow) {
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  constexpr int64_t kMin = std::numeric_limits<int64_t>::min();

  Segment past_end = ClampSegment(MakeSegment("a", kMax, 3), 50);
  EXPECT_EQ(past_end.from, 49);
  EXPECT_EQ(past_end.to, 50);

  Segment both_max = ClampSegment(MakeSegment("a", kMax, kMax), 50);
  EXPECT_EQ(both_max.from, 49);
  EXPECT_EQ(both_max.to, 50);

  Segment both_min = ClampSegment(MakeSegment("a", kMin, kMin), 50);
  EXPECT_EQ(both_min.from, 0);
  EXPECT_EQ(both_min.to, 1);

  SourceMap sources{{"a", MakeChunks(50, 10)}};
  auto result = Expand({MakeSegment("a", kMax, 3, 2)}, sources);
  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_EQ(result.chunks.size(), 2u);
}

TEST(TimelineExpanderContract, EmptySourceYieldsZeroFrames) {
  Segment seg = ClampSegment(MakeSegment("a", 3, 9, 4), 0);
  EXPECT_EQ(seg.from, 0);
  EXPECT_EQ(seg.to, 0);
  EXPECT_EQ(seg.TotalFrames(), 0);
}

TEST(TimelineExpanderContract, ClampKeepsRepeatAndAudio) {
  Segment in = MakeSegment("a", -1, 5, 3);
  in.audio = SineSpec{220.0f, 0.5f};
  Segment seg = ClampSegment(in, 10);
  EXPECT_EQ(seg.repeat, 3u);
  ASSERT_TRUE(seg.audio.has_value());
  EXPECT_TRUE(std::holds_alternative<SineSpec>(*seg.audio));
}

// =============================================================================
// Expansion
// =============================================================================

TEST(TimelineExpanderContract, ExpandedLengthMatchesWorkedExample) {
  SourceMap sources;
  sources["a"] = MakeChunks(20);
  std::vector<Segment> segments = {MakeSegment("a", 0, 10, 2), MakeSegment("a", 5, 8, 1)};

  auto result = Expand(segments, sources);
  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_EQ(result.chunks.size(), 23u);
}

TEST(TimelineExpanderContract, ExpandedLengthEqualsSumOverClampedSegments) {
  SourceMap sources;
  sources["a"] = MakeChunks(50);
  sources["b"] = MakeChunks(7, 3, 1);
  std::vector<Segment> segments = {
      MakeSegment("a", -5, 1'000'000, 1),
      MakeSegment("b", 2, 100, 4),
      MakeSegment("a", 49, 49, 3),
      MakeSegment("b", 6, 2, 2),
      MakeSegment("a", 10, 20, 0),
  };

  auto resolved = ResolveSegments(segments, sources);
  ASSERT_TRUE(resolved.ok);
  int64_t expected = 0;
  for (const auto& s : resolved.segments) {
    expected += static_cast<int64_t>(s.repeat) * (s.to - s.from);
  }
  EXPECT_EQ(expected, 50 + 4 * 5 + 3 * 1 + 2 * 1 + 0);

  auto result = Expand(segments, sources);
  ASSERT_TRUE(result.ok);
  EXPECT_EQ(static_cast<int64_t>(result.chunks.size()), expected);
  EXPECT_EQ(CountExpandedFrames(resolved.segments), expected);
}

TEST(TimelineExpanderContract, RepeatsReplayRangeInOrder) {
  SourceMap sources;
  sources["a"] = MakeChunks(10);
  auto result = Expand({MakeSegment("a", 3, 6, 3)}, sources);
  ASSERT_TRUE(result.ok);
  ASSERT_EQ(result.chunks.size(), 9u);
  for (size_t i = 0; i < result.chunks.size(); ++i) {
    EXPECT_EQ(result.chunks[i], &sources["a"][3 + i % 3]) << "position " << i;
  }
}

TEST(TimelineExpanderContract, RepeatZeroContributesNothing) {
  SourceMap sources;
  sources["a"] = MakeChunks(10);
  auto result = Expand({MakeSegment("a", 0, 10, 0), MakeSegment("a", 2, 4, 1)}, sources);
  ASSERT_TRUE(result.ok);
  ASSERT_EQ(result.chunks.size(), 2u);
  EXPECT_EQ(result.chunks[0], &sources["a"][2]);
}

TEST(TimelineExpanderContract, ChunkKindsArePreservedNotRewritten) {
  // A delta run replayed after a foreign key frame is the datamosh itself.
  SourceMap sources;
  sources["a"] = MakeChunks(30, 30, 0);
  sources["b"] = MakeChunks(30, 30, 1);
  auto result = Expand({MakeSegment("a", 0, 1), MakeSegment("b", 5, 10, 2)}, sources);
  ASSERT_TRUE(result.ok);
  ASSERT_EQ(result.chunks.size(), 11u);
  EXPECT_EQ(result.chunks[0]->kind, ChunkKind::kKey);
  for (size_t i = 1; i < result.chunks.size(); ++i) {
    EXPECT_EQ(result.chunks[i]->kind, ChunkKind::kDelta);
    EXPECT_EQ(result.chunks[i]->payload[0], 1);
  }
}

TEST(TimelineExpanderContract, OutputBorrowsSourceChunks) {
  SourceMap sources;
  sources["a"] = MakeChunks(5);
  auto result = Expand({MakeSegment("a", 0, 5)}, sources);
  ASSERT_TRUE(result.ok);
  for (size_t i = 0; i < 5; ++i) {
    EXPECT_EQ(result.chunks[i], &sources["a"][i]);
  }
}

TEST(TimelineExpanderContract, UnknownSourceIsTypedError) {
  SourceMap sources;
  sources["a"] = MakeChunks(5);
  auto result = Expand({MakeSegment("a", 0, 5), MakeSegment("ghost", 0, 5)}, sources);
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, RenderError::kUnknownSource);
  EXPECT_NE(result.detail.find("ghost"), std::string::npos);
  EXPECT_TRUE(result.chunks.empty());
}

TEST(TimelineExpanderContract, ExpansionIsDeterministic) {
  SourceMap sources;
  sources["a"] = MakeChunks(40);
  std::vector<Segment> segments = {MakeSegment("a", 0, 12, 2), MakeSegment("a", 30, 35, 5)};
  auto first = Expand(segments, sources);
  auto second = Expand(segments, sources);
  ASSERT_TRUE(first.ok);
  EXPECT_EQ(first.chunks, second.chunks);
}

TEST(TimelineExpanderContract, EmptySegmentListExpandsToNothing) {
  SourceMap sources;
  auto result = Expand({}, sources);
  EXPECT_TRUE(result.ok);
  EXPECT_TRUE(result.chunks.empty());
}

TEST(TimelineExpanderContract, ErrorNamesAreStable) {
  EXPECT_STREQ(RenderErrorToString(RenderError::kTimeout), "TIMEOUT");
  EXPECT_STREQ(RenderErrorToString(RenderError::kMuxError), "MUX_ERROR");
  EXPECT_STREQ(RenderErrorToString(RenderError::kUnknownSource), "UNKNOWN_SOURCE");
}
