// Repository: Moshline
// Component: Render Pipeline Contract Tests
// Purpose: Whole-item rendering: only complete deliverables reach the output
//          queue, progress is monotonic, deadlines discard the item.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <memory>
#include <vector>

#include "fixtures/ChunkFactory.hpp"
#include "fixtures/FakeFrameDecoder.hpp"
#include "fixtures/FakeSampleSource.hpp"
#include "fixtures/RecordingCaptureSink.hpp"
#include "fixtures/ScriptedTranscoder.hpp"
#include "moshline/pipeline/RenderPipeline.hpp"
#include "support/DeterministicTimeSource.hpp"
#include "support/DeterministicWaitStrategy.hpp"

using namespace moshline::pipeline;
using moshline::testing::DeterministicTimeSource;
using moshline::testing::DeterministicWaitStrategy;
using moshline::testing::FakeFrameDecoder;
using moshline::testing::FakeSampleSource;
using moshline::testing::MakeChunks;
using moshline::testing::MakeDecoderConfig;
using moshline::testing::MakeSegment;
using moshline::testing::RecordingCaptureSink;
using moshline::testing::ScriptedTranscoder;
using moshline::timeline::FPS_30;
using moshline::timeline::NoiseSpec;
using moshline::timeline::RenderError;
using moshline::timeline::Segment;

namespace {

class RenderPipelineContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    time_ = std::make_shared<DeterministicTimeSource>(0);
    config_.output_queue_capacity = 4;
    Build();
  }

  void Build() {
    pipeline_ = std::make_unique<RenderPipeline>(
        config_, decoder_, sink_, transcoder_, &samples_, *time_,
        std::make_unique<DeterministicWaitStrategy>(time_));
  }

  // 10 frames + 3 frames x 3 = 19 frames.
  RenderRequest Request(const std::string& id, bool with_audio) {
    RenderRequest request;
    request.item_id = id;
    request.sources["a"] = MakeChunks(30, 10);
    request.decoder_config = MakeDecoderConfig();
    request.settings.width = 8;
    request.settings.height = 6;
    Segment looped = MakeSegment("a", 5, 8, 3);
    if (with_audio) looped.audio = NoiseSpec{};
    request.segments = {MakeSegment("a", 0, 10, 1), looped};
    return request;
  }

  RenderResult Render(const RenderRequest& request) {
    progress_.clear();
    return pipeline_->Render(request, [this](double p) { progress_.push_back(p); });
  }

  bool JournalHas(const std::string& message) const {
    for (const auto& e : pipeline_->journal().Entries()) {
      if (e.message == message) return true;
    }
    return false;
  }

  RenderConfig config_;
  std::shared_ptr<DeterministicTimeSource> time_;
  FakeFrameDecoder decoder_;
  RecordingCaptureSink sink_;
  ScriptedTranscoder transcoder_;
  FakeSampleSource samples_;
  std::unique_ptr<RenderPipeline> pipeline_;
  std::vector<double> progress_;
};

}  // namespace

// =============================================================================
// Deliverables
// =============================================================================

TEST_F(RenderPipelineContractTest, AudioTimelineIsMuxedAndQueued) {
  RenderResult result = Render(Request("item-1", true));
  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_EQ(result.frame_count, 19);
  EXPECT_TRUE(result.has_audio);

  ASSERT_EQ(transcoder_.invocations.size(), 1u);
  ASSERT_EQ(pipeline_->output_queue().Size(), 1u);
  auto item = pipeline_->output_queue().Pop();
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->item_id, "item-1");
  EXPECT_EQ(item->media.bytes, (std::vector<uint8_t>{'m', 'u', 'x'}));
  EXPECT_EQ(item->media.mime_type, "video/mp4");
  EXPECT_TRUE(item->has_audio);
  EXPECT_EQ(item->frame_count, 19);
  EXPECT_EQ(item->audio_samples, FPS_30.SamplesFromFrames(19, 44100));
  EXPECT_TRUE(JournalHas("render complete"));
}

TEST_F(RenderPipelineContractTest, SilentTimelineIsDeliveredVideoOnly) {
  RenderResult result = Render(Request("quiet", false));
  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_FALSE(result.has_audio);
  EXPECT_TRUE(transcoder_.invocations.empty());

  auto item = pipeline_->output_queue().Pop();
  ASSERT_TRUE(item.has_value());
  EXPECT_FALSE(item->has_audio);
  EXPECT_EQ(item->audio_samples, 0);
  // Capture sink output passed through untouched.
  EXPECT_EQ(item->media.bytes.size(), 20u);
  EXPECT_EQ(item->media.bytes[0], 'v');
}

TEST_F(RenderPipelineContractTest, SilentTrackMuxedWhenRequested) {
  config_.include_silent_audio = true;
  Build();
  RenderResult result = Render(Request("padded", false));
  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_TRUE(result.has_audio);
  EXPECT_EQ(transcoder_.invocations.size(), 1u);

  auto item = pipeline_->output_queue().Pop();
  ASSERT_TRUE(item.has_value());
  // Full-length silence, not the one-second placeholder.
  EXPECT_EQ(item->audio_samples, FPS_30.SamplesFromFrames(19, 44100));
}

TEST_F(RenderPipelineContractTest, EveryExpandedChunkIsDecodedInOrder) {
  ASSERT_TRUE(Render(Request("order", false)).ok);
  ASSERT_EQ(decoder_.decoded_payloads.size(), 19u);
  const std::vector<uint8_t> expected_positions = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9,
                                                   5, 6, 7, 5, 6, 7, 5, 6, 7};
  for (size_t i = 0; i < expected_positions.size(); ++i) {
    EXPECT_EQ(decoder_.decoded_payloads[i][1], expected_positions[i]) << "frame " << i;
  }
}

// =============================================================================
// Progress
// =============================================================================

TEST_F(RenderPipelineContractTest, ProgressIsMonotonicAndEndsAtOne) {
  ASSERT_TRUE(Render(Request("p", true)).ok);
  ASSERT_FALSE(progress_.empty());
  for (size_t i = 1; i < progress_.size(); ++i) {
    EXPECT_GT(progress_[i], progress_[i - 1]);
  }
  EXPECT_DOUBLE_EQ(progress_.back(), 1.0);
  EXPECT_GE(progress_.front(), 0.0);

  auto near = [&](double target) {
    return std::any_of(progress_.begin(), progress_.end(),
                       [target](double p) { return std::fabs(p - target) < 1e-9; });
  };
  EXPECT_TRUE(near(0.7));
  EXPECT_TRUE(near(0.8));
  EXPECT_TRUE(near(0.95));
}

TEST_F(RenderPipelineContractTest, FailedRenderNeverReportsCompletion) {
  transcoder_.script.push_back(ScriptedTranscoder::Fails("a"));
  transcoder_.script.push_back(ScriptedTranscoder::Fails("b"));
  EXPECT_FALSE(Render(Request("p", true)).ok);
  for (double p : progress_) EXPECT_LT(p, 1.0);
}

// =============================================================================
// Failures leave the queue untouched
// =============================================================================

TEST_F(RenderPipelineContractTest, TimeoutDiscardsItem) {
  config_.render_timeout_ms = 200;
  Build();
  RenderRequest request = Request("slow", true);
  request.segments = {MakeSegment("a", 0, 30, 2)};  // 2 s of video

  RenderResult result = Render(request);
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, RenderError::kTimeout);
  EXPECT_TRUE(pipeline_->output_queue().Empty());
  EXPECT_TRUE(transcoder_.invocations.empty());
  EXPECT_EQ(sink_.abort_calls, 1);
  EXPECT_EQ(decoder_.live_frames, 0);
  EXPECT_TRUE(JournalHas("render failed"));
}

TEST_F(RenderPipelineContractTest, MuxFailureDiscardsItem) {
  transcoder_.script.push_back(ScriptedTranscoder::Fails("no audio stream"));
  transcoder_.script.push_back(ScriptedTranscoder::Fails("still no audio stream"));
  RenderResult result = Render(Request("broken", true));
  EXPECT_EQ(result.error, RenderError::kMuxError);
  EXPECT_EQ(transcoder_.invocations.size(), 2u);
  EXPECT_TRUE(pipeline_->output_queue().Empty());
}

TEST_F(RenderPipelineContractTest, MuxRetrySucceeds) {
  transcoder_.script.push_back(ScriptedTranscoder::Fails("map"));
  EXPECT_TRUE(Render(Request("retry", true)).ok);
  EXPECT_EQ(pipeline_->output_queue().Size(), 1u);
}

TEST_F(RenderPipelineContractTest, DecodeFailureDiscardsItem) {
  decoder_.fail_at_chunk = 4;
  RenderResult result = Render(Request("corrupt", false));
  EXPECT_EQ(result.error, RenderError::kDecodeError);
  EXPECT_TRUE(pipeline_->output_queue().Empty());
  EXPECT_EQ(sink_.abort_calls, 1);
}

TEST_F(RenderPipelineContractTest, FullQueueRejectsBeforeWork) {
  config_.output_queue_capacity = 1;
  Build();
  ASSERT_TRUE(Render(Request("first", false)).ok);
  const int64_t decodes = decoder_.decode_calls;

  RenderResult result = Render(Request("second", false));
  EXPECT_EQ(result.error, RenderError::kQueueFull);
  EXPECT_EQ(decoder_.decode_calls, decodes);
  EXPECT_EQ(pipeline_->output_queue().Size(), 1u);
  EXPECT_EQ(pipeline_->output_queue().Pop()->item_id, "first");
}

TEST_F(RenderPipelineContractTest, InvalidRequests) {
  RenderRequest empty = Request("empty", false);
  empty.segments.clear();
  EXPECT_EQ(Render(empty).error, RenderError::kInvalidRequest);

  RenderRequest unknown = Request("unknown", false);
  unknown.segments.push_back(MakeSegment("missing", 0, 5, 1));
  EXPECT_EQ(Render(unknown).error, RenderError::kUnknownSource);

  RenderRequest zero = Request("zero", false);
  for (auto& seg : zero.segments) seg.repeat = 0;
  EXPECT_EQ(Render(zero).error, RenderError::kInvalidRequest);

  EXPECT_EQ(sink_.start_calls, 0);
  EXPECT_TRUE(pipeline_->output_queue().Empty());
}

TEST_F(RenderPipelineContractTest, RendersAreIndependent) {
  decoder_.fail_at_chunk = 2;
  EXPECT_FALSE(Render(Request("bad", false)).ok);
  decoder_.fail_at_chunk = -1;
  ASSERT_TRUE(Render(Request("good", true)).ok);
  ASSERT_EQ(pipeline_->output_queue().Size(), 1u);
  EXPECT_EQ(pipeline_->output_queue().Pop()->item_id, "good");
}

// =============================================================================
// Source loading
// =============================================================================

TEST_F(RenderPipelineContractTest, LoadSourcesFeedsRender) {
  PoolResult loaded = pipeline_->LoadSources({"a", "b"}, [](const std::string& id) {
    return SourceLoadResult::Success(MakeChunks(id == "a" ? 30 : 12, 6), MakeDecoderConfig());
  });
  ASSERT_TRUE(loaded.ok) << loaded.detail;
  EXPECT_TRUE(JournalHas("load sources"));

  RenderRequest request = Request("loaded", false);
  request.sources = loaded.sources;
  request.segments.push_back(MakeSegment("b", 0, 100, 1));  // clamped to 12
  RenderResult result = Render(request);
  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_EQ(result.frame_count, 19 + 12);
}

TEST_F(RenderPipelineContractTest, LoadFailureIsJournaled) {
  PoolResult loaded = pipeline_->LoadSources({"a"}, [](const std::string&) {
    return SourceLoadResult::Failure("not an mp4");
  });
  EXPECT_EQ(loaded.error, RenderError::kSourceLoadError);
  EXPECT_TRUE(JournalHas("load sources failed"));
}
