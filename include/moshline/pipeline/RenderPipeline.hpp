// Repository: Moshline
// Component: Render Pipeline
// Purpose: Per-item expand -> synthesize -> capture -> mux under one
//          deadline, committing only complete deliverables to the output
//          queue.
// Copyright (c) 2025 RetroVue
//
// Each pipeline owns its queue and journal; several pipelines can run side
// by side with their own collaborators. Render() calls on one pipeline are
// serialized.

#ifndef MOSHLINE_PIPELINE_RENDER_PIPELINE_HPP_
#define MOSHLINE_PIPELINE_RENDER_PIPELINE_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "moshline/audio/AudioSynthesizer.hpp"
#include "moshline/audio/ISampleSource.hpp"
#include "moshline/capture/ICaptureSink.hpp"
#include "moshline/capture/IFrameDecoder.hpp"
#include "moshline/capture/IWaitStrategy.hpp"
#include "moshline/capture/OutputClock.hpp"
#include "moshline/mux/ITranscoder.hpp"
#include "moshline/pipeline/RenderConfig.hpp"
#include "moshline/pipeline/RenderJournal.hpp"
#include "moshline/pipeline/RenderQueue.hpp"
#include "moshline/pipeline/SourceDecodePool.hpp"
#include "moshline/timeline/MoshTypes.hpp"
#include "moshline/timing/ITimeSource.hpp"

namespace moshline::pipeline {

struct RenderRequest {
  std::string item_id;
  std::vector<timeline::Segment> segments;
  timeline::SourceMap sources;
  timeline::DecoderConfig decoder_config;
  timeline::Settings settings;
  float global_volume = 1.0f;
};

struct RenderResult {
  bool ok;
  timeline::RenderError error;
  std::string detail;
  int64_t frame_count;
  bool has_audio;

  static RenderResult Success(int64_t frames, bool audio) {
    return {true, timeline::RenderError::kNone, "", frames, audio};
  }
  static RenderResult Failure(timeline::RenderError e, std::string d) {
    return {false, e, std::move(d), 0, false};
  }
};

// Receives values in [0, 1], never decreasing within one Render().
using RenderProgressFn = std::function<void(double)>;

class RenderPipeline {
 public:
  // Collaborators must outlive the pipeline. `sample_source` may be null
  // (Sample segments render as silence); a null `wait` paces in real time.
  RenderPipeline(RenderConfig config,
                 capture::IFrameDecoder& decoder,
                 capture::ICaptureSink& capture_sink,
                 mux::ITranscoder& transcoder,
                 audio::ISampleSource* sample_source,
                 const timing::ITimeSource& time_source,
                 std::unique_ptr<capture::IWaitStrategy> wait);

  RenderPipeline(const RenderPipeline&) = delete;
  RenderPipeline& operator=(const RenderPipeline&) = delete;

  // Render one item. On success exactly one RenderedItem is appended to
  // the output queue. On any failure (including kTimeout) the queue is
  // left untouched and nothing partial is kept.
  RenderResult Render(const RenderRequest& request, const RenderProgressFn& progress);

  // Load sources with bounded parallelism (max_concurrent_decodes).
  PoolResult LoadSources(const std::vector<std::string>& source_ids,
                         const SourceLoaderFn& loader);

  RenderQueue& output_queue() { return queue_; }
  const RenderQueue& output_queue() const { return queue_; }
  RenderJournal& journal() { return journal_; }
  const RenderJournal& journal() const { return journal_; }
  const RenderConfig& config() const { return config_; }

 private:
  RenderResult Fail(const RenderRequest& request, timeline::RenderError error,
                    const std::string& detail);

  RenderConfig config_;
  capture::IFrameDecoder& decoder_;
  capture::ICaptureSink& capture_sink_;
  mux::ITranscoder& transcoder_;
  audio::ISampleSource* sample_source_;
  const timing::ITimeSource& time_source_;
  capture::OutputClock clock_;

  RenderQueue queue_;
  RenderJournal journal_;
  SourceDecodePool decode_pool_;

  std::mutex render_mutex_;
};

}  // namespace moshline::pipeline

#endif  // MOSHLINE_PIPELINE_RENDER_PIPELINE_HPP_
