// Repository: Moshline
// Component: Render Pipeline
// Purpose: Per-item expand -> synthesize -> capture -> mux under one
//          deadline, committing only complete deliverables to the output
//          queue.
// Copyright (c) 2025 RetroVue

#include "moshline/pipeline/RenderPipeline.hpp"

#include <algorithm>
#include <sstream>

#include "moshline/audio/WavEncoder.hpp"
#include "moshline/capture/CaptureScheduler.hpp"
#include "moshline/mux/MuxerAdapter.hpp"
#include "moshline/timeline/TimelineExpander.hpp"
#include "moshline/util/Logger.hpp"

namespace moshline::pipeline {

using timeline::RenderError;
using util::Logger;

namespace {

// Position of the post-capture stages inside the remaining progress range.
constexpr double kWavStage = 1.0 / 3.0;  // 0.8 with a 0.7 capture share
constexpr double kMuxStage = 5.0 / 6.0;  // 0.95 with a 0.7 capture share

// Clamps to [0, 1] and drops regressions and repeats.
class MonotonicProgress {
 public:
  explicit MonotonicProgress(const RenderProgressFn& fn) : fn_(fn) {}

  void Report(double value) {
    if (!fn_) return;
    value = std::clamp(value, 0.0, 1.0);
    if (reported_ && value <= last_) return;
    last_ = value;
    reported_ = true;
    fn_(value);
  }

 private:
  const RenderProgressFn& fn_;
  double last_ = 0.0;
  bool reported_ = false;
};

}  // namespace

RenderPipeline::RenderPipeline(RenderConfig config,
                               capture::IFrameDecoder& decoder,
                               capture::ICaptureSink& capture_sink,
                               mux::ITranscoder& transcoder,
                               audio::ISampleSource* sample_source,
                               const timing::ITimeSource& time_source,
                               std::unique_ptr<capture::IWaitStrategy> wait)
    : config_(std::move(config)),
      decoder_(decoder),
      capture_sink_(capture_sink),
      transcoder_(transcoder),
      sample_source_(sample_source),
      time_source_(time_source),
      clock_(config_.fps, std::move(wait)),
      queue_(config_.output_queue_capacity),
      journal_(config_.journal_capacity, time_source),
      decode_pool_(config_.max_concurrent_decodes) {}

RenderResult RenderPipeline::Fail(const RenderRequest& request, RenderError error,
                                  const std::string& detail) {
  std::ostringstream data;
  data << "item=" << request.item_id << " error=" << timeline::RenderErrorToString(error)
       << " detail=" << detail;
  journal_.Record("render failed", data.str());

  std::ostringstream oss;
  oss << "[RenderPipeline] Item '" << request.item_id << "' discarded: "
      << timeline::RenderErrorToString(error) << " (" << detail << ")";
  Logger::Error(oss.str());
  return RenderResult::Failure(error, detail);
}

PoolResult RenderPipeline::LoadSources(const std::vector<std::string>& source_ids,
                                       const SourceLoaderFn& loader) {
  journal_.Record("load sources", std::to_string(source_ids.size()) + " requested");
  PoolResult result = decode_pool_.LoadAll(source_ids, loader);
  if (!result.ok) {
    journal_.Record("load sources failed", result.detail);
  }
  return result;
}

RenderResult RenderPipeline::Render(const RenderRequest& request,
                                    const RenderProgressFn& progress) {
  std::lock_guard<std::mutex> lock(render_mutex_);

  const int64_t start_ms = time_source_.NowMs();
  const int64_t deadline_ms = config_.render_timeout_ms > 0
                                  ? start_ms + config_.render_timeout_ms
                                  : capture::kNoDeadline;
  auto expired = [&]() { return time_source_.NowMs() >= deadline_ms; };
  MonotonicProgress reporter(progress);

  journal_.Record("render start", "item=" + request.item_id + " segments=" +
                                      std::to_string(request.segments.size()));

  if (queue_.Full()) {
    return Fail(request, RenderError::kQueueFull,
                "output queue at capacity " + std::to_string(queue_.Capacity()));
  }
  if (request.segments.empty()) {
    return Fail(request, RenderError::kInvalidRequest, "no segments");
  }

  // Expand. Audio and video both consume these clamped segments.
  auto resolved = timeline::ResolveSegments(request.segments, request.sources);
  if (!resolved.ok) {
    return Fail(request, resolved.error, resolved.detail);
  }
  auto expanded = timeline::Expand(resolved.segments, request.sources);
  if (!expanded.ok) {
    return Fail(request, expanded.error, expanded.detail);
  }
  if (expanded.chunks.empty()) {
    return Fail(request, RenderError::kInvalidRequest, "timeline expands to zero frames");
  }
  if (expired()) {
    return Fail(request, RenderError::kTimeout, "render deadline reached after expansion");
  }

  // Synthesize the whole track before capture starts.
  const bool has_audio_specs = audio::AudioSynthesizer::HasAudio(resolved.segments);
  const bool want_audio = has_audio_specs || config_.include_silent_audio;
  audio::AudioSynthesizer synthesizer(config_.ToSynthesizerConfig(), sample_source_);
  audio::PcmBuffer pcm;
  if (has_audio_specs) {
    pcm = synthesizer.Synthesize(resolved.segments, request.global_volume);
  } else if (want_audio) {
    pcm = audio::PcmBuffer(config_.sample_rate,
                           static_cast<size_t>(synthesizer.TrackSampleCount(resolved.segments)));
  }
  if (expired()) {
    return Fail(request, RenderError::kTimeout, "render deadline reached after audio synthesis");
  }

  // Capture.
  const double share = std::clamp(config_.capture_progress_share, 0.0, 1.0);
  capture::CaptureScheduler scheduler(config_.ToCaptureConfig(), decoder_, capture_sink_, clock_,
                                      time_source_);
  capture::CaptureResult captured =
      scheduler.Run(expanded.chunks, request.decoder_config, request.settings, deadline_ms, 0.0,
                    share, [&reporter](double v) { reporter.Report(v); });
  if (!captured.ok) {
    return Fail(request, captured.error, captured.detail);
  }

  RenderedItem item;
  item.item_id = request.item_id;
  item.frame_count = captured.frames_captured;
  item.has_audio = want_audio;

  if (!want_audio) {
    item.media = std::move(captured.video);
  } else {
    timeline::MediaBlob wav = audio::EncodeWavBlob(pcm);
    reporter.Report(share + (1.0 - share) * kWavStage);
    if (expired()) {
      return Fail(request, RenderError::kTimeout, "render deadline reached before mux");
    }

    mux::MuxerAdapter muxer(config_.ToMuxConfig(), transcoder_);
    mux::MuxResult muxed = muxer.Mux(captured.video, wav);
    if (!muxed.ok) {
      return Fail(request, muxed.error, muxed.detail);
    }
    reporter.Report(share + (1.0 - share) * kMuxStage);
    if (expired()) {
      return Fail(request, RenderError::kTimeout, "render deadline reached after mux");
    }

    item.media = std::move(muxed.output);
    item.audio_samples = static_cast<int64_t>(pcm.Size());
  }

  item.render_ms = time_source_.NowMs() - start_ms;
  const int64_t frames = item.frame_count;
  const size_t bytes = item.media.bytes.size();
  const int64_t render_ms = item.render_ms;

  auto enqueued = queue_.Enqueue(std::move(item));
  if (!enqueued.success) {
    return Fail(request, enqueued.error, "output queue rejected item");
  }
  reporter.Report(1.0);

  std::ostringstream data;
  data << "item=" << request.item_id << " frames=" << frames << " bytes=" << bytes
       << " audio=" << (want_audio ? "yes" : "no") << " ms=" << render_ms;
  journal_.Record("render complete", data.str());

  std::ostringstream oss;
  oss << "[RenderPipeline] Item '" << request.item_id << "' queued: " << frames << " frames, "
      << bytes << " bytes, audio=" << (want_audio ? "yes" : "no") << ", depth="
      << enqueued.depth << "/" << queue_.Capacity();
  Logger::Info(oss.str());

  return RenderResult::Success(frames, want_audio);
}

}  // namespace moshline::pipeline
