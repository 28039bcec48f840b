// Repository: Moshline
// Component: Capture Scheduler
// Purpose: Fixed-cadence decode -> draw -> capture loop over the expanded
//          chunk stream.
// Copyright (c) 2025 RetroVue

#include "moshline/capture/CaptureScheduler.hpp"

#include <memory>
#include <sstream>

#include "moshline/util/Logger.hpp"

namespace moshline::capture {

using timeline::RenderError;
using util::Logger;

const char* CaptureStateName(CaptureState state) {
  switch (state) {
    case CaptureState::kIdle:       return "idle";
    case CaptureState::kDecoding:   return "decoding";
    case CaptureState::kDrawn:      return "drawn";
    case CaptureState::kCaptured:   return "captured";
    case CaptureState::kFinalizing: return "finalizing";
    case CaptureState::kDone:       return "done";
    case CaptureState::kFailed:     return "failed";
  }
  return "unknown";
}

CaptureScheduler::CaptureScheduler(CaptureConfig config,
                                   IFrameDecoder& decoder,
                                   ICaptureSink& sink,
                                   OutputClock& clock,
                                   const timing::ITimeSource& time_source)
    : config_(config),
      decoder_(decoder),
      sink_(sink),
      clock_(clock),
      time_source_(time_source) {}

CaptureResult CaptureScheduler::Fail(RenderError error, const std::string& detail,
                                     int64_t frames) {
  state_ = CaptureState::kFailed;
  if (sink_started_) {
    sink_.Abort();
    sink_started_ = false;
  }
  decoder_.Reset();

  std::ostringstream oss;
  oss << "[CaptureScheduler] " << timeline::RenderErrorToString(error)
      << " after " << frames << " frames: " << detail;
  Logger::Error(oss.str());
  return CaptureResult::Failure(error, detail, frames);
}

CaptureResult CaptureScheduler::Run(const std::vector<const timeline::EncodedChunk*>& chunks,
                                    const timeline::DecoderConfig& decoder_config,
                                    const timeline::Settings& settings,
                                    int64_t deadline_ms,
                                    double progress_lo,
                                    double progress_hi,
                                    const ProgressCallback& progress) {
  state_ = CaptureState::kIdle;
  sink_started_ = false;

  const auto total = static_cast<int64_t>(chunks.size());
  if (total == 0) {
    return Fail(RenderError::kInvalidRequest, "no chunks to capture", 0);
  }
  if (settings.width <= 0 || settings.height <= 0) {
    return Fail(RenderError::kInvalidRequest, "output raster has no area", 0);
  }

  if (!decoder_config.IsValid() || !decoder_.Configure(decoder_config)) {
    return Fail(RenderError::kDecodeError,
                "decoder rejected config codec='" + decoder_config.codec + "'", 0);
  }
  decoder_.SetOutputSize(settings.width, settings.height);

  if (!sink_.Start(settings, clock_.fps())) {
    return Fail(RenderError::kEncodeError, "capture sink start failed: " + sink_.LastError(), 0);
  }
  sink_started_ = true;

  RasterSurface surface(settings.width, settings.height);
  std::unique_ptr<RasterFrame> current;
  const int64_t every = config_.progress_every > 0 ? config_.progress_every : 1;

  clock_.Start();

  for (int64_t i = 0; i < total; ++i) {
    if (time_source_.NowMs() >= deadline_ms) {
      return Fail(RenderError::kTimeout, "render deadline reached during capture", i);
    }

    state_ = CaptureState::kDecoding;
    DecodeOutput out = decoder_.Decode(*chunks[static_cast<size_t>(i)]);
    if (out.status == DecodeStatus::kError) {
      std::ostringstream oss;
      oss << "decode failed at chunk " << i << " ("
          << timeline::ChunkKindName(chunks[static_cast<size_t>(i)]->kind) << "): " << out.detail;
      return Fail(RenderError::kDecodeError, oss.str(), i);
    }

    if (out.status == DecodeStatus::kFrame && out.frame) {
      // Release the previous frame before drawing its successor.
      current.reset();
      surface.Draw(*out.frame);
      current = std::move(out.frame);
    }
    state_ = CaptureState::kDrawn;

    if (!sink_.CaptureFrame(surface, i)) {
      std::ostringstream oss;
      oss << "capture failed at frame " << i << ": " << sink_.LastError();
      return Fail(RenderError::kEncodeError, oss.str(), i);
    }
    state_ = CaptureState::kCaptured;

    if (progress && i % every == 0) {
      progress(progress_lo + (progress_hi - progress_lo) *
                                 static_cast<double>(i) / static_cast<double>(total));
    }

    if (i + 1 < total) {
      clock_.WaitForFrame(i + 1);
    }
  }

  state_ = CaptureState::kFinalizing;
  current.reset();

  // Let the sink take in the final frame before closing the stream.
  clock_.WaitForFrame(total - 1 + config_.flush_frames);
  if (time_source_.NowMs() >= deadline_ms) {
    return Fail(RenderError::kTimeout, "render deadline reached while finalizing", total);
  }

  timeline::MediaBlob video;
  if (!sink_.Finish(video)) {
    return Fail(RenderError::kEncodeError, "capture sink finish failed: " + sink_.LastError(),
                total);
  }
  sink_started_ = false;

  if (progress) {
    progress(progress_hi);
  }
  state_ = CaptureState::kDone;

  std::ostringstream oss;
  oss << "[CaptureScheduler] Captured " << total << " frames at " << clock_.fps().num << "/"
      << clock_.fps().den << " fps, " << video.bytes.size() << " bytes";
  Logger::Info(oss.str());

  return CaptureResult::Success(std::move(video), total);
}

}  // namespace moshline::capture
