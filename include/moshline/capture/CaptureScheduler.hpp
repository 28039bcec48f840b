// Repository: Moshline
// Component: Capture Scheduler
// Purpose: Fixed-cadence decode -> draw -> capture loop over the expanded
//          chunk stream.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_CAPTURE_CAPTURE_SCHEDULER_HPP_
#define MOSHLINE_CAPTURE_CAPTURE_SCHEDULER_HPP_

#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <vector>

#include "moshline/capture/ICaptureSink.hpp"
#include "moshline/capture/IFrameDecoder.hpp"
#include "moshline/capture/OutputClock.hpp"
#include "moshline/timeline/MoshTypes.hpp"
#include "moshline/timing/ITimeSource.hpp"

namespace moshline::capture {

inline constexpr int64_t kNoDeadline = std::numeric_limits<int64_t>::max();

using ProgressCallback = std::function<void(double)>;

struct CaptureConfig {
  int32_t progress_every = 10;  // Report every K frames
  int32_t flush_frames = 2;     // Frame intervals waited before Finish()
};

enum class CaptureState {
  kIdle,
  kDecoding,
  kDrawn,
  kCaptured,
  kFinalizing,
  kDone,
  kFailed,
};

const char* CaptureStateName(CaptureState state);

struct CaptureResult {
  bool ok;
  timeline::RenderError error;
  std::string detail;
  timeline::MediaBlob video;
  int64_t frames_captured;

  static CaptureResult Success(timeline::MediaBlob v, int64_t frames) {
    return {true, timeline::RenderError::kNone, "", std::move(v), frames};
  }
  static CaptureResult Failure(timeline::RenderError e, std::string d, int64_t frames) {
    return {false, e, std::move(d), {}, frames};
  }
};

// Single-threaded. One Run() per scheduler at a time.
class CaptureScheduler {
 public:
  CaptureScheduler(CaptureConfig config,
                   IFrameDecoder& decoder,
                   ICaptureSink& sink,
                   OutputClock& clock,
                   const timing::ITimeSource& time_source);

  // Decode, draw and capture every chunk at the clock's frame rate.
  // Progress values are lo + (hi - lo) * i / N every `progress_every`
  // frames, then hi on success. Aborts with kTimeout once the time source
  // reaches `deadline_ms`.
  CaptureResult Run(const std::vector<const timeline::EncodedChunk*>& chunks,
                    const timeline::DecoderConfig& decoder_config,
                    const timeline::Settings& settings,
                    int64_t deadline_ms,
                    double progress_lo,
                    double progress_hi,
                    const ProgressCallback& progress);

  CaptureState state() const { return state_; }

 private:
  CaptureResult Fail(timeline::RenderError error, const std::string& detail, int64_t frames);

  CaptureConfig config_;
  IFrameDecoder& decoder_;
  ICaptureSink& sink_;
  OutputClock& clock_;
  const timing::ITimeSource& time_source_;
  CaptureState state_ = CaptureState::kIdle;
  bool sink_started_ = false;
};

}  // namespace moshline::capture

#endif  // MOSHLINE_CAPTURE_CAPTURE_SCHEDULER_HPP_
