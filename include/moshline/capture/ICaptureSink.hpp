// Repository: Moshline
// Component: Capture Sink Interface
// Purpose: Samples the raster surface once per frame and produces the
//          compressed video-only blob.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_CAPTURE_ICAPTURE_SINK_HPP_
#define MOSHLINE_CAPTURE_ICAPTURE_SINK_HPP_

#include <cstdint>
#include <string>

#include "moshline/capture/RasterSurface.hpp"
#include "moshline/timeline/MoshTypes.hpp"
#include "moshline/timeline/RationalFps.hpp"

namespace moshline::capture {

// Production: FFmpegCaptureSink. Tests: RecordingCaptureSink.
//
// Lifecycle:
// 1. Start() once per render
// 2. CaptureFrame() for frame indices 0..N-1 in order
// 3. Finish() yields the blob, or Abort() discards partial output
class ICaptureSink {
 public:
  virtual ~ICaptureSink() = default;

  virtual bool Start(const timeline::Settings& settings, timeline::RationalFps fps) = 0;

  virtual bool CaptureFrame(const RasterSurface& surface, int64_t frame_index) = 0;

  virtual bool Finish(timeline::MediaBlob& out) = 0;

  virtual void Abort() = 0;

  // Human-readable reason for the last false return.
  virtual std::string LastError() const = 0;
};

}  // namespace moshline::capture

#endif  // MOSHLINE_CAPTURE_ICAPTURE_SINK_HPP_
