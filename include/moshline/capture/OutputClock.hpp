// Repository: Moshline
// Component: Output Clock
// Purpose: Frame-indexed capture clock for the CaptureScheduler
// Copyright (c) 2025 RetroVue
//
// OutputClock paces the capture loop by sleeping to absolute deadlines
// derived from the frame index, so per-frame processing overhead never
// accumulates into drift. Waiting for frame N after frame N-1 is the same as
// advancing nextFrameTime by one frame period and sleeping max(0, next - now).

#ifndef MOSHLINE_CAPTURE_OUTPUT_CLOCK_HPP_
#define MOSHLINE_CAPTURE_OUTPUT_CLOCK_HPP_

#include <chrono>
#include <cstdint>
#include <memory>

#include "moshline/capture/IWaitStrategy.hpp"
#include "moshline/timeline/RationalFps.hpp"

namespace moshline::capture {

class OutputClock {
 public:
  // Null `wait` selects RealtimeWaitStrategy.
  OutputClock(timeline::RationalFps fps, std::unique_ptr<IWaitStrategy> wait);

  // Record start time. Call before WaitForFrame() or DeadlineFor().
  void Start();

  // Frame duration in milliseconds (rounded, e.g. 33 for 30 fps).
  // Diagnostics only.
  int64_t FrameDurationMs() const;

  // Sleep until the absolute deadline for frame N.
  // Returns the steady clock time after waking.
  std::chrono::steady_clock::time_point WaitForFrame(int64_t frame_index);

  // Absolute deadline for frame N. Pure arithmetic.
  std::chrono::steady_clock::time_point DeadlineFor(int64_t frame_index) const;

  // Exact nanosecond offset for frame N from start:
  //   N * ns_per_frame_whole_ + (N * ns_per_frame_rem_) / fps_num
  std::chrono::nanoseconds DeadlineOffsetNs(int64_t frame_index) const;

  std::chrono::steady_clock::time_point StartTime() const { return start_; }

  timeline::RationalFps fps() const { return fps_; }

 private:
  timeline::RationalFps fps_;
  std::unique_ptr<IWaitStrategy> wait_;

  // Frame period = (1e9 * den) / num ns, split to avoid floating point.
  int64_t ns_per_frame_whole_;
  int64_t ns_per_frame_rem_;

  std::chrono::steady_clock::time_point start_;
};

}  // namespace moshline::capture

#endif  // MOSHLINE_CAPTURE_OUTPUT_CLOCK_HPP_
