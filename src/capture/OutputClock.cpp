// Repository: Moshline
// Component: Output Clock
// Purpose: Frame-indexed capture clock for the CaptureScheduler
// Copyright (c) 2025 RetroVue

#include "moshline/capture/OutputClock.hpp"

#include <cmath>

namespace moshline::capture {

static constexpr int64_t kNanosPerSecond = 1'000'000'000;

OutputClock::OutputClock(timeline::RationalFps fps, std::unique_ptr<IWaitStrategy> wait)
    : fps_(fps.IsValid() ? fps : timeline::FPS_30),
      wait_(wait ? std::move(wait) : std::make_unique<RealtimeWaitStrategy>()),
      ns_per_frame_whole_((kNanosPerSecond * fps_.den) / fps_.num),
      ns_per_frame_rem_((kNanosPerSecond * fps_.den) % fps_.num) {}

void OutputClock::Start() {
  start_ = std::chrono::steady_clock::now();
}

int64_t OutputClock::FrameDurationMs() const {
  return static_cast<int64_t>(std::round(
      1000.0 * static_cast<double>(fps_.den) / static_cast<double>(fps_.num)));
}

std::chrono::nanoseconds OutputClock::DeadlineOffsetNs(int64_t frame_index) const {
  const int64_t whole_ns = frame_index * ns_per_frame_whole_;
  const int64_t rem_ns = (frame_index * ns_per_frame_rem_) / fps_.num;
  return std::chrono::nanoseconds(whole_ns + rem_ns);
}

std::chrono::steady_clock::time_point OutputClock::DeadlineFor(int64_t frame_index) const {
  return start_ + DeadlineOffsetNs(frame_index);
}

std::chrono::steady_clock::time_point OutputClock::WaitForFrame(int64_t frame_index) {
  wait_->WaitUntil(DeadlineFor(frame_index));
  return std::chrono::steady_clock::now();
}

}  // namespace moshline::capture
