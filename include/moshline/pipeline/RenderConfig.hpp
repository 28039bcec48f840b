// Repository: Moshline
// Component: Render Configuration
// Purpose: Tunables for one RenderPipeline, with the defaults used by the
//          standalone renderer.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_PIPELINE_RENDER_CONFIG_HPP_
#define MOSHLINE_PIPELINE_RENDER_CONFIG_HPP_

#include <cstddef>
#include <cstdint>

#include "moshline/audio/AudioSynthesizer.hpp"
#include "moshline/capture/CaptureScheduler.hpp"
#include "moshline/mux/MuxerAdapter.hpp"
#include "moshline/timeline/RationalFps.hpp"

namespace moshline::pipeline {

struct RenderConfig {
  timeline::RationalFps fps = timeline::FPS_30;
  int32_t sample_rate = 44100;

  // Capture reports progress every K frames inside [0, capture_progress_share].
  int32_t progress_every = 10;
  double capture_progress_share = 0.7;
  int32_t flush_frames = 2;

  // Whole-item deadline (expand -> synthesize -> capture -> mux).
  // <= 0 disables the deadline.
  int64_t render_timeout_ms = 10 * 60 * 1000;

  size_t output_queue_capacity = 8;
  size_t journal_capacity = 1000;
  int32_t max_concurrent_decodes = 2;

  audio::NoiseContinuity noise_continuity = audio::NoiseContinuity::kRestartEachPlay;
  uint32_t noise_seed = 0x6d6f7368;
  double placeholder_seconds = 1.0;

  // Timelines without any audio segment are delivered video-only unless
  // this is set, in which case a full-length silent track is muxed in.
  bool include_silent_audio = false;

  mux::MuxConfig mux;

  audio::SynthesizerConfig ToSynthesizerConfig() const {
    audio::SynthesizerConfig c;
    c.sample_rate = sample_rate;
    c.fps = fps;
    c.noise_continuity = noise_continuity;
    c.noise_seed = noise_seed;
    c.placeholder_seconds = placeholder_seconds;
    return c;
  }

  capture::CaptureConfig ToCaptureConfig() const {
    capture::CaptureConfig c;
    c.progress_every = progress_every;
    c.flush_frames = flush_frames;
    return c;
  }

  mux::MuxConfig ToMuxConfig() const {
    mux::MuxConfig c = mux;
    c.audio_sample_rate = sample_rate;
    return c;
  }
};

}  // namespace moshline::pipeline

#endif  // MOSHLINE_PIPELINE_RENDER_CONFIG_HPP_
