// Repository: Moshline
// Component: Audio Synthesizer
// Purpose: Build one sample-accurate mono track from a clamped segment list.
// Copyright (c) 2025 RetroVue
//
// Track length and every repeat boundary come from
// RationalFps::SamplesFromFrames over the same frame counts the expander
// uses, so audio and video durations cannot drift apart.

#ifndef MOSHLINE_AUDIO_AUDIO_SYNTHESIZER_HPP_
#define MOSHLINE_AUDIO_AUDIO_SYNTHESIZER_HPP_

#include <cstdint>
#include <vector>

#include "moshline/audio/ISampleSource.hpp"
#include "moshline/audio/PcmBuffer.hpp"
#include "moshline/timeline/MoshTypes.hpp"
#include "moshline/timeline/RationalFps.hpp"

namespace moshline::audio {

// How noise filter state behaves across the repeats of one segment.
enum class NoiseContinuity {
  // One single-play buffer per segment, filters reset, copied per repeat.
  kRestartEachPlay,
  // Each repeat generated in place; filter state and noise stream carry over.
  kContinuousAcrossRepeats,
};

const char* NoiseContinuityName(NoiseContinuity c);

struct SynthesizerConfig {
  int32_t sample_rate = 44100;
  timeline::RationalFps fps = timeline::FPS_30;
  NoiseContinuity noise_continuity = NoiseContinuity::kRestartEachPlay;
  uint32_t noise_seed = 0x6d6f7368;
  double placeholder_seconds = 1.0;
};

class AudioSynthesizer {
 public:
  // `sample_source` may be null; Sample segments then render as silence.
  AudioSynthesizer(SynthesizerConfig config, ISampleSource* sample_source);

  // Segments must already be clamped (ResolveSegments).
  // No AudioSpec anywhere (or zero duration) -> silent placeholder of
  // placeholder_seconds, independent of the timeline length.
  PcmBuffer Synthesize(const std::vector<timeline::Segment>& segments,
                       float global_volume);

  // Full-track sample count for the clamped segments.
  int64_t TrackSampleCount(const std::vector<timeline::Segment>& segments) const;

  // Single-play sample count for a segment of `frames` frames.
  int64_t SinglePlaySamples(int64_t frames) const;

  static bool HasAudio(const std::vector<timeline::Segment>& segments);

  const SynthesizerConfig& config() const { return config_; }

 private:
  PcmBuffer MakePlaceholder() const;

  SynthesizerConfig config_;
  ISampleSource* sample_source_;
};

}  // namespace moshline::audio

#endif  // MOSHLINE_AUDIO_AUDIO_SYNTHESIZER_HPP_
