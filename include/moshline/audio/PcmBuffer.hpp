// Repository: Moshline
// Component: PCM Buffer
// Purpose: Mono float sample buffer produced by the audio synthesizer.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_AUDIO_PCM_BUFFER_HPP_
#define MOSHLINE_AUDIO_PCM_BUFFER_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace moshline::audio {

// Mono, float samples nominally in [-1, 1].
struct PcmBuffer {
  int32_t sample_rate = 44100;
  std::vector<float> samples;

  PcmBuffer() = default;
  PcmBuffer(int32_t rate, size_t count) : sample_rate(rate), samples(count, 0.0f) {}

  size_t Size() const { return samples.size(); }
  bool Empty() const { return samples.empty(); }

  double DurationSeconds() const {
    return sample_rate > 0
               ? static_cast<double>(samples.size()) / static_cast<double>(sample_rate)
               : 0.0;
  }
};

}  // namespace moshline::audio

#endif  // MOSHLINE_AUDIO_PCM_BUFFER_HPP_
