// Repository: Moshline
// Component: Gain Stage
// Purpose: Constant gain on float audio and float -> S16 conversion
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_AUDIO_GAIN_STAGE_HPP_
#define MOSHLINE_AUDIO_GAIN_STAGE_HPP_

#include <cstddef>
#include <cstdint>

namespace moshline::audio {

// Multiply every sample by `linear_gain`. Unity gain is a no-op.
inline void ApplyGain(float* samples, size_t count, float linear_gain) {
  if (linear_gain == 1.0f) return;
  for (size_t i = 0; i < count; ++i) {
    samples[i] *= linear_gain;
  }
}

// Clamp to [-1, 1] and scale by 0x7FFF. No wraparound.
inline int16_t FloatToS16(float sample) {
  if (sample > 1.0f) sample = 1.0f;
  else if (sample < -1.0f) sample = -1.0f;
  return static_cast<int16_t>(sample * 32767.0f);
}

}  // namespace moshline::audio

#endif  // MOSHLINE_AUDIO_GAIN_STAGE_HPP_
