// Repository: Moshline
// Component: Noise Generator
// Purpose: Seeded white, pink and brown noise plus sine tone generation
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_AUDIO_NOISE_GENERATOR_HPP_
#define MOSHLINE_AUDIO_NOISE_GENERATOR_HPP_

#include <cstddef>
#include <cstdint>
#include <random>

#include "moshline/timeline/MoshTypes.hpp"

namespace moshline::audio {

// Paul Kellet's six-pole approximation of a 1/f spectrum.
struct PinkNoiseState {
  float b0 = 0.0f;
  float b1 = 0.0f;
  float b2 = 0.0f;
  float b3 = 0.0f;
  float b4 = 0.0f;
  float b5 = 0.0f;
  float b6 = 0.0f;

  float Next(float white);
};

// Leaky integrator: y = (y + 0.02 x) / 1.02, output scaled by 3.5.
struct BrownNoiseState {
  float last = 0.0f;

  float Next(float white);
};

// Seeded noise source. Filter state persists across Fill() calls until
// ResetFilters(); the white noise stream is never rewound.
class NoiseGenerator {
 public:
  explicit NoiseGenerator(uint32_t seed);

  // Uniform in [-1, 1].
  float NextWhite();

  void Fill(timeline::NoiseType type, float* out, size_t count);

  // Clear pink and brown filter memory.
  void ResetFilters();

 private:
  std::mt19937 rng_;
  std::uniform_real_distribution<float> white_;
  PinkNoiseState pink_;
  BrownNoiseState brown_;
};

// out[n] = sin(2 pi f n / sample_rate) for n in [0, count).
void FillSine(float frequency_hz, int32_t sample_rate, float* out, size_t count);

}  // namespace moshline::audio

#endif  // MOSHLINE_AUDIO_NOISE_GENERATOR_HPP_
