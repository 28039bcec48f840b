// Repository: Moshline
// Component: Noise Generator
// Purpose: Seeded white, pink and brown noise plus sine tone generation
// Copyright (c) 2025 RetroVue

#include "moshline/audio/NoiseGenerator.hpp"

#include <cmath>

namespace moshline::audio {

namespace {
constexpr double kTwoPi = 6.283185307179586476925286766559;
}  // namespace

float PinkNoiseState::Next(float white) {
  b0 = 0.99886f * b0 + white * 0.0555179f;
  b1 = 0.99332f * b1 + white * 0.0750759f;
  b2 = 0.96900f * b2 + white * 0.1538520f;
  b3 = 0.86650f * b3 + white * 0.3104856f;
  b4 = 0.55000f * b4 + white * 0.5329522f;
  b5 = -0.7616f * b5 - white * 0.0168980f;
  const float out = (b0 + b1 + b2 + b3 + b4 + b5 + b6 + white * 0.5362f) * 0.11f;
  b6 = white * 0.115926f;
  return out;
}

float BrownNoiseState::Next(float white) {
  last = (last + 0.02f * white) / 1.02f;
  return last * 3.5f;
}

NoiseGenerator::NoiseGenerator(uint32_t seed)
    : rng_(seed), white_(-1.0f, 1.0f) {}

float NoiseGenerator::NextWhite() {
  return white_(rng_);
}

void NoiseGenerator::Fill(timeline::NoiseType type, float* out, size_t count) {
  switch (type) {
    case timeline::NoiseType::kWhite:
      for (size_t i = 0; i < count; ++i) out[i] = NextWhite();
      return;
    case timeline::NoiseType::kPink:
      for (size_t i = 0; i < count; ++i) out[i] = pink_.Next(NextWhite());
      return;
    case timeline::NoiseType::kBrown:
      for (size_t i = 0; i < count; ++i) out[i] = brown_.Next(NextWhite());
      return;
  }
}

void NoiseGenerator::ResetFilters() {
  pink_ = PinkNoiseState{};
  brown_ = BrownNoiseState{};
}

void FillSine(float frequency_hz, int32_t sample_rate, float* out, size_t count) {
  if (sample_rate <= 0) return;
  const double step = kTwoPi * static_cast<double>(frequency_hz) /
                      static_cast<double>(sample_rate);
  for (size_t n = 0; n < count; ++n) {
    out[n] = static_cast<float>(std::sin(step * static_cast<double>(n)));
  }
}

}  // namespace moshline::audio
