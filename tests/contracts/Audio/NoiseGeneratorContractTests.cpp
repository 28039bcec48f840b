// Repository: Moshline
// Component: Noise Generator Contract Tests
// Purpose: Pink, brown and sine output follow their recurrences sample for
//          sample; noise in a rendered track comes from the configured seed.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "fixtures/ChunkFactory.hpp"
#include "fixtures/FakeSampleSource.hpp"
#include "moshline/audio/AudioSynthesizer.hpp"
#include "moshline/audio/NoiseGenerator.hpp"

using namespace moshline::audio;
using moshline::testing::FakeSampleSource;
using moshline::testing::MakeSegment;
using moshline::timeline::AudioSpecVolume;
using moshline::timeline::NoiseSpec;
using moshline::timeline::NoiseType;
using moshline::timeline::Segment;

namespace {

constexpr uint32_t kSeed = 1234;
constexpr size_t kCount = 512;
constexpr double kPi = 3.14159265358979323846;

std::vector<float> WhiteStream(uint32_t seed, size_t count) {
  NoiseGenerator gen(seed);
  std::vector<float> white(count);
  for (auto& w : white) w = gen.NextWhite();
  return white;
}

std::vector<float> Generate(uint32_t seed, NoiseType type, size_t count) {
  NoiseGenerator gen(seed);
  std::vector<float> out(count);
  gen.Fill(type, out.data(), out.size());
  return out;
}

}  // namespace

// =============================================================================
// Recurrences
// =============================================================================

TEST(NoiseGeneratorContract, WhiteIsTheSeededUniformStream) {
  const auto white = WhiteStream(kSeed, kCount);
  const auto filled = Generate(kSeed, NoiseType::kWhite, kCount);
  EXPECT_EQ(filled, white);
  for (float w : white) {
    ASSERT_GE(w, -1.0f);
    ASSERT_LE(w, 1.0f);
  }
}

TEST(NoiseGeneratorContract, BrownFollowsLeakyIntegrator) {
  const auto white = WhiteStream(kSeed, kCount);
  const auto brown = Generate(kSeed, NoiseType::kBrown, kCount);

  double last = 0.0;
  for (size_t i = 0; i < kCount; ++i) {
    last = (last + 0.02 * white[i]) / 1.02;
    ASSERT_NEAR(brown[i], last * 3.5, 1e-5) << "sample " << i;
  }
}

TEST(NoiseGeneratorContract, PinkFollowsKelletFilter) {
  const auto white = WhiteStream(kSeed, kCount);
  const auto pink = Generate(kSeed, NoiseType::kPink, kCount);

  double b0 = 0, b1 = 0, b2 = 0, b3 = 0, b4 = 0, b5 = 0, b6 = 0;
  for (size_t i = 0; i < kCount; ++i) {
    const double w = white[i];
    b0 = 0.99886 * b0 + w * 0.0555179;
    b1 = 0.99332 * b1 + w * 0.0750759;
    b2 = 0.96900 * b2 + w * 0.1538520;
    b3 = 0.86650 * b3 + w * 0.3104856;
    b4 = 0.55000 * b4 + w * 0.5329522;
    b5 = -0.7616 * b5 - w * 0.0168980;
    const double expected = (b0 + b1 + b2 + b3 + b4 + b5 + b6 + w * 0.5362) * 0.11;
    b6 = w * 0.115926;
    ASSERT_NEAR(pink[i], expected, 1e-4) << "sample " << i;
  }
}

TEST(NoiseGeneratorContract, ResetFiltersClearsMemoryButNotTheStream) {
  NoiseGenerator gen(kSeed);
  std::vector<float> first(64);
  gen.Fill(NoiseType::kBrown, first.data(), first.size());
  gen.ResetFilters();
  std::vector<float> second(64);
  gen.Fill(NoiseType::kBrown, second.data(), second.size());

  // After the reset the filter restarts from zero on fresh white samples.
  const auto white = WhiteStream(kSeed, 128);
  EXPECT_NEAR(second[0], (0.02 * white[64] / 1.02) * 3.5, 1e-6);
  EXPECT_NE(first, second);
}

TEST(NoiseGeneratorContract, SineMatchesClosedForm) {
  constexpr float kHz = 440.0f;
  constexpr int32_t kRate = 44100;
  std::vector<float> out(4000);
  FillSine(kHz, kRate, out.data(), out.size());

  for (size_t n : {0u, 7u, 25u, 100u, 1234u, 3999u}) {
    const double expected = std::sin(2.0 * kPi * kHz * static_cast<double>(n) / kRate);
    EXPECT_NEAR(out[n], expected, 1e-6) << "n=" << n;
  }
  // Quarter period of 440 Hz at 44.1 kHz is 25.06 samples.
  EXPECT_GT(out[25], 0.9999f);
}

TEST(NoiseGeneratorContract, SineWithInvalidRateLeavesBufferUntouched) {
  std::vector<float> out(16, 0.25f);
  FillSine(440.0f, 0, out.data(), out.size());
  for (float s : out) EXPECT_EQ(s, 0.25f);
}

// =============================================================================
// Rendered track
// =============================================================================

TEST(NoiseGeneratorContract, RenderedBrownNoiseIsSeededStreamTimesGain) {
  FakeSampleSource samples;
  SynthesizerConfig config;
  config.noise_seed = kSeed;
  AudioSynthesizer synth(config, &samples);

  Segment seg = MakeSegment("a", 0, 2, 1);
  NoiseSpec spec;
  spec.noise_type = NoiseType::kBrown;
  spec.volume = 0.5f;
  seg.audio = spec;

  PcmBuffer pcm = synth.Synthesize({seg}, 0.8f);
  ASSERT_EQ(pcm.Size(), 2940u);

  const auto brown = Generate(kSeed, NoiseType::kBrown, pcm.Size());
  const float gain = AudioSpecVolume(seg.audio.value()) * 0.8f;
  for (size_t i = 0; i < pcm.Size(); ++i) {
    ASSERT_FLOAT_EQ(pcm.samples[i], brown[i] * gain) << "sample " << i;
  }
}
