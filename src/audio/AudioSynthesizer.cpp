// Repository: Moshline
// Component: Audio Synthesizer
// Purpose: Build one sample-accurate mono track from a clamped segment list.
// Copyright (c) 2025 RetroVue

#include "moshline/audio/AudioSynthesizer.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>

#include "moshline/audio/GainStage.hpp"
#include "moshline/audio/NoiseGenerator.hpp"
#include "moshline/util/Logger.hpp"

namespace moshline::audio {

namespace {

using timeline::AudioSpec;
using timeline::NoiseSpec;
using timeline::SampleSpec;
using timeline::Segment;
using timeline::SineSpec;
using util::Logger;

constexpr float kDefaultSineHz = 440.0f;

// Per-call cache so each URL is fetched once per Synthesize().
using SampleCache = std::map<std::string, SampleLoadResult>;

}  // namespace

const char* NoiseContinuityName(NoiseContinuity c) {
  switch (c) {
    case NoiseContinuity::kRestartEachPlay:         return "restart";
    case NoiseContinuity::kContinuousAcrossRepeats: return "continuous";
  }
  return "unknown";
}

AudioSynthesizer::AudioSynthesizer(SynthesizerConfig config, ISampleSource* sample_source)
    : config_(config), sample_source_(sample_source) {}

bool AudioSynthesizer::HasAudio(const std::vector<Segment>& segments) {
  return std::any_of(segments.begin(), segments.end(),
                     [](const Segment& s) { return s.audio.has_value(); });
}

int64_t AudioSynthesizer::SinglePlaySamples(int64_t frames) const {
  return config_.fps.SamplesFromFrames(frames, config_.sample_rate);
}

int64_t AudioSynthesizer::TrackSampleCount(const std::vector<Segment>& segments) const {
  int64_t frames = 0;
  for (const auto& seg : segments) {
    frames += seg.TotalFrames();
  }
  return config_.fps.SamplesFromFrames(frames, config_.sample_rate);
}

PcmBuffer AudioSynthesizer::MakePlaceholder() const {
  const auto count = static_cast<size_t>(
      std::llround(static_cast<double>(config_.sample_rate) * config_.placeholder_seconds));
  return PcmBuffer(config_.sample_rate, count);
}

PcmBuffer AudioSynthesizer::Synthesize(const std::vector<Segment>& segments,
                                       float global_volume) {
  if (!HasAudio(segments)) {
    Logger::Debug("[AudioSynthesizer] No audio segments, returning silent placeholder");
    return MakePlaceholder();
  }

  const int64_t total_samples = TrackSampleCount(segments);
  if (total_samples <= 0) {
    Logger::Debug("[AudioSynthesizer] Zero-length timeline, returning silent placeholder");
    return MakePlaceholder();
  }

  PcmBuffer track(config_.sample_rate, static_cast<size_t>(total_samples));
  NoiseGenerator noise(config_.noise_seed);
  SampleCache samples;

  int64_t frames_before = 0;
  int32_t audio_segments = 0;

  for (size_t seg_index = 0; seg_index < segments.size(); ++seg_index) {
    const Segment& seg = segments[seg_index];
    const int64_t frames = seg.SinglePlayFrames();

    if (!seg.audio.has_value() || frames == 0 || seg.repeat == 0) {
      frames_before += seg.TotalFrames();
      continue;
    }
    ++audio_segments;

    const AudioSpec& spec = *seg.audio;
    const float gain = timeline::AudioSpecVolume(spec) * global_volume;
    const auto single_len = static_cast<size_t>(SinglePlaySamples(frames));

    // Repeat k occupies [SamplesFromFrames(before + k*frames),
    // SamplesFromFrames(before + (k+1)*frames)); the slot may differ from
    // single_len by one sample when the rate is not a frame multiple.
    auto slot_start = [&](uint32_t k) {
      return static_cast<size_t>(config_.fps.SamplesFromFrames(
          frames_before + static_cast<int64_t>(k) * frames, config_.sample_rate));
    };

    const auto* noise_spec = std::get_if<NoiseSpec>(&spec);
    const bool continuous_noise =
        noise_spec != nullptr &&
        config_.noise_continuity == NoiseContinuity::kContinuousAcrossRepeats;

    if (continuous_noise) {
      noise.ResetFilters();
      for (uint32_t k = 0; k < seg.repeat; ++k) {
        const size_t start = slot_start(k);
        const size_t end = std::min(slot_start(k + 1), track.Size());
        if (start >= end) continue;
        float* dst = track.samples.data() + start;
        noise.Fill(noise_spec->noise_type, dst, end - start);
        ApplyGain(dst, end - start, gain);
      }
      frames_before += seg.TotalFrames();
      continue;
    }

    std::vector<float> single(single_len, 0.0f);

    std::visit(
        [&](const auto& s) {
          using T = std::decay_t<decltype(s)>;
          if constexpr (std::is_same_v<T, NoiseSpec>) {
            noise.ResetFilters();
            noise.Fill(s.noise_type, single.data(), single.size());
          } else if constexpr (std::is_same_v<T, SineSpec>) {
            const float hz = s.frequency_hz > 0.0f ? s.frequency_hz : kDefaultSineHz;
            FillSine(hz, config_.sample_rate, single.data(), single.size());
          } else {
            auto it = samples.find(s.url);
            if (it == samples.end()) {
              SampleLoadResult loaded =
                  s.url.empty()
                      ? SampleLoadResult::Failure("empty sample url")
                  : sample_source_ == nullptr
                      ? SampleLoadResult::Failure("no sample source configured")
                      : sample_source_->Load(s.url, config_.sample_rate);
              it = samples.emplace(s.url, std::move(loaded)).first;
            }
            const SampleLoadResult& loaded = it->second;
            if (!loaded.ok) {
              std::ostringstream oss;
              oss << "[AudioSynthesizer] Sample '" << s.url << "' unavailable for segment "
                  << seg_index << " (" << loaded.detail << "), using silence";
              Logger::Warn(oss.str());
              return;
            }
            // Play once from the start; shorter samples leave silence.
            const size_t copy_len = std::min(loaded.samples.size(), single.size());
            std::copy_n(loaded.samples.begin(), copy_len, single.begin());
          }
        },
        spec);

    ApplyGain(single.data(), single.size(), gain);

    for (uint32_t k = 0; k < seg.repeat; ++k) {
      const size_t start = slot_start(k);
      const size_t end = std::min(slot_start(k + 1), track.Size());
      if (start >= end) continue;
      const size_t copy_len = std::min(single.size(), end - start);
      std::copy_n(single.begin(), copy_len, track.samples.begin() + static_cast<std::ptrdiff_t>(start));
    }

    frames_before += seg.TotalFrames();
  }

  std::ostringstream oss;
  oss << "[AudioSynthesizer] Synthesized " << track.Size() << " samples ("
      << track.DurationSeconds() << "s @ " << config_.sample_rate << " Hz) from "
      << audio_segments << " audio segments, noise="
      << NoiseContinuityName(config_.noise_continuity);
  Logger::Info(oss.str());

  return track;
}

}  // namespace moshline::audio
