// Repository: Moshline
// Component: WAV Encoder
// Purpose: Serialize mono float PCM to a 16-bit RIFF/WAVE blob for muxing.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_AUDIO_WAV_ENCODER_HPP_
#define MOSHLINE_AUDIO_WAV_ENCODER_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "moshline/audio/PcmBuffer.hpp"
#include "moshline/timeline/MoshTypes.hpp"

namespace moshline::audio {

inline constexpr size_t kWavHeaderBytes = 44;
inline constexpr const char* kWavMimeType = "audio/wav";

// 44-byte header followed by S16LE mono samples, each clamped to [-1, 1].
std::vector<uint8_t> EncodeWav(const PcmBuffer& pcm);

timeline::MediaBlob EncodeWavBlob(const PcmBuffer& pcm);

// All-zero WAV of round(seconds * sample_rate) samples.
timeline::MediaBlob MakeSilentWav(double seconds, int32_t sample_rate);

}  // namespace moshline::audio

#endif  // MOSHLINE_AUDIO_WAV_ENCODER_HPP_
