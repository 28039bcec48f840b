// Repository: Moshline
// Component: WAV Encoder
// Purpose: Serialize mono float PCM to a 16-bit RIFF/WAVE blob for muxing.
// Copyright (c) 2025 RetroVue

#include "moshline/audio/WavEncoder.hpp"

#include <algorithm>
#include <cmath>

#include "moshline/audio/GainStage.hpp"

namespace moshline::audio {

namespace {

void PutTag(std::vector<uint8_t>& out, const char* tag) {
  out.insert(out.end(), tag, tag + 4);
}

void PutU16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void PutU32(std::vector<uint8_t>& out, uint32_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

constexpr uint16_t kChannels = 1;
constexpr uint16_t kBitsPerSample = 16;
constexpr uint16_t kBlockAlign = kChannels * kBitsPerSample / 8;

}  // namespace

std::vector<uint8_t> EncodeWav(const PcmBuffer& pcm) {
  const auto data_bytes = static_cast<uint32_t>(pcm.Size() * kBlockAlign);
  const auto rate = static_cast<uint32_t>(pcm.sample_rate);

  std::vector<uint8_t> out;
  out.reserve(kWavHeaderBytes + data_bytes);

  PutTag(out, "RIFF");
  PutU32(out, 36 + data_bytes);
  PutTag(out, "WAVE");
  PutTag(out, "fmt ");
  PutU32(out, 16);              // fmt chunk size
  PutU16(out, 1);               // PCM
  PutU16(out, kChannels);
  PutU32(out, rate);
  PutU32(out, rate * kBlockAlign);
  PutU16(out, kBlockAlign);
  PutU16(out, kBitsPerSample);
  PutTag(out, "data");
  PutU32(out, data_bytes);

  for (float s : pcm.samples) {
    PutU16(out, static_cast<uint16_t>(FloatToS16(s)));
  }
  return out;
}

timeline::MediaBlob EncodeWavBlob(const PcmBuffer& pcm) {
  timeline::MediaBlob blob;
  blob.mime_type = kWavMimeType;
  blob.bytes = EncodeWav(pcm);
  return blob;
}

timeline::MediaBlob MakeSilentWav(double seconds, int32_t sample_rate) {
  const auto count = static_cast<size_t>(
      std::llround(static_cast<double>(sample_rate) * std::max(0.0, seconds)));
  return EncodeWavBlob(PcmBuffer(sample_rate, count));
}

}  // namespace moshline::audio
