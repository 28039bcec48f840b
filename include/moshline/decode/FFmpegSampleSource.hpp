// Repository: Moshline
// Component: FFmpeg Sample Source
// Purpose: Decode Sample audio resources to mono float PCM.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_DECODE_FFMPEG_SAMPLE_SOURCE_HPP_
#define MOSHLINE_DECODE_FFMPEG_SAMPLE_SOURCE_HPP_

#include <string>

#include "moshline/audio/ISampleSource.hpp"

namespace moshline::decode {

// Opens `url` with libavformat (local path or any protocol FFmpeg was built
// with), decodes the best audio stream and resamples to mono float.
class FFmpegSampleSource : public audio::ISampleSource {
 public:
  FFmpegSampleSource() = default;

  audio::SampleLoadResult Load(const std::string& url, int32_t sample_rate) override;
};

}  // namespace moshline::decode

#endif  // MOSHLINE_DECODE_FFMPEG_SAMPLE_SOURCE_HPP_
