// Repository: Moshline
// Component: Sample Source Interface
// Purpose: Fetch and decode a Sample audio resource to mono float PCM.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_AUDIO_ISAMPLE_SOURCE_HPP_
#define MOSHLINE_AUDIO_ISAMPLE_SOURCE_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace moshline::audio {

struct SampleLoadResult {
  bool ok;
  std::string detail;          // Failure reason
  std::vector<float> samples;  // Mono, at the requested rate

  static SampleLoadResult Success(std::vector<float> s) {
    return {true, "", std::move(s)};
  }
  static SampleLoadResult Failure(std::string d) {
    return {false, std::move(d), {}};
  }
};

// Production: FFmpegSampleSource. Tests: FakeSampleSource.
class ISampleSource {
 public:
  virtual ~ISampleSource() = default;

  // Decode `url` to mono float at `sample_rate`. Failures are reported in
  // the result; the synthesizer substitutes silence.
  virtual SampleLoadResult Load(const std::string& url, int32_t sample_rate) = 0;
};

}  // namespace moshline::audio

#endif  // MOSHLINE_AUDIO_ISAMPLE_SOURCE_HPP_
