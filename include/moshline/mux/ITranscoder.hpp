// Repository: Moshline
// Component: Transcoder Interface
// Purpose: Explicitly stream-mapped mux of independently produced video and
//          audio into one container.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_MUX_ITRANSCODER_HPP_
#define MOSHLINE_MUX_ITRANSCODER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "moshline/timeline/MoshTypes.hpp"

namespace moshline::mux {

enum class StreamType : char {
  kVideo = 'v',
  kAudio = 'a',
};

// "input:type[:index]". Without an index the first stream of that type in
// the input is selected.
struct StreamSelector {
  int32_t input = 0;
  StreamType type = StreamType::kVideo;
  int32_t index = -1;

  std::string ToString() const;
};

struct MuxInvocation {
  // Input 0 is the video-only capture, input 1 the audio track.
  std::vector<const timeline::MediaBlob*> inputs;

  StreamSelector video_map;
  StreamSelector audio_map;

  std::string video_codec = "copy";
  std::string audio_codec = "aac";
  int64_t audio_bitrate = 128000;
  int32_t audio_sample_rate = 44100;
  int32_t audio_channels = 1;  // 0 keeps the input layout
  bool shortest = true;
  std::string container = "mp4";

  // ffmpeg-style argument vector, used for logging and tests.
  std::vector<std::string> ToArgs() const;
};

struct TranscodeResult {
  bool ok;
  std::string detail;
  timeline::MediaBlob output;

  static TranscodeResult Success(timeline::MediaBlob out) {
    return {true, "", std::move(out)};
  }
  static TranscodeResult Failure(std::string d) {
    return {false, std::move(d), {}};
  }
};

// Production: FFmpegTranscoder. Tests: ScriptedTranscoder.
class ITranscoder {
 public:
  virtual ~ITranscoder() = default;
  virtual TranscodeResult Exec(const MuxInvocation& invocation) = 0;
};

}  // namespace moshline::mux

#endif  // MOSHLINE_MUX_ITRANSCODER_HPP_
