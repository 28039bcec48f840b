// Repository: Moshline
// Component: Muxer Adapter
// Purpose: Combine the video-only capture and the synthesized audio track,
//          retrying once with an alternate explicit stream map.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_MUX_MUXER_ADAPTER_HPP_
#define MOSHLINE_MUX_MUXER_ADAPTER_HPP_

#include <cstdint>
#include <string>

#include "moshline/mux/ITranscoder.hpp"
#include "moshline/timeline/MoshTypes.hpp"

namespace moshline::mux {

struct MuxConfig {
  std::string video_codec = "copy";
  std::string audio_codec = "aac";
  int64_t audio_bitrate = 128000;
  int32_t audio_sample_rate = 44100;
  int32_t audio_channels = 1;
  std::string container = "mp4";
  std::string output_mime_type = "video/mp4";
};

struct MuxResult {
  bool ok;
  timeline::RenderError error;
  std::string detail;
  timeline::MediaBlob output;
  int32_t attempts;

  static MuxResult Success(timeline::MediaBlob out, int32_t n) {
    return {true, timeline::RenderError::kNone, "", std::move(out), n};
  }
  static MuxResult Failure(std::string d, int32_t n) {
    return {false, timeline::RenderError::kMuxError, std::move(d), {}, n};
  }
};

class MuxerAdapter {
 public:
  MuxerAdapter(MuxConfig config, ITranscoder& transcoder);

  // Primary: 0:v:0 + 1:a:0 with forced rate and channels.
  // Alternate: 0:v + 1:a, input channel layout kept.
  // Both failing is kMuxError; a video-only result is never returned.
  MuxResult Mux(const timeline::MediaBlob& video, const timeline::MediaBlob& audio);

  MuxInvocation PrimaryInvocation(const timeline::MediaBlob& video,
                                  const timeline::MediaBlob& audio) const;
  MuxInvocation AlternateInvocation(const timeline::MediaBlob& video,
                                    const timeline::MediaBlob& audio) const;

 private:
  MuxConfig config_;
  ITranscoder& transcoder_;
};

}  // namespace moshline::mux

#endif  // MOSHLINE_MUX_MUXER_ADAPTER_HPP_
