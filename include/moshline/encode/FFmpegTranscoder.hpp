// Repository: Moshline
// Component: FFmpeg Transcoder
// Purpose: In-memory stream-mapped mux: copy the selected video stream,
//          encode the selected audio stream to AAC.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_ENCODE_FFMPEG_TRANSCODER_HPP_
#define MOSHLINE_ENCODE_FFMPEG_TRANSCODER_HPP_

#include "moshline/mux/ITranscoder.hpp"

namespace moshline::encode {

// FFmpegTranscoder executes one MuxInvocation per call.
//
// - Video: stream copy only ("copy"); other video codecs are rejected
// - Audio: decoded, resampled to the requested rate and channel count
//   (0 keeps the input layout) and encoded with the named encoder
// - shortest: output stops at the end of the shorter mapped stream
//
// Each call owns its demuxers and muxer; concurrent calls are independent.
class FFmpegTranscoder : public mux::ITranscoder {
 public:
  FFmpegTranscoder() = default;

  mux::TranscodeResult Exec(const mux::MuxInvocation& invocation) override;
};

}  // namespace moshline::encode

#endif  // MOSHLINE_ENCODE_FFMPEG_TRANSCODER_HPP_
