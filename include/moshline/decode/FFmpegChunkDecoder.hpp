// Repository: Moshline
// Component: FFmpeg Chunk Decoder
// Purpose: libavcodec decode of individual encoded chunks to RGBA frames.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_DECODE_FFMPEG_CHUNK_DECODER_HPP_
#define MOSHLINE_DECODE_FFMPEG_CHUNK_DECODER_HPP_

#include <cstdint>
#include <deque>
#include <memory>
#include <string>

#include "moshline/capture/IFrameDecoder.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace moshline::decode {

// FFmpegChunkDecoder feeds chunks to one long-lived codec context.
//
// Reference state is never reset between chunks, so delta chunks following
// a foreign key frame predict from whatever picture the decoder holds. The
// decoder is opened with corrupt-frame output enabled for that reason.
//
// A chunk yields at most one frame per Decode(). Pictures the codec releases
// early are queued and handed out by later calls in decode order.
//
// Thread Safety:
// - Not thread-safe: Use from the capture thread only
//
// Supported codec strings: avc1/avc3 (H.264), hvc1/hev1 (HEVC), vp08, vp09,
// av01. Anything else fails Configure().
class FFmpegChunkDecoder : public capture::IFrameDecoder {
 public:
  FFmpegChunkDecoder();
  ~FFmpegChunkDecoder() override;

  FFmpegChunkDecoder(const FFmpegChunkDecoder&) = delete;
  FFmpegChunkDecoder& operator=(const FFmpegChunkDecoder&) = delete;

  bool Configure(const timeline::DecoderConfig& config) override;
  void SetOutputSize(int32_t width, int32_t height) override;
  capture::DecodeOutput Decode(const timeline::EncodedChunk& chunk) override;
  void Reset() override;

  uint64_t frames_decoded() const { return frames_decoded_; }

 private:
  int DrainFrames();
  bool TakeFrame();
  bool ConvertFrame(capture::RasterFrame& out);

  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;

  // Pictures drained while resending a refused packet, oldest first.
  std::deque<std::unique_ptr<capture::RasterFrame>> pending_;

  int32_t output_width_ = 0;
  int32_t output_height_ = 0;
  uint64_t frames_decoded_ = 0;
};

// Maps a WebCodecs-style codec string ("avc1.64001f") to an AVCodecID value.
// Returns 0 (AV_CODEC_ID_NONE) when unsupported.
int CodecIdFromString(const std::string& codec);

}  // namespace moshline::decode

#endif  // MOSHLINE_DECODE_FFMPEG_CHUNK_DECODER_HPP_
