// Repository: Moshline
// Component: FFmpeg Capture Sink
// Purpose: Encode the raster surface once per frame into an in-memory MP4.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_ENCODE_FFMPEG_CAPTURE_SINK_HPP_
#define MOSHLINE_ENCODE_FFMPEG_CAPTURE_SINK_HPP_

#include <cstdint>
#include <memory>
#include <string>

#include "moshline/capture/ICaptureSink.hpp"
#include "moshline/encode/MemoryAvio.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVStream;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace moshline::encode {

// EncoderConfig holds the video encoder settings for captures.
struct EncoderConfig {
  std::string codec_name = "libx264";
  std::string preset = "veryfast";
  int32_t crf = 18;
  int32_t gop_size = 250;
  std::string container = "mp4";
  std::string mime_type = "video/mp4";
};

// FFmpegCaptureSink encodes RGBA surfaces with libx264 (YUV420P, no
// B-frames) and muxes them into a container held in memory. Output
// dimensions are the settings rounded down to even values.
//
// Thread Safety:
// - Not thread-safe: Use from the capture thread only
class FFmpegCaptureSink : public capture::ICaptureSink {
 public:
  explicit FFmpegCaptureSink(EncoderConfig config = EncoderConfig());
  ~FFmpegCaptureSink() override;

  FFmpegCaptureSink(const FFmpegCaptureSink&) = delete;
  FFmpegCaptureSink& operator=(const FFmpegCaptureSink&) = delete;

  bool Start(const timeline::Settings& settings, timeline::RationalFps fps) override;
  bool CaptureFrame(const capture::RasterSurface& surface, int64_t frame_index) override;
  bool Finish(timeline::MediaBlob& out) override;
  void Abort() override;
  std::string LastError() const override { return last_error_; }

 private:
  bool Fail(const std::string& message);
  bool WritePendingPackets();
  void Close();

  EncoderConfig config_;
  std::unique_ptr<MemoryOutput> output_;
  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVStream* stream_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;
  bool header_written_ = false;
  int64_t frames_encoded_ = 0;
  std::string last_error_;
};

}  // namespace moshline::encode

#endif  // MOSHLINE_ENCODE_FFMPEG_CAPTURE_SINK_HPP_
