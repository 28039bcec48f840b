// Repository: Moshline
// Component: FFmpeg Capture Sink
// Purpose: Encode the raster surface once per frame into an in-memory MP4.
// Copyright (c) 2025 RetroVue

#include "moshline/encode/FFmpegCaptureSink.hpp"

#include <sstream>

#include "moshline/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
#include <libswscale/swscale.h>
}

namespace moshline::encode {

using util::Logger;

FFmpegCaptureSink::FFmpegCaptureSink(EncoderConfig config) : config_(std::move(config)) {}

FFmpegCaptureSink::~FFmpegCaptureSink() { Close(); }

bool FFmpegCaptureSink::Fail(const std::string& message) {
  last_error_ = message;
  Logger::Error("[FFmpegCaptureSink] " + message);
  Close();
  return false;
}

bool FFmpegCaptureSink::Start(const timeline::Settings& settings, timeline::RationalFps fps) {
  Close();
  last_error_.clear();
  frames_encoded_ = 0;

  // YUV420P needs even dimensions.
  const int width = settings.width & ~1;
  const int height = settings.height & ~1;
  if (width < 2 || height < 2) {
    return Fail("output size too small");
  }
  if (!fps.IsValid()) {
    return Fail("invalid frame rate");
  }

  av_log_set_level(AV_LOG_ERROR);

  const AVCodec* codec = avcodec_find_encoder_by_name(config_.codec_name.c_str());
  if (!codec) {
    return Fail(config_.codec_name + " not found");
  }

  int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, config_.container.c_str(),
                                           nullptr);
  if (ret < 0 || !format_ctx_) {
    return Fail("Failed to allocate output context: " + AvErrorString(ret));
  }

  output_ = std::make_unique<MemoryOutput>();
  if (!output_->Open()) {
    return Fail("Failed to allocate AVIO context");
  }
  format_ctx_->pb = output_->context();
  format_ctx_->flags |= AVFMT_FLAG_CUSTOM_IO;

  stream_ = avformat_new_stream(format_ctx_, codec);
  if (!stream_) {
    return Fail("Failed to create video stream");
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    return Fail("Failed to allocate codec context");
  }
  codec_ctx_->width = width;
  codec_ctx_->height = height;
  codec_ctx_->pix_fmt = AV_PIX_FMT_YUV420P;
  codec_ctx_->time_base = AVRational{static_cast<int>(fps.den), static_cast<int>(fps.num)};
  codec_ctx_->framerate = AVRational{static_cast<int>(fps.num), static_cast<int>(fps.den)};
  codec_ctx_->gop_size = config_.gop_size;
  codec_ctx_->max_b_frames = 0;
  if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
    codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  }

  AVDictionary* opts = nullptr;
  av_dict_set(&opts, "preset", config_.preset.c_str(), 0);
  av_dict_set(&opts, "crf", std::to_string(config_.crf).c_str(), 0);
  ret = avcodec_open2(codec_ctx_, codec, &opts);
  av_dict_free(&opts);
  if (ret < 0) {
    return Fail("Failed to open codec: " + AvErrorString(ret));
  }

  // After open so extradata (SPS/PPS) reaches the container.
  ret = avcodec_parameters_from_context(stream_->codecpar, codec_ctx_);
  if (ret < 0) {
    return Fail("Failed to copy codec parameters: " + AvErrorString(ret));
  }
  stream_->time_base = codec_ctx_->time_base;

  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) {
    return Fail("Failed to allocate frame/packet");
  }
  frame_->format = AV_PIX_FMT_YUV420P;
  frame_->width = width;
  frame_->height = height;
  ret = av_frame_get_buffer(frame_, 0);
  if (ret < 0) {
    return Fail("Failed to allocate frame buffer: " + AvErrorString(ret));
  }

  ret = avformat_write_header(format_ctx_, nullptr);
  if (ret < 0) {
    return Fail("Failed to write header: " + AvErrorString(ret));
  }
  header_written_ = true;

  std::ostringstream oss;
  oss << "[FFmpegCaptureSink] Started " << config_.codec_name << " " << width << "x" << height
      << " @ " << fps.num << "/" << fps.den << " fps";
  Logger::Debug(oss.str());
  return true;
}

bool FFmpegCaptureSink::CaptureFrame(const capture::RasterSurface& surface,
                                     int64_t frame_index) {
  if (!codec_ctx_) {
    last_error_ = "capture sink not started";
    return false;
  }

  sws_ctx_ = sws_getCachedContext(sws_ctx_, surface.width(), surface.height(), AV_PIX_FMT_RGBA,
                                  codec_ctx_->width, codec_ctx_->height, AV_PIX_FMT_YUV420P,
                                  SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    return Fail("Failed to create scaler context");
  }

  int ret = av_frame_make_writable(frame_);
  if (ret < 0) {
    return Fail("Frame not writable: " + AvErrorString(ret));
  }

  const uint8_t* src_data[4] = {surface.pixels().data(), nullptr, nullptr, nullptr};
  const int src_linesize[4] = {static_cast<int>(surface.stride()), 0, 0, 0};
  sws_scale(sws_ctx_, src_data, src_linesize, 0, surface.height(), frame_->data,
            frame_->linesize);
  frame_->pts = frame_index;

  ret = avcodec_send_frame(codec_ctx_, frame_);
  if (ret < 0) {
    return Fail("avcodec_send_frame: " + AvErrorString(ret));
  }
  ++frames_encoded_;
  return WritePendingPackets();
}

bool FFmpegCaptureSink::WritePendingPackets() {
  while (true) {
    int ret = avcodec_receive_packet(codec_ctx_, packet_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
      return true;
    }
    if (ret < 0) {
      return Fail("avcodec_receive_packet: " + AvErrorString(ret));
    }
    av_packet_rescale_ts(packet_, codec_ctx_->time_base, stream_->time_base);
    packet_->stream_index = stream_->index;
    // av_interleaved_write_frame takes ownership and unrefs the packet.
    ret = av_interleaved_write_frame(format_ctx_, packet_);
    if (ret < 0) {
      return Fail("av_interleaved_write_frame: " + AvErrorString(ret));
    }
  }
}

bool FFmpegCaptureSink::Finish(timeline::MediaBlob& out) {
  if (!codec_ctx_ || !header_written_) {
    last_error_ = "capture sink not started";
    return false;
  }

  int ret = avcodec_send_frame(codec_ctx_, nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    return Fail("encoder flush: " + AvErrorString(ret));
  }
  if (!WritePendingPackets()) {
    return false;
  }
  ret = av_write_trailer(format_ctx_);
  if (ret < 0) {
    return Fail("av_write_trailer: " + AvErrorString(ret));
  }
  header_written_ = false;

  out.mime_type = config_.mime_type;
  out.bytes = output_->TakeBytes();

  std::ostringstream oss;
  oss << "[FFmpegCaptureSink] Finished " << frames_encoded_ << " frames, " << out.bytes.size()
      << " bytes";
  Logger::Info(oss.str());

  Close();
  return !out.bytes.empty() || Fail("encoder produced no output");
}

void FFmpegCaptureSink::Abort() {
  if (codec_ctx_) {
    Logger::Warn("[FFmpegCaptureSink] Aborted after " + std::to_string(frames_encoded_) +
                 " frames");
  }
  Close();
}

void FFmpegCaptureSink::Close() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (packet_) av_packet_free(&packet_);
  if (frame_) av_frame_free(&frame_);
  if (codec_ctx_) avcodec_free_context(&codec_ctx_);
  if (format_ctx_) {
    // Custom IO: the context does not own pb.
    avformat_free_context(format_ctx_);
    format_ctx_ = nullptr;
  }
  stream_ = nullptr;
  output_.reset();
  header_written_ = false;
}

}  // namespace moshline::encode
