// Repository: Moshline
// Component: FFmpeg Chunk Decoder
// Purpose: libavcodec decode of individual encoded chunks to RGBA frames.
// Copyright (c) 2025 RetroVue

#include "moshline/decode/FFmpegChunkDecoder.hpp"

#include <cstring>
#include <memory>
#include <sstream>

#include "moshline/encode/MemoryAvio.hpp"
#include "moshline/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
#include <libavutil/mem.h>
#include <libswscale/swscale.h>
}

namespace moshline::decode {

using util::Logger;

int CodecIdFromString(const std::string& codec) {
  const std::string fourcc = codec.substr(0, codec.find('.'));
  if (fourcc == "avc1" || fourcc == "avc3") return AV_CODEC_ID_H264;
  if (fourcc == "hvc1" || fourcc == "hev1") return AV_CODEC_ID_HEVC;
  if (fourcc == "vp8" || fourcc == "vp08") return AV_CODEC_ID_VP8;
  if (fourcc == "vp09") return AV_CODEC_ID_VP9;
  if (fourcc == "av01") return AV_CODEC_ID_AV1;
  return AV_CODEC_ID_NONE;
}

FFmpegChunkDecoder::FFmpegChunkDecoder() = default;

FFmpegChunkDecoder::~FFmpegChunkDecoder() { Reset(); }

bool FFmpegChunkDecoder::Configure(const timeline::DecoderConfig& config) {
  Reset();

  if (!config.IsValid()) {
    Logger::Error("[FFmpegChunkDecoder] Empty codec string");
    return false;
  }

  const auto codec_id = static_cast<AVCodecID>(CodecIdFromString(config.codec));
  if (codec_id == AV_CODEC_ID_NONE) {
    Logger::Error("[FFmpegChunkDecoder] Unsupported codec: " + config.codec);
    return false;
  }

  av_log_set_level(AV_LOG_ERROR);

  const AVCodec* codec = avcodec_find_decoder(codec_id);
  if (!codec) {
    Logger::Error("[FFmpegChunkDecoder] Decoder not found for " + config.codec);
    return false;
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    Logger::Error("[FFmpegChunkDecoder] Failed to allocate codec context");
    return false;
  }

  codec_ctx_->width = config.coded_width;
  codec_ctx_->height = config.coded_height;

  if (!config.description.empty()) {
    const size_t size = config.description.size();
    codec_ctx_->extradata =
        static_cast<uint8_t*>(av_mallocz(size + AV_INPUT_BUFFER_PADDING_SIZE));
    if (!codec_ctx_->extradata) {
      Logger::Error("[FFmpegChunkDecoder] Failed to allocate extradata");
      Reset();
      return false;
    }
    std::memcpy(codec_ctx_->extradata, config.description.data(), size);
    codec_ctx_->extradata_size = static_cast<int>(size);
  }

  // One picture out per picture in; show frames with missing references.
  codec_ctx_->thread_count = 1;
  codec_ctx_->flags |= AV_CODEC_FLAG_LOW_DELAY | AV_CODEC_FLAG_OUTPUT_CORRUPT;
  codec_ctx_->flags2 |= AV_CODEC_FLAG2_SHOW_ALL;

  const int ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    Logger::Error("[FFmpegChunkDecoder] Failed to open codec " + config.codec + ": " +
                  encode::AvErrorString(ret));
    Reset();
    return false;
  }

  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) {
    Logger::Error("[FFmpegChunkDecoder] Failed to allocate frame/packet");
    Reset();
    return false;
  }

  if (output_width_ <= 0 || output_height_ <= 0) {
    output_width_ = config.coded_width;
    output_height_ = config.coded_height;
  }

  std::ostringstream oss;
  oss << "[FFmpegChunkDecoder] Configured " << config.codec << " " << config.coded_width << "x"
      << config.coded_height << " extradata=" << config.description.size() << "B";
  Logger::Debug(oss.str());
  return true;
}

void FFmpegChunkDecoder::SetOutputSize(int32_t width, int32_t height) {
  output_width_ = width;
  output_height_ = height;
}

capture::DecodeOutput FFmpegChunkDecoder::Decode(const timeline::EncodedChunk& chunk) {
  capture::DecodeOutput out;
  if (!codec_ctx_) {
    out.status = capture::DecodeStatus::kError;
    out.detail = "decoder not configured";
    return out;
  }

  int ret = av_new_packet(packet_, static_cast<int>(chunk.payload.size()));
  if (ret < 0) {
    out.status = capture::DecodeStatus::kError;
    out.detail = "packet allocation failed: " + encode::AvErrorString(ret);
    return out;
  }
  if (!chunk.payload.empty()) {
    std::memcpy(packet_->data, chunk.payload.data(), chunk.payload.size());
  }
  packet_->pts = static_cast<int64_t>(chunk.timestamp_us);
  packet_->dts = packet_->pts;
  packet_->duration = static_cast<int64_t>(chunk.duration_us);
  if (chunk.kind == timeline::ChunkKind::kKey) {
    packet_->flags |= AV_PKT_FLAG_KEY;
  }

  // A full decoder refuses the packet with EAGAIN until pictures are
  // received. Drain them into pending_ and resend the same packet.
  static constexpr int kMaxEagainRetries = 4;
  for (int attempt = 0; attempt <= kMaxEagainRetries; ++attempt) {
    ret = avcodec_send_packet(codec_ctx_, packet_);
    if (ret != AVERROR(EAGAIN)) break;
    const int drained = DrainFrames();
    if (drained < 0) {
      av_packet_unref(packet_);
      out.status = capture::DecodeStatus::kError;
      out.detail = "avcodec_receive_frame: " + encode::AvErrorString(drained);
      return out;
    }
  }
  av_packet_unref(packet_);
  if (ret < 0) {
    out.status = capture::DecodeStatus::kError;
    out.detail = "avcodec_send_packet: " + encode::AvErrorString(ret);
    return out;
  }

  if (pending_.empty()) {
    ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
      out.status = capture::DecodeStatus::kNoFrame;
      return out;
    }
    if (ret < 0) {
      out.status = capture::DecodeStatus::kError;
      out.detail = "avcodec_receive_frame: " + encode::AvErrorString(ret);
      return out;
    }
    if (!TakeFrame()) {
      out.status = capture::DecodeStatus::kError;
      out.detail = "pixel conversion failed";
      return out;
    }
  }

  out.status = capture::DecodeStatus::kFrame;
  out.frame = std::move(pending_.front());
  pending_.pop_front();
  return out;
}

// Receives every picture the decoder has ready. Returns the number taken,
// or a negative AVERROR on a receive or conversion failure.
int FFmpegChunkDecoder::DrainFrames() {
  int taken = 0;
  while (true) {
    const int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return taken;
    if (ret < 0) return ret;
    if (!TakeFrame()) return AVERROR(EINVAL);
    ++taken;
  }
}

// Converts frame_ to RGBA, appends it to pending_ and unrefs frame_.
bool FFmpegChunkDecoder::TakeFrame() {
  auto raster = std::make_unique<capture::RasterFrame>();
  const bool converted = ConvertFrame(*raster);
  av_frame_unref(frame_);
  if (!converted) return false;
  ++frames_decoded_;
  pending_.push_back(std::move(raster));
  return true;
}

bool FFmpegChunkDecoder::ConvertFrame(capture::RasterFrame& out) {
  const int dst_width = output_width_ > 0 ? output_width_ : frame_->width;
  const int dst_height = output_height_ > 0 ? output_height_ : frame_->height;

  // Sources may differ in size; the cached context follows the input.
  sws_ctx_ = sws_getCachedContext(sws_ctx_, frame_->width, frame_->height,
                                  static_cast<AVPixelFormat>(frame_->format), dst_width,
                                  dst_height, AV_PIX_FMT_RGBA, SWS_BILINEAR, nullptr, nullptr,
                                  nullptr);
  if (!sws_ctx_) {
    Logger::Error("[FFmpegChunkDecoder] Failed to create scaler context");
    return false;
  }

  out.width = dst_width;
  out.height = dst_height;
  out.rgba.assign(static_cast<size_t>(dst_width) * dst_height * 4, 0);

  uint8_t* dst_data[4] = {out.rgba.data(), nullptr, nullptr, nullptr};
  int dst_linesize[4] = {dst_width * 4, 0, 0, 0};
  const int rows = sws_scale(sws_ctx_, frame_->data, frame_->linesize, 0, frame_->height,
                             dst_data, dst_linesize);
  return rows == dst_height;
}

void FFmpegChunkDecoder::Reset() {
  pending_.clear();
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
}

}  // namespace moshline::decode
