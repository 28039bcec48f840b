// Repository: Moshline
// Component: FFmpeg Source Reader
// Purpose: Demux a media file into encoded chunks plus its decoder config.
// Copyright (c) 2025 RetroVue

#include "moshline/decode/FFmpegSourceReader.hpp"

#include <cstdio>
#include <sstream>

#include "moshline/encode/MemoryAvio.hpp"
#include "moshline/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/log.h>
#include <libavutil/mathematics.h>
}

namespace moshline::decode {

using pipeline::SourceLoadResult;
using util::Logger;

namespace {

constexpr AVRational kMicroseconds = {1, 1000000};

// Codec string the chunk decoder understands, or "" when unsupported.
std::string CodecString(const AVCodecParameters* par) {
  switch (par->codec_id) {
    case AV_CODEC_ID_H264:
      // avcC: version, profile, compatibility, level.
      if (par->extradata_size >= 4 && par->extradata[0] == 1) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "avc1.%02x%02x%02x", par->extradata[1],
                      par->extradata[2], par->extradata[3]);
        return buf;
      }
      return "avc1";
    case AV_CODEC_ID_HEVC: return "hvc1";
    case AV_CODEC_ID_VP8:  return "vp8";
    case AV_CODEC_ID_VP9:  return "vp09";
    case AV_CODEC_ID_AV1:  return "av01";
    default:               return "";
  }
}

// Closes the input on every exit path.
struct InputGuard {
  AVFormatContext* ctx = nullptr;
  AVPacket* packet = nullptr;
  ~InputGuard() {
    if (packet) av_packet_free(&packet);
    if (ctx) avformat_close_input(&ctx);
  }
};

}  // namespace

FFmpegSourceReader::FFmpegSourceReader(std::map<std::string, std::string> paths)
    : paths_(std::move(paths)) {}

SourceLoadResult FFmpegSourceReader::Load(const std::string& source_id) const {
  auto it = paths_.find(source_id);
  if (it == paths_.end()) {
    return SourceLoadResult::Failure("no path for source '" + source_id + "'");
  }
  return ReadFile(it->second);
}

pipeline::SourceLoaderFn FFmpegSourceReader::AsLoader() const {
  return [this](const std::string& source_id) { return Load(source_id); };
}

SourceLoadResult FFmpegSourceReader::ReadFile(const std::string& path) {
  av_log_set_level(AV_LOG_ERROR);

  InputGuard input;
  int ret = avformat_open_input(&input.ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    return SourceLoadResult::Failure("open " + path + ": " + encode::AvErrorString(ret));
  }
  ret = avformat_find_stream_info(input.ctx, nullptr);
  if (ret < 0) {
    return SourceLoadResult::Failure("stream info " + path + ": " + encode::AvErrorString(ret));
  }

  const int stream_index =
      av_find_best_stream(input.ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (stream_index < 0) {
    return SourceLoadResult::Failure("no video stream in " + path);
  }
  AVStream* stream = input.ctx->streams[stream_index];
  const AVCodecParameters* par = stream->codecpar;

  timeline::DecoderConfig config;
  config.codec = CodecString(par);
  if (config.codec.empty()) {
    return SourceLoadResult::Failure(std::string("unsupported codec ") +
                                     avcodec_get_name(par->codec_id) + " in " + path);
  }
  config.coded_width = par->width;
  config.coded_height = par->height;
  if (par->extradata_size > 0) {
    config.description.assign(par->extradata, par->extradata + par->extradata_size);
  }

  input.packet = av_packet_alloc();
  if (!input.packet) {
    return SourceLoadResult::Failure("packet allocation failed");
  }

  const int64_t start = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;
  timeline::ChunkList chunks;
  while ((ret = av_read_frame(input.ctx, input.packet)) >= 0) {
    if (input.packet->stream_index == stream_index) {
      timeline::EncodedChunk chunk;
      chunk.kind = (input.packet->flags & AV_PKT_FLAG_KEY) ? timeline::ChunkKind::kKey
                                                           : timeline::ChunkKind::kDelta;
      int64_t ts = input.packet->pts != AV_NOPTS_VALUE ? input.packet->pts : input.packet->dts;
      if (ts == AV_NOPTS_VALUE) ts = start;
      const int64_t rel_us = av_rescale_q(ts - start, stream->time_base, kMicroseconds);
      chunk.timestamp_us = rel_us > 0 ? static_cast<uint64_t>(rel_us) : 0;
      const int64_t dur_us = av_rescale_q(input.packet->duration, stream->time_base, kMicroseconds);
      chunk.duration_us = dur_us > 0 ? static_cast<uint64_t>(dur_us) : 0;
      chunk.payload.assign(input.packet->data, input.packet->data + input.packet->size);
      chunks.push_back(std::move(chunk));
    }
    av_packet_unref(input.packet);
  }
  if (ret != AVERROR_EOF) {
    return SourceLoadResult::Failure("read " + path + ": " + encode::AvErrorString(ret));
  }

  std::ostringstream oss;
  oss << "[FFmpegSourceReader] " << path << ": " << chunks.size() << " chunks, " << config.codec
      << " " << config.coded_width << "x" << config.coded_height;
  Logger::Info(oss.str());

  return SourceLoadResult::Success(std::move(chunks), std::move(config));
}

}  // namespace moshline::decode
