// Repository: Moshline
// Component: FFmpeg Sample Source
// Purpose: Decode Sample audio resources to mono float PCM.
// Copyright (c) 2025 RetroVue

#include "moshline/decode/FFmpegSampleSource.hpp"

#include <sstream>
#include <vector>

#include "moshline/encode/MemoryAvio.hpp"
#include "moshline/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace moshline::decode {

using audio::SampleLoadResult;
using util::Logger;

namespace {

struct DecodeContext {
  AVFormatContext* format_ctx = nullptr;
  AVCodecContext* codec_ctx = nullptr;
  SwrContext* swr_ctx = nullptr;
  AVPacket* packet = nullptr;
  AVFrame* frame = nullptr;

  ~DecodeContext() {
    if (frame) av_frame_free(&frame);
    if (packet) av_packet_free(&packet);
    if (swr_ctx) swr_free(&swr_ctx);
    if (codec_ctx) avcodec_free_context(&codec_ctx);
    if (format_ctx) avformat_close_input(&format_ctx);
  }
};

// Resample `frame` (or flush when null) and append to `out`.
int AppendResampled(SwrContext* swr, const AVFrame* frame, int out_rate, int in_rate,
                    std::vector<float>& out) {
  const int in_samples = frame ? frame->nb_samples : 0;
  const int64_t delay = swr_get_delay(swr, in_rate);
  const int max_out = static_cast<int>(
      av_rescale_rnd(delay + in_samples, out_rate, in_rate, AV_ROUND_UP));
  if (max_out <= 0) return 0;

  const size_t offset = out.size();
  out.resize(offset + static_cast<size_t>(max_out));
  uint8_t* dst = reinterpret_cast<uint8_t*>(out.data() + offset);
  const uint8_t** src =
      frame ? const_cast<const uint8_t**>(frame->extended_data) : nullptr;
  const int converted = swr_convert(swr, &dst, max_out, src, in_samples);
  if (converted < 0) {
    out.resize(offset);
    return converted;
  }
  out.resize(offset + static_cast<size_t>(converted));
  return converted;
}

}  // namespace

SampleLoadResult FFmpegSampleSource::Load(const std::string& url, int32_t sample_rate) {
  if (url.empty()) {
    return SampleLoadResult::Failure("empty url");
  }
  if (sample_rate <= 0) {
    return SampleLoadResult::Failure("invalid sample rate");
  }

  av_log_set_level(AV_LOG_ERROR);

  DecodeContext ctx;
  int ret = avformat_open_input(&ctx.format_ctx, url.c_str(), nullptr, nullptr);
  if (ret < 0) {
    return SampleLoadResult::Failure("open " + url + ": " + encode::AvErrorString(ret));
  }
  ret = avformat_find_stream_info(ctx.format_ctx, nullptr);
  if (ret < 0) {
    return SampleLoadResult::Failure("stream info: " + encode::AvErrorString(ret));
  }

  const AVCodec* codec = nullptr;
  const int stream_index =
      av_find_best_stream(ctx.format_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
  if (stream_index < 0 || !codec) {
    return SampleLoadResult::Failure("no decodable audio stream in " + url);
  }

  ctx.codec_ctx = avcodec_alloc_context3(codec);
  if (!ctx.codec_ctx) {
    return SampleLoadResult::Failure("codec context allocation failed");
  }
  ret = avcodec_parameters_to_context(ctx.codec_ctx,
                                      ctx.format_ctx->streams[stream_index]->codecpar);
  if (ret < 0) {
    return SampleLoadResult::Failure("codec parameters: " + encode::AvErrorString(ret));
  }
  ret = avcodec_open2(ctx.codec_ctx, codec, nullptr);
  if (ret < 0) {
    return SampleLoadResult::Failure("open decoder: " + encode::AvErrorString(ret));
  }

  AVChannelLayout src_layout;
  av_channel_layout_uninit(&src_layout);
  if (ctx.codec_ctx->ch_layout.nb_channels > 0) {
    av_channel_layout_copy(&src_layout, &ctx.codec_ctx->ch_layout);
  } else {
    av_channel_layout_default(&src_layout, 1);
  }
  AVChannelLayout mono;
  av_channel_layout_default(&mono, 1);
  const int in_rate = ctx.codec_ctx->sample_rate;
  ret = swr_alloc_set_opts2(&ctx.swr_ctx, &mono, AV_SAMPLE_FMT_FLT, sample_rate, &src_layout,
                            ctx.codec_ctx->sample_fmt, in_rate, 0, nullptr);
  av_channel_layout_uninit(&src_layout);
  if (ret < 0 || (ret = swr_init(ctx.swr_ctx)) < 0) {
    return SampleLoadResult::Failure("resampler: " + encode::AvErrorString(ret));
  }

  ctx.packet = av_packet_alloc();
  ctx.frame = av_frame_alloc();
  if (!ctx.packet || !ctx.frame) {
    return SampleLoadResult::Failure("frame/packet allocation failed");
  }

  std::vector<float> samples;
  auto drain = [&]() -> int {
    while (true) {
      int r = avcodec_receive_frame(ctx.codec_ctx, ctx.frame);
      if (r == AVERROR(EAGAIN) || r == AVERROR_EOF) return 0;
      if (r < 0) return r;
      r = AppendResampled(ctx.swr_ctx, ctx.frame, sample_rate, in_rate, samples);
      av_frame_unref(ctx.frame);
      if (r < 0) return r;
    }
  };

  while ((ret = av_read_frame(ctx.format_ctx, ctx.packet)) >= 0) {
    if (ctx.packet->stream_index == stream_index) {
      ret = avcodec_send_packet(ctx.codec_ctx, ctx.packet);
      if (ret < 0 && ret != AVERROR(EAGAIN) && ret != AVERROR_INVALIDDATA) {
        av_packet_unref(ctx.packet);
        return SampleLoadResult::Failure("decode: " + encode::AvErrorString(ret));
      }
      ret = drain();
      if (ret < 0) {
        av_packet_unref(ctx.packet);
        return SampleLoadResult::Failure("decode: " + encode::AvErrorString(ret));
      }
    }
    av_packet_unref(ctx.packet);
  }
  if (ret != AVERROR_EOF) {
    return SampleLoadResult::Failure("read: " + encode::AvErrorString(ret));
  }

  // Flush decoder then resampler.
  ret = avcodec_send_packet(ctx.codec_ctx, nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    return SampleLoadResult::Failure("decode flush: " + encode::AvErrorString(ret));
  }
  ret = drain();
  if (ret < 0) {
    return SampleLoadResult::Failure("decode flush: " + encode::AvErrorString(ret));
  }
  ret = AppendResampled(ctx.swr_ctx, nullptr, sample_rate, in_rate, samples);
  if (ret < 0) {
    return SampleLoadResult::Failure("resample flush: " + encode::AvErrorString(ret));
  }

  if (samples.empty()) {
    return SampleLoadResult::Failure("no audio decoded from " + url);
  }

  std::ostringstream oss;
  oss << "[FFmpegSampleSource] " << url << ": " << samples.size() << " samples @ " << sample_rate
      << " Hz";
  Logger::Debug(oss.str());
  return SampleLoadResult::Success(std::move(samples));
}

}  // namespace moshline::decode
