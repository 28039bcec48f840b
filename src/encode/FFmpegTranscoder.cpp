// Repository: Moshline
// Component: FFmpeg Transcoder
// Purpose: In-memory stream-mapped mux: copy the selected video stream,
//          encode the selected audio stream to AAC.
// Copyright (c) 2025 RetroVue

#include "moshline/encode/FFmpegTranscoder.hpp"

#include <algorithm>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "moshline/encode/MemoryAvio.hpp"
#include "moshline/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/audio_fifo.h>
#include <libavutil/channel_layout.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace moshline::encode {

using mux::MuxInvocation;
using mux::StreamSelector;
using mux::StreamType;
using mux::TranscodeResult;
using util::Logger;

namespace {

constexpr int kDefaultAudioFrameSize = 1024;

// One demuxed in-memory input.
struct InputFile {
  std::unique_ptr<MemoryInput> io;
  AVFormatContext* ctx = nullptr;

  ~InputFile() {
    if (ctx) avformat_close_input(&ctx);
  }

  bool Open(const timeline::MediaBlob& blob, std::string& error) {
    io = std::make_unique<MemoryInput>(blob.bytes.data(), blob.bytes.size());
    if (!io->Open()) {
      error = "Failed to allocate AVIO context";
      return false;
    }
    ctx = avformat_alloc_context();
    if (!ctx) {
      error = "Failed to allocate input context";
      return false;
    }
    ctx->pb = io->context();
    ctx->flags |= AVFMT_FLAG_CUSTOM_IO;
    // avformat_open_input frees ctx on failure.
    int ret = avformat_open_input(&ctx, nullptr, nullptr, nullptr);
    if (ret < 0) {
      ctx = nullptr;
      error = "open input: " + AvErrorString(ret);
      return false;
    }
    ret = avformat_find_stream_info(ctx, nullptr);
    if (ret < 0) {
      error = "stream info: " + AvErrorString(ret);
      return false;
    }
    return true;
  }

  // Index of the selected stream, or -1.
  int Select(const StreamSelector& selector) const {
    const AVMediaType wanted =
        selector.type == StreamType::kVideo ? AVMEDIA_TYPE_VIDEO : AVMEDIA_TYPE_AUDIO;
    int seen = 0;
    for (unsigned int i = 0; i < ctx->nb_streams; ++i) {
      if (ctx->streams[i]->codecpar->codec_type != wanted) continue;
      if (selector.index < 0 || seen == selector.index) return static_cast<int>(i);
      ++seen;
    }
    return -1;
  }

  // Stream duration in seconds, 0 when unknown.
  double DurationSeconds(int stream_index) const {
    const AVStream* stream = ctx->streams[stream_index];
    if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
      return static_cast<double>(stream->duration) * av_q2d(stream->time_base);
    }
    if (ctx->duration != AV_NOPTS_VALUE && ctx->duration > 0) {
      return static_cast<double>(ctx->duration) / AV_TIME_BASE;
    }
    return 0.0;
  }
};

// All state of one Exec() call.
class MuxSession {
 public:
  explicit MuxSession(const MuxInvocation& inv) : inv_(inv) {}

  ~MuxSession() {
    if (fifo_) av_audio_fifo_free(fifo_);
    if (swr_ctx_) swr_free(&swr_ctx_);
    if (in_frame_) av_frame_free(&in_frame_);
    if (out_frame_) av_frame_free(&out_frame_);
    if (packet_) av_packet_free(&packet_);
    if (decoder_ctx_) avcodec_free_context(&decoder_ctx_);
    if (encoder_ctx_) avcodec_free_context(&encoder_ctx_);
    if (out_ctx_) avformat_free_context(out_ctx_);
  }

  TranscodeResult Run();

 private:
  bool Fail(const std::string& message) {
    error_ = message;
    return false;
  }

  bool OpenInputs();
  bool OpenOutput();
  bool AddVideoStream();
  bool AddAudioStream();
  bool CopyVideo();
  bool TranscodeAudio();
  bool ResampleIntoFifo(const AVFrame* frame);
  bool EncodeFromFifo(bool flush);
  bool WriteEncodedPackets();

  const MuxInvocation& inv_;
  std::string error_;

  std::vector<std::unique_ptr<InputFile>> inputs_;
  InputFile* video_input_ = nullptr;
  InputFile* audio_input_ = nullptr;
  int video_in_index_ = -1;
  int audio_in_index_ = -1;

  std::unique_ptr<MemoryOutput> output_;
  AVFormatContext* out_ctx_ = nullptr;
  AVStream* video_out_ = nullptr;
  AVStream* audio_out_ = nullptr;

  AVCodecContext* decoder_ctx_ = nullptr;
  AVCodecContext* encoder_ctx_ = nullptr;
  SwrContext* swr_ctx_ = nullptr;
  AVAudioFifo* fifo_ = nullptr;
  AVFrame* in_frame_ = nullptr;
  AVFrame* out_frame_ = nullptr;
  AVPacket* packet_ = nullptr;

  double limit_seconds_ = std::numeric_limits<double>::infinity();
  int64_t audio_limit_samples_ = std::numeric_limits<int64_t>::max();
  int64_t audio_samples_written_ = 0;
  int64_t video_packets_written_ = 0;
};

bool MuxSession::OpenInputs() {
  if (inv_.inputs.size() < 2) {
    return Fail("two inputs required");
  }
  for (size_t i = 0; i < inv_.inputs.size(); ++i) {
    const timeline::MediaBlob* blob = inv_.inputs[i];
    if (!blob || blob->Empty()) {
      return Fail("input " + std::to_string(i) + " is empty");
    }
    auto input = std::make_unique<InputFile>();
    std::string error;
    if (!input->Open(*blob, error)) {
      return Fail("input " + std::to_string(i) + ": " + error);
    }
    inputs_.push_back(std::move(input));
  }

  auto pick = [this](const StreamSelector& sel, InputFile*& file, int& index) {
    if (sel.input < 0 || static_cast<size_t>(sel.input) >= inputs_.size()) {
      return Fail("map " + sel.ToString() + " names a missing input");
    }
    file = inputs_[static_cast<size_t>(sel.input)].get();
    index = file->Select(sel);
    if (index < 0) {
      return Fail("map " + sel.ToString() + " matches no stream");
    }
    return true;
  };
  return pick(inv_.video_map, video_input_, video_in_index_) &&
         pick(inv_.audio_map, audio_input_, audio_in_index_);
}

bool MuxSession::OpenOutput() {
  int ret = avformat_alloc_output_context2(&out_ctx_, nullptr, inv_.container.c_str(), nullptr);
  if (ret < 0 || !out_ctx_) {
    return Fail("Failed to allocate output context: " + AvErrorString(ret));
  }
  output_ = std::make_unique<MemoryOutput>();
  if (!output_->Open()) {
    return Fail("Failed to allocate AVIO context");
  }
  out_ctx_->pb = output_->context();
  out_ctx_->flags |= AVFMT_FLAG_CUSTOM_IO;

  packet_ = av_packet_alloc();
  if (!packet_) {
    return Fail("Failed to allocate packet");
  }
  return true;
}

bool MuxSession::AddVideoStream() {
  if (inv_.video_codec != "copy") {
    return Fail("video codec '" + inv_.video_codec + "' unsupported; only copy");
  }
  const AVStream* in = video_input_->ctx->streams[video_in_index_];
  video_out_ = avformat_new_stream(out_ctx_, nullptr);
  if (!video_out_) {
    return Fail("Failed to create video stream");
  }
  int ret = avcodec_parameters_copy(video_out_->codecpar, in->codecpar);
  if (ret < 0) {
    return Fail("copy video parameters: " + AvErrorString(ret));
  }
  video_out_->codecpar->codec_tag = 0;
  video_out_->time_base = in->time_base;
  return true;
}

bool MuxSession::AddAudioStream() {
  const AVStream* in = audio_input_->ctx->streams[audio_in_index_];

  const AVCodec* decoder = avcodec_find_decoder(in->codecpar->codec_id);
  if (!decoder) {
    return Fail(std::string("no decoder for ") + avcodec_get_name(in->codecpar->codec_id));
  }
  decoder_ctx_ = avcodec_alloc_context3(decoder);
  if (!decoder_ctx_) {
    return Fail("Failed to allocate audio decoder context");
  }
  int ret = avcodec_parameters_to_context(decoder_ctx_, in->codecpar);
  if (ret >= 0) ret = avcodec_open2(decoder_ctx_, decoder, nullptr);
  if (ret < 0) {
    return Fail("open audio decoder: " + AvErrorString(ret));
  }

  const AVCodec* encoder = avcodec_find_encoder_by_name(inv_.audio_codec.c_str());
  if (!encoder) {
    return Fail("audio encoder '" + inv_.audio_codec + "' not found");
  }
  encoder_ctx_ = avcodec_alloc_context3(encoder);
  if (!encoder_ctx_) {
    return Fail("Failed to allocate audio encoder context");
  }

  const int rate = inv_.audio_sample_rate > 0 ? inv_.audio_sample_rate : decoder_ctx_->sample_rate;
  encoder_ctx_->sample_rate = rate;
  if (inv_.audio_channels > 0) {
    av_channel_layout_default(&encoder_ctx_->ch_layout, inv_.audio_channels);
  } else if (av_channel_layout_copy(&encoder_ctx_->ch_layout, &decoder_ctx_->ch_layout) < 0) {
    return Fail("copy channel layout failed");
  }
  encoder_ctx_->sample_fmt =
      (encoder->sample_fmts && encoder->sample_fmts[0] != AV_SAMPLE_FMT_NONE)
          ? encoder->sample_fmts[0]
          : AV_SAMPLE_FMT_FLTP;
  encoder_ctx_->bit_rate = inv_.audio_bitrate;
  encoder_ctx_->time_base = AVRational{1, rate};
  if (out_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
    encoder_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  }
  ret = avcodec_open2(encoder_ctx_, encoder, nullptr);
  if (ret < 0) {
    return Fail("open audio encoder: " + AvErrorString(ret));
  }

  audio_out_ = avformat_new_stream(out_ctx_, nullptr);
  if (!audio_out_) {
    return Fail("Failed to create audio stream");
  }
  ret = avcodec_parameters_from_context(audio_out_->codecpar, encoder_ctx_);
  if (ret < 0) {
    return Fail("audio parameters: " + AvErrorString(ret));
  }
  audio_out_->time_base = encoder_ctx_->time_base;

  ret = swr_alloc_set_opts2(&swr_ctx_, &encoder_ctx_->ch_layout, encoder_ctx_->sample_fmt, rate,
                            &decoder_ctx_->ch_layout, decoder_ctx_->sample_fmt,
                            decoder_ctx_->sample_rate, 0, nullptr);
  if (ret < 0 || (ret = swr_init(swr_ctx_)) < 0) {
    return Fail("resampler: " + AvErrorString(ret));
  }

  fifo_ = av_audio_fifo_alloc(encoder_ctx_->sample_fmt, encoder_ctx_->ch_layout.nb_channels, 1);
  in_frame_ = av_frame_alloc();
  out_frame_ = av_frame_alloc();
  if (!fifo_ || !in_frame_ || !out_frame_) {
    return Fail("Failed to allocate audio buffers");
  }
  return true;
}

bool MuxSession::CopyVideo() {
  AVFormatContext* in_ctx = video_input_->ctx;
  const AVStream* in = in_ctx->streams[video_in_index_];
  const int64_t start = in->start_time != AV_NOPTS_VALUE ? in->start_time : 0;

  int ret = 0;
  while ((ret = av_read_frame(in_ctx, packet_)) >= 0) {
    if (packet_->stream_index != video_in_index_) {
      av_packet_unref(packet_);
      continue;
    }
    const int64_t ts = packet_->pts != AV_NOPTS_VALUE ? packet_->pts : packet_->dts;
    if (ts != AV_NOPTS_VALUE &&
        static_cast<double>(ts - start) * av_q2d(in->time_base) >= limit_seconds_) {
      av_packet_unref(packet_);
      continue;
    }
    av_packet_rescale_ts(packet_, in->time_base, video_out_->time_base);
    packet_->stream_index = video_out_->index;
    packet_->pos = -1;
    // av_interleaved_write_frame takes ownership and unrefs the packet.
    ret = av_interleaved_write_frame(out_ctx_, packet_);
    if (ret < 0) {
      return Fail("write video: " + AvErrorString(ret));
    }
    ++video_packets_written_;
  }
  if (ret != AVERROR_EOF) {
    return Fail("read video: " + AvErrorString(ret));
  }
  if (video_packets_written_ == 0) {
    return Fail("video input has no packets");
  }
  return true;
}

bool MuxSession::ResampleIntoFifo(const AVFrame* frame) {
  const int in_samples = frame ? frame->nb_samples : 0;
  const int out_capacity = swr_get_out_samples(swr_ctx_, in_samples);
  if (out_capacity <= 0) return true;

  uint8_t** converted = nullptr;
  int ret = av_samples_alloc_array_and_samples(&converted, nullptr,
                                               encoder_ctx_->ch_layout.nb_channels, out_capacity,
                                               encoder_ctx_->sample_fmt, 0);
  if (ret < 0) {
    return Fail("sample buffer: " + AvErrorString(ret));
  }
  const uint8_t** src = frame ? const_cast<const uint8_t**>(frame->extended_data) : nullptr;
  const int produced = swr_convert(swr_ctx_, converted, out_capacity, src, in_samples);
  if (produced > 0) {
    ret = av_audio_fifo_write(fifo_, reinterpret_cast<void**>(converted), produced);
  } else {
    ret = produced;
  }
  av_freep(&converted[0]);
  av_freep(&converted);
  if (ret < 0) {
    return Fail("resample: " + AvErrorString(ret));
  }
  return true;
}

bool MuxSession::WriteEncodedPackets() {
  while (true) {
    int ret = avcodec_receive_packet(encoder_ctx_, packet_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
    if (ret < 0) {
      return Fail("encode audio: " + AvErrorString(ret));
    }
    av_packet_rescale_ts(packet_, encoder_ctx_->time_base, audio_out_->time_base);
    packet_->stream_index = audio_out_->index;
    ret = av_interleaved_write_frame(out_ctx_, packet_);
    if (ret < 0) {
      return Fail("write audio: " + AvErrorString(ret));
    }
  }
}

bool MuxSession::EncodeFromFifo(bool flush) {
  const int frame_size =
      encoder_ctx_->frame_size > 0 ? encoder_ctx_->frame_size : kDefaultAudioFrameSize;

  while (av_audio_fifo_size(fifo_) >= frame_size ||
         (flush && av_audio_fifo_size(fifo_) > 0)) {
    int64_t remaining = audio_limit_samples_ - audio_samples_written_;
    if (remaining <= 0) {
      av_audio_fifo_drain(fifo_, av_audio_fifo_size(fifo_));
      break;
    }
    const int n = static_cast<int>(
        std::min<int64_t>({static_cast<int64_t>(frame_size),
                           static_cast<int64_t>(av_audio_fifo_size(fifo_)), remaining}));

    av_frame_unref(out_frame_);
    out_frame_->nb_samples = n;
    out_frame_->format = encoder_ctx_->sample_fmt;
    out_frame_->sample_rate = encoder_ctx_->sample_rate;
    int ret = av_channel_layout_copy(&out_frame_->ch_layout, &encoder_ctx_->ch_layout);
    if (ret >= 0) ret = av_frame_get_buffer(out_frame_, 0);
    if (ret < 0) {
      return Fail("audio frame: " + AvErrorString(ret));
    }
    if (av_audio_fifo_read(fifo_, reinterpret_cast<void**>(out_frame_->data), n) < n) {
      return Fail("audio fifo underrun");
    }
    out_frame_->pts = audio_samples_written_;
    audio_samples_written_ += n;

    ret = avcodec_send_frame(encoder_ctx_, out_frame_);
    if (ret < 0) {
      return Fail("send audio frame: " + AvErrorString(ret));
    }
    if (!WriteEncodedPackets()) return false;
  }
  return true;
}

bool MuxSession::TranscodeAudio() {
  AVFormatContext* in_ctx = audio_input_->ctx;

  auto drain_decoder = [this]() {
    while (true) {
      int r = avcodec_receive_frame(decoder_ctx_, in_frame_);
      if (r == AVERROR(EAGAIN) || r == AVERROR_EOF) return true;
      if (r < 0) return Fail("decode audio: " + AvErrorString(r));
      const bool ok = ResampleIntoFifo(in_frame_) && EncodeFromFifo(false);
      av_frame_unref(in_frame_);
      if (!ok) return false;
    }
  };

  int ret = 0;
  while ((ret = av_read_frame(in_ctx, packet_)) >= 0) {
    if (packet_->stream_index != audio_in_index_) {
      av_packet_unref(packet_);
      continue;
    }
    ret = avcodec_send_packet(decoder_ctx_, packet_);
    av_packet_unref(packet_);
    if (ret < 0 && ret != AVERROR(EAGAIN)) {
      return Fail("decode audio: " + AvErrorString(ret));
    }
    if (!drain_decoder()) return false;
  }
  if (ret != AVERROR_EOF) {
    return Fail("read audio: " + AvErrorString(ret));
  }

  ret = avcodec_send_packet(decoder_ctx_, nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    return Fail("flush audio decoder: " + AvErrorString(ret));
  }
  if (!drain_decoder()) return false;
  if (!ResampleIntoFifo(nullptr) || !EncodeFromFifo(true)) return false;

  ret = avcodec_send_frame(encoder_ctx_, nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    return Fail("flush audio encoder: " + AvErrorString(ret));
  }
  return WriteEncodedPackets();
}

TranscodeResult MuxSession::Run() {
  if (!OpenInputs() || !OpenOutput() || !AddVideoStream() || !AddAudioStream()) {
    return TranscodeResult::Failure(error_);
  }

  if (inv_.shortest) {
    const double video_s = video_input_->DurationSeconds(video_in_index_);
    const double audio_s = audio_input_->DurationSeconds(audio_in_index_);
    if (video_s > 0.0 && audio_s > 0.0) {
      limit_seconds_ = std::min(video_s, audio_s);
      audio_limit_samples_ =
          static_cast<int64_t>(limit_seconds_ * encoder_ctx_->sample_rate + 0.5);
    }
  }

  int ret = avformat_write_header(out_ctx_, nullptr);
  if (ret < 0) {
    return TranscodeResult::Failure("write header: " + AvErrorString(ret));
  }
  if (!CopyVideo() || !TranscodeAudio()) {
    return TranscodeResult::Failure(error_);
  }
  ret = av_write_trailer(out_ctx_);
  if (ret < 0) {
    return TranscodeResult::Failure("write trailer: " + AvErrorString(ret));
  }

  timeline::MediaBlob out;
  out.mime_type = "video/" + inv_.container;
  out.bytes = output_->TakeBytes();

  std::ostringstream oss;
  oss << "[FFmpegTranscoder] " << video_packets_written_ << " video packets, "
      << audio_samples_written_ << " audio samples -> " << out.bytes.size() << " bytes";
  Logger::Debug(oss.str());
  return TranscodeResult::Success(std::move(out));
}

}  // namespace

TranscodeResult FFmpegTranscoder::Exec(const MuxInvocation& invocation) {
  av_log_set_level(AV_LOG_ERROR);
  MuxSession session(invocation);
  return session.Run();
}

}  // namespace moshline::encode
