// Repository: Moshline
// Component: Muxer Adapter
// Purpose: Combine the video-only capture and the synthesized audio track,
//          retrying once with an alternate explicit stream map.
// Copyright (c) 2025 RetroVue

#include "moshline/mux/MuxerAdapter.hpp"

#include <sstream>

#include "moshline/util/Logger.hpp"

namespace moshline::mux {

using util::Logger;

std::string StreamSelector::ToString() const {
  std::ostringstream oss;
  oss << input << ':' << static_cast<char>(type);
  if (index >= 0) {
    oss << ':' << index;
  }
  return oss.str();
}

std::vector<std::string> MuxInvocation::ToArgs() const {
  std::vector<std::string> args;
  for (size_t i = 0; i < inputs.size(); ++i) {
    args.push_back("-i");
    args.push_back("input" + std::to_string(i));
  }
  args.push_back("-map");
  args.push_back(video_map.ToString());
  args.push_back("-map");
  args.push_back(audio_map.ToString());
  args.push_back("-c:v");
  args.push_back(video_codec);
  args.push_back("-c:a");
  args.push_back(audio_codec);
  args.push_back("-b:a");
  args.push_back(std::to_string(audio_bitrate / 1000) + "k");
  if (audio_sample_rate > 0) {
    args.push_back("-ar");
    args.push_back(std::to_string(audio_sample_rate));
  }
  if (audio_channels > 0) {
    args.push_back("-ac");
    args.push_back(std::to_string(audio_channels));
  }
  if (shortest) {
    args.push_back("-shortest");
  }
  args.push_back("-f");
  args.push_back(container);
  return args;
}

namespace {

std::string JoinArgs(const std::vector<std::string>& args) {
  std::string out;
  for (const auto& a : args) {
    if (!out.empty()) out += ' ';
    out += a;
  }
  return out;
}

}  // namespace

MuxerAdapter::MuxerAdapter(MuxConfig config, ITranscoder& transcoder)
    : config_(std::move(config)), transcoder_(transcoder) {}

MuxInvocation MuxerAdapter::PrimaryInvocation(const timeline::MediaBlob& video,
                                              const timeline::MediaBlob& audio) const {
  MuxInvocation inv;
  inv.inputs = {&video, &audio};
  inv.video_map = {0, StreamType::kVideo, 0};
  inv.audio_map = {1, StreamType::kAudio, 0};
  inv.video_codec = config_.video_codec;
  inv.audio_codec = config_.audio_codec;
  inv.audio_bitrate = config_.audio_bitrate;
  inv.audio_sample_rate = config_.audio_sample_rate;
  inv.audio_channels = config_.audio_channels;
  inv.shortest = true;
  inv.container = config_.container;
  return inv;
}

MuxInvocation MuxerAdapter::AlternateInvocation(const timeline::MediaBlob& video,
                                                const timeline::MediaBlob& audio) const {
  MuxInvocation inv = PrimaryInvocation(video, audio);
  inv.video_map = {0, StreamType::kVideo, -1};
  inv.audio_map = {1, StreamType::kAudio, -1};
  inv.audio_channels = 0;
  return inv;
}

MuxResult MuxerAdapter::Mux(const timeline::MediaBlob& video, const timeline::MediaBlob& audio) {
  if (video.Empty() || audio.Empty()) {
    return MuxResult::Failure(video.Empty() ? "video input is empty" : "audio input is empty", 0);
  }

  const MuxInvocation attempts[] = {PrimaryInvocation(video, audio),
                                    AlternateInvocation(video, audio)};
  std::string failures;
  int32_t n = 0;

  for (const auto& inv : attempts) {
    ++n;
    Logger::Debug("[MuxerAdapter] attempt " + std::to_string(n) + ": " + JoinArgs(inv.ToArgs()));

    TranscodeResult result = transcoder_.Exec(inv);
    if (result.ok && !result.output.Empty()) {
      result.output.mime_type = config_.output_mime_type;
      std::ostringstream oss;
      oss << "[MuxerAdapter] Muxed " << video.bytes.size() << "+" << audio.bytes.size()
          << " bytes -> " << result.output.bytes.size() << " bytes on attempt " << n;
      Logger::Info(oss.str());
      return MuxResult::Success(std::move(result.output), n);
    }

    const std::string reason = result.ok ? "transcoder produced no output" : result.detail;
    Logger::Warn("[MuxerAdapter] attempt " + std::to_string(n) + " failed (map " +
                 inv.video_map.ToString() + " " + inv.audio_map.ToString() + "): " + reason);
    if (!failures.empty()) failures += "; ";
    failures += "attempt " + std::to_string(n) + ": " + reason;
  }

  return MuxResult::Failure(failures, n);
}

}  // namespace moshline::mux
