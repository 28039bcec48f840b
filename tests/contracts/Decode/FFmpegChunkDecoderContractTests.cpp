// Repository: Moshline
// Component: FFmpeg Chunk Decoder Contract Tests
// Purpose: Every chunk of a captured clip comes back as exactly one frame,
//          in order, at the requested output size.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "moshline/capture/RasterSurface.hpp"
#include "moshline/decode/FFmpegChunkDecoder.hpp"
#include "moshline/decode/FFmpegSourceReader.hpp"
#include "moshline/encode/FFmpegCaptureSink.hpp"

using namespace moshline;
using moshline::capture::DecodeStatus;
using moshline::capture::RasterFrame;
using moshline::capture::RasterSurface;
using moshline::decode::FFmpegChunkDecoder;
using moshline::decode::FFmpegSourceReader;
using moshline::encode::FFmpegCaptureSink;

namespace {

constexpr int32_t kWidth = 64;
constexpr int32_t kHeight = 48;
constexpr int64_t kFrames = 40;

class FFmpegChunkDecoderContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
    path_ = (std::filesystem::temp_directory_path() / ("moshline_" + name + ".mp4")).string();
  }

  void TearDown() override {
    std::error_code ignored;
    std::filesystem::remove(path_, ignored);
  }

  // Captures kFrames frames of a moving gradient and writes the MP4 to path_.
  bool WriteClip(std::string* error) {
    FFmpegCaptureSink sink;
    timeline::Settings settings;
    settings.width = kWidth;
    settings.height = kHeight;
    if (!sink.Start(settings, timeline::FPS_30)) {
      *error = sink.LastError();
      return false;
    }
    RasterSurface surface(kWidth, kHeight);
    RasterFrame frame;
    frame.width = kWidth;
    frame.height = kHeight;
    frame.rgba.resize(static_cast<size_t>(kWidth) * kHeight * 4);
    for (int64_t i = 0; i < kFrames; ++i) {
      for (size_t p = 0; p < frame.rgba.size(); p += 4) {
        frame.rgba[p] = static_cast<uint8_t>((p / 4 + i * 7) & 0xFF);
        frame.rgba[p + 1] = static_cast<uint8_t>(i * 5);
        frame.rgba[p + 2] = 0x40;
        frame.rgba[p + 3] = 0xFF;
      }
      surface.Draw(frame);
      if (!sink.CaptureFrame(surface, i)) {
        *error = sink.LastError();
        sink.Abort();
        return false;
      }
    }
    timeline::MediaBlob blob;
    if (!sink.Finish(blob)) {
      *error = sink.LastError();
      return false;
    }
    std::ofstream file(path_, std::ios::binary);
    file.write(reinterpret_cast<const char*>(blob.bytes.data()),
               static_cast<std::streamsize>(blob.bytes.size()));
    return static_cast<bool>(file);
  }

  std::string path_;
};

}  // namespace

TEST_F(FFmpegChunkDecoderContractTest, EveryChunkYieldsOneFrame) {
  std::string error;
  if (!WriteClip(&error)) {
    GTEST_SKIP() << "H.264 capture unavailable: " << error;
  }

  auto source = FFmpegSourceReader::ReadFile(path_);
  ASSERT_TRUE(source.ok) << source.detail;
  ASSERT_EQ(static_cast<int64_t>(source.chunks.size()), kFrames);
  EXPECT_EQ(source.chunks.front().kind, timeline::ChunkKind::kKey);

  FFmpegChunkDecoder decoder;
  ASSERT_TRUE(decoder.Configure(source.config));
  decoder.SetOutputSize(32, 24);

  int64_t frames = 0;
  for (const auto& chunk : source.chunks) {
    auto out = decoder.Decode(chunk);
    ASSERT_NE(out.status, DecodeStatus::kError) << out.detail;
    ASSERT_EQ(out.status, DecodeStatus::kFrame) << "chunk " << frames;
    ASSERT_NE(out.frame, nullptr);
    EXPECT_EQ(out.frame->width, 32);
    EXPECT_EQ(out.frame->height, 24);
    EXPECT_EQ(out.frame->rgba.size(), 32u * 24u * 4u);
    ++frames;
  }
  EXPECT_EQ(frames, kFrames);
  EXPECT_EQ(decoder.frames_decoded(), static_cast<uint64_t>(kFrames));
}

TEST(FFmpegChunkDecoderContract, UnconfiguredDecodeIsAnError) {
  FFmpegChunkDecoder decoder;
  timeline::EncodedChunk chunk;
  auto out = decoder.Decode(chunk);
  EXPECT_EQ(out.status, DecodeStatus::kError);
  EXPECT_EQ(out.frame, nullptr);
}

TEST(FFmpegChunkDecoderContract, CodecStringsMapToDecoders) {
  EXPECT_NE(decode::CodecIdFromString("avc1.64001f"), 0);
  EXPECT_NE(decode::CodecIdFromString("vp09.00.10.08"), 0);
  EXPECT_EQ(decode::CodecIdFromString("mp4a.40.2"), 0);
  EXPECT_EQ(decode::CodecIdFromString(""), 0);
}
