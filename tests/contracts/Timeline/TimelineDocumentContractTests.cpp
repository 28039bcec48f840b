// Repository: Moshline
// Component: Timeline Document Contract Tests
// Purpose: Timeline files parse into segments with audio, reject malformed
//          input with a reason, and survive a write/read cycle.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include "moshline/timeline/TimelineDocument.hpp"

using namespace moshline::timeline;

namespace {

constexpr const char* kFullTimeline = R"({
  "fps": "30000/1001",
  "volume": 0.8,
  "settings": { "width": 320, "height": 240 },
  "sources": { "a": "/media/a.mp4", "b": "/media/b.mp4" },
  "segments": [
    { "source": "a", "from": 0, "to": 10 },
    { "source": "b", "from": 3, "to": 5, "repeat": 4,
      "audio": { "type": "noise", "noise": "pink", "volume": 0.5 } },
    { "source": "a", "from": 20, "to": 22, "repeat": 0,
      "audio": { "type": "sine", "frequency": 220 } },
    { "source": "b", "from": 7, "to": 9,
      "audio": { "type": "sample", "url": "https://example.invalid/hit.wav" } }
  ]
})";

std::string ErrorFor(const std::string& json) {
  std::string error;
  EXPECT_FALSE(TimelineDocument::FromJson(json, &error).has_value()) << json;
  return error;
}

}  // namespace

TEST(TimelineDocumentContract, ParsesFullTimeline) {
  std::string error;
  auto doc = TimelineDocument::FromJson(kFullTimeline, &error);
  ASSERT_TRUE(doc.has_value()) << error;

  EXPECT_EQ(doc->fps, FPS_2997);
  EXPECT_FLOAT_EQ(doc->volume, 0.8f);
  EXPECT_EQ(doc->settings.width, 320);
  EXPECT_EQ(doc->settings.height, 240);
  ASSERT_EQ(doc->sources.size(), 2u);
  EXPECT_EQ(doc->sources.at("b"), "/media/b.mp4");

  ASSERT_EQ(doc->segments.size(), 4u);
  const auto& first = doc->segments[0];
  EXPECT_EQ(first.source_id, "a");
  EXPECT_EQ(first.from, 0);
  EXPECT_EQ(first.to, 10);
  EXPECT_EQ(first.repeat, 1u);
  EXPECT_FALSE(first.audio.has_value());

  const auto& noisy = doc->segments[1];
  EXPECT_EQ(noisy.repeat, 4u);
  ASSERT_TRUE(noisy.audio.has_value());
  const auto* noise = std::get_if<NoiseSpec>(&*noisy.audio);
  ASSERT_NE(noise, nullptr);
  EXPECT_EQ(noise->noise_type, NoiseType::kPink);
  EXPECT_FLOAT_EQ(AudioSpecVolume(*noisy.audio), 0.5f);

  EXPECT_EQ(doc->segments[2].repeat, 0u);
  const auto* sine = std::get_if<SineSpec>(&*doc->segments[2].audio);
  ASSERT_NE(sine, nullptr);
  EXPECT_FLOAT_EQ(sine->frequency_hz, 220.0f);
  EXPECT_FALSE(sine->volume.has_value());

  const auto* sample = std::get_if<SampleSpec>(&*doc->segments[3].audio);
  ASSERT_NE(sample, nullptr);
  EXPECT_EQ(sample->url, "https://example.invalid/hit.wav");
}

TEST(TimelineDocumentContract, DefaultsWhenOptionalFieldsAbsent) {
  auto doc = TimelineDocument::FromJson(
      R"({"segments":[{"source":"clip","from":1,"to":4}]})");
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(doc->fps, FPS_30);
  EXPECT_FLOAT_EQ(doc->volume, 1.0f);
  EXPECT_EQ(doc->settings.width, 640);
  EXPECT_EQ(doc->settings.height, 480);
  EXPECT_TRUE(doc->sources.empty());
}

TEST(TimelineDocumentContract, IntegerFrameRate) {
  auto doc = TimelineDocument::FromJson(
      R"({"fps": 25, "segments":[{"source":"clip","from":0,"to":2}]})");
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(doc->fps, FPS_25);
}

TEST(TimelineDocumentContract, OutOfRangeBoundsAreKeptForClamping) {
  auto doc = TimelineDocument::FromJson(
      R"({"segments":[{"source":"clip","from":4000000000,"to":100000}]})");
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(doc->segments[0].from, 4000000000);
  EXPECT_EQ(doc->segments[0].to, 100000);
}

TEST(TimelineDocumentContract, RejectsBoundsOutsideFrameIndexRange) {
  EXPECT_NE(ErrorFor(R"({"segments":[{"source":"a","from":-5,"to":3}]})").find("from"),
            std::string::npos);
  EXPECT_NE(ErrorFor(R"({"segments":[{"source":"a","from":9223372036854775807,"to":3}]})")
                .find("from"),
            std::string::npos);
  EXPECT_NE(ErrorFor(R"({"segments":[{"source":"a","from":0,"to":4294967296}]})").find("to"),
            std::string::npos);
  EXPECT_TRUE(TimelineDocument::FromJson(
                  R"({"segments":[{"source":"a","from":4294967295,"to":4294967295}]})")
                  .has_value());
}

TEST(TimelineDocumentContract, RejectsMalformedDocuments) {
  EXPECT_FALSE(ErrorFor("").empty());
  EXPECT_NE(ErrorFor(R"({"fps":"30"})").find("segments"), std::string::npos);
  EXPECT_NE(ErrorFor(R"({"segments":[]})").find("no segments"), std::string::npos);
  EXPECT_NE(ErrorFor(R"({"segments":[{"from":0,"to":2}]})").find("source"),
            std::string::npos);
  EXPECT_NE(ErrorFor(R"({"segments":[{"source":"a","to":2}]})").find("from"),
            std::string::npos);
  EXPECT_NE(ErrorFor(R"({"segments":[{"source":"a","from":0,"to":2,"repeat":-1}]})")
                .find("repeat"),
            std::string::npos);
  EXPECT_NE(ErrorFor(R"({"fps":"abc","segments":[{"source":"a","from":0,"to":2}]})")
                .find("fps"),
            std::string::npos);
}

TEST(TimelineDocumentContract, RejectsBadAudio) {
  EXPECT_NE(ErrorFor(R"({"segments":[{"source":"a","from":0,"to":2,
                         "audio":{"type":"noise","noise":"blue"}}]})")
                .find("blue"),
            std::string::npos);
  EXPECT_NE(ErrorFor(R"({"segments":[{"source":"a","from":0,"to":2,
                         "audio":{"type":"sample"}}]})")
                .find("url"),
            std::string::npos);
  EXPECT_NE(ErrorFor(R"({"segments":[{"source":"a","from":0,"to":2,
                         "audio":{"type":"square"}}]})")
                .find("square"),
            std::string::npos);
}

TEST(TimelineDocumentContract, SegmentsMustNameListedSources) {
  const std::string error = ErrorFor(
      R"({"sources":{"a":"/media/a.mp4"},
          "segments":[{"source":"a","from":0,"to":2},{"source":"z","from":0,"to":2}]})");
  EXPECT_NE(error.find("'z'"), std::string::npos);
}

TEST(TimelineDocumentContract, ValidationRejectsEmptyRaster) {
  TimelineDocument doc;
  doc.segments.push_back(Segment{"a", 0, 1, 1, std::nullopt});
  doc.settings.width = 0;
  std::string error;
  EXPECT_FALSE(doc.IsValid(&error));
  EXPECT_NE(error.find("width"), std::string::npos);

  doc.settings.width = 64;
  doc.volume = -0.1f;
  EXPECT_FALSE(doc.IsValid());
  doc.volume = 0.0f;
  EXPECT_TRUE(doc.IsValid());
}

TEST(TimelineDocumentContract, ReferencedSourcesInFirstUseOrder) {
  auto doc = TimelineDocument::FromJson(kFullTimeline);
  ASSERT_TRUE(doc.has_value());
  const std::vector<std::string> expected = {"a", "b"};
  EXPECT_EQ(doc->ReferencedSources(), expected);
}

TEST(TimelineDocumentContract, WrittenTimelineReadsBack) {
  auto doc = TimelineDocument::FromJson(kFullTimeline);
  ASSERT_TRUE(doc.has_value());
  doc->sources["a"] = "/media/with \"quote\".mp4";

  std::string error;
  auto again = TimelineDocument::FromJson(doc->ToJson(), &error);
  ASSERT_TRUE(again.has_value()) << error;
  EXPECT_EQ(again->fps, doc->fps);
  EXPECT_EQ(again->settings.width, doc->settings.width);
  EXPECT_EQ(again->sources, doc->sources);
  ASSERT_EQ(again->segments.size(), doc->segments.size());
  for (size_t i = 0; i < doc->segments.size(); ++i) {
    EXPECT_EQ(again->segments[i].source_id, doc->segments[i].source_id);
    EXPECT_EQ(again->segments[i].from, doc->segments[i].from);
    EXPECT_EQ(again->segments[i].to, doc->segments[i].to);
    EXPECT_EQ(again->segments[i].repeat, doc->segments[i].repeat);
    EXPECT_EQ(again->segments[i].audio.has_value(), doc->segments[i].audio.has_value());
  }
}

TEST(TimelineDocumentContract, FrameRateText) {
  EXPECT_EQ(ParseFrameRate("30000/1001"), std::optional<RationalFps>(FPS_2997));
  EXPECT_EQ(ParseFrameRate(" 24 "), std::optional<RationalFps>(FPS_24));
  EXPECT_EQ(ParseFrameRate("60/2"), std::optional<RationalFps>(FPS_30));
  EXPECT_FALSE(ParseFrameRate("0").has_value());
  EXPECT_FALSE(ParseFrameRate("30/0").has_value());
  EXPECT_FALSE(ParseFrameRate("-30").has_value());
  EXPECT_FALSE(ParseFrameRate("fast").has_value());
  EXPECT_FALSE(ParseFrameRate("99999999999999999999999").has_value());
}
