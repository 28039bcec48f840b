// Repository: Moshline
// Component: Recording Capture Sink (test only)
// Purpose: ICaptureSink that records captured frame indices and pixels.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_TESTS_FIXTURES_RECORDING_CAPTURE_SINK_HPP_
#define MOSHLINE_TESTS_FIXTURES_RECORDING_CAPTURE_SINK_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "moshline/capture/ICaptureSink.hpp"

namespace moshline::testing {

class RecordingCaptureSink : public capture::ICaptureSink {
 public:
  bool Start(const timeline::Settings& s, timeline::RationalFps f) override {
    ++start_calls;
    if (fail_start) {
      last_error_ = "scripted start failure";
      return false;
    }
    settings = s;
    fps = f;
    return true;
  }

  bool CaptureFrame(const capture::RasterSurface& surface, int64_t frame_index) override {
    if (frame_index == fail_at_frame) {
      last_error_ = "scripted capture failure";
      return false;
    }
    frame_indices.push_back(frame_index);
    first_bytes.push_back(surface.pixels().empty() ? 0 : surface.pixels()[0]);
    return true;
  }

  bool Finish(timeline::MediaBlob& out) override {
    ++finish_calls;
    if (fail_finish) {
      last_error_ = "scripted finish failure";
      return false;
    }
    out.mime_type = "video/mp4";
    out.bytes.assign(frame_indices.size() + 1, 'v');
    return true;
  }

  void Abort() override { ++abort_calls; }

  std::string LastError() const override { return last_error_; }

  // Script
  bool fail_start = false;
  bool fail_finish = false;
  int64_t fail_at_frame = -1;

  // Observations
  int start_calls = 0;
  int finish_calls = 0;
  int abort_calls = 0;
  timeline::Settings settings;
  timeline::RationalFps fps;
  std::vector<int64_t> frame_indices;
  std::vector<uint8_t> first_bytes;

 private:
  std::string last_error_;
};

}  // namespace moshline::testing

#endif  // MOSHLINE_TESTS_FIXTURES_RECORDING_CAPTURE_SINK_HPP_
