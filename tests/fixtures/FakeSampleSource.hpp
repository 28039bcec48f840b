// Repository: Moshline
// Component: Fake Sample Source (test only)
// Purpose: ISampleSource serving registered buffers; unknown urls fail.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_TESTS_FIXTURES_FAKE_SAMPLE_SOURCE_HPP_
#define MOSHLINE_TESTS_FIXTURES_FAKE_SAMPLE_SOURCE_HPP_

#include <map>
#include <string>
#include <vector>

#include "moshline/audio/ISampleSource.hpp"

namespace moshline::testing {

class FakeSampleSource : public audio::ISampleSource {
 public:
  void Register(const std::string& url, std::vector<float> samples) {
    samples_[url] = std::move(samples);
  }

  audio::SampleLoadResult Load(const std::string& url, int32_t sample_rate) override {
    ++load_calls[url];
    last_rate = sample_rate;
    auto it = samples_.find(url);
    if (it == samples_.end()) {
      return audio::SampleLoadResult::Failure("404 " + url);
    }
    return audio::SampleLoadResult::Success(it->second);
  }

  std::map<std::string, int> load_calls;
  int32_t last_rate = 0;

 private:
  std::map<std::string, std::vector<float>> samples_;
};

}  // namespace moshline::testing

#endif  // MOSHLINE_TESTS_FIXTURES_FAKE_SAMPLE_SOURCE_HPP_
