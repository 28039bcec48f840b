// Repository: Moshline
// Component: Deterministic Time Source (test only)
// Purpose: Manually advanced millisecond clock for deadline tests.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_TESTS_SUPPORT_DETERMINISTIC_TIME_SOURCE_HPP_
#define MOSHLINE_TESTS_SUPPORT_DETERMINISTIC_TIME_SOURCE_HPP_

#include <atomic>
#include <cstdint>

#include "moshline/timing/ITimeSource.hpp"

namespace moshline::testing {

class DeterministicTimeSource : public timing::ITimeSource {
 public:
  explicit DeterministicTimeSource(int64_t start_ms = 0)
      : now_ns_(start_ms * 1'000'000) {}

  int64_t NowMs() const override {
    return now_ns_.load() / 1'000'000;
  }

  void AdvanceNs(int64_t delta_ns) {
    now_ns_ += delta_ns;
  }

  void AdvanceMs(int64_t delta) {
    now_ns_ += delta * 1'000'000;
  }

  void SetMs(int64_t value) {
    now_ns_ = value * 1'000'000;
  }

 private:
  std::atomic<int64_t> now_ns_;
};

}  // namespace moshline::testing

#endif  // MOSHLINE_TESTS_SUPPORT_DETERMINISTIC_TIME_SOURCE_HPP_
