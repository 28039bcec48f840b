// Repository: Moshline
// Component: Time Source Interface
// Purpose: Monotonic millisecond clock used for render deadlines and journal
//          timestamps. Tests substitute a deterministic source.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_TIMING_ITIME_SOURCE_HPP_
#define MOSHLINE_TIMING_ITIME_SOURCE_HPP_

#include <chrono>
#include <cstdint>

namespace moshline::timing {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowMs() const = 0;
};

class SteadyTimeSource : public ITimeSource {
 public:
  int64_t NowMs() const override {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
  }
};

}  // namespace moshline::timing

#endif  // MOSHLINE_TIMING_ITIME_SOURCE_HPP_
