// Repository: Moshline
// Component: Rational Frame Rate
// Purpose: Exact frame-rate arithmetic shared by the capture clock and the
//          audio track so frame counts and sample counts come from one formula.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_TIMELINE_RATIONAL_FPS_HPP_
#define MOSHLINE_TIMELINE_RATIONAL_FPS_HPP_

#include <cstdint>

namespace moshline::timeline {

namespace detail {

constexpr int64_t GreatestCommonDivisor(int64_t a, int64_t b) {
  while (b != 0) {
    const int64_t rem = a % b;
    a = b;
    b = rem;
  }
  return a;
}

}  // namespace detail

// Frames per second as num/den in lowest terms. Anything that is not a
// positive ratio collapses to 0/1, which IsValid() rejects.
struct RationalFps {
  int64_t num;
  int64_t den;

  constexpr RationalFps(int64_t n = 0, int64_t d = 1) : num(n), den(d) {
    if (d < 0) {
      num = -n;
      den = -d;
    }
    if (num <= 0 || den <= 0) {
      num = 0;
      den = 1;
    } else {
      const int64_t g = detail::GreatestCommonDivisor(num, den);
      num /= g;
      den /= g;
    }
  }

  constexpr bool IsValid() const { return num > 0 && den > 0; }

  constexpr double ToDouble() const {
    return static_cast<double>(num) / static_cast<double>(den);
  }

  constexpr double FrameDurationSec() const {
    return IsValid() ? static_cast<double>(den) / static_cast<double>(num) : 0.0;
  }

  // round(frames * sample_rate * den / num). Every repeat boundary in the
  // audio track is placed with this, so boundaries never drift.
  constexpr int64_t SamplesFromFrames(int64_t frames, int64_t sample_rate) const {
    if (!IsValid() || frames <= 0 || sample_rate <= 0) return 0;
    const int64_t scaled = frames * sample_rate * den;
    return (2 * scaled + num) / (2 * num);
  }

  constexpr bool operator==(const RationalFps& other) const {
    return num == other.num && den == other.den;
  }
  constexpr bool operator!=(const RationalFps& other) const { return !(*this == other); }
};

constexpr RationalFps FPS_2997{30000, 1001};
constexpr RationalFps FPS_30{30, 1};
constexpr RationalFps FPS_24{24, 1};
constexpr RationalFps FPS_25{25, 1};

}  // namespace moshline::timeline

#endif  // MOSHLINE_TIMELINE_RATIONAL_FPS_HPP_
