// Repository: Moshline
// Component: Raster Surface
// Purpose: Fixed-size RGBA drawing target sampled by the capture sink.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_CAPTURE_RASTER_SURFACE_HPP_
#define MOSHLINE_CAPTURE_RASTER_SURFACE_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace moshline::capture {

// One decoded picture, tightly packed RGBA (stride = width * 4).
// Decoders may subclass to tie extra resources to the frame lifetime.
struct RasterFrame {
  int32_t width = 0;
  int32_t height = 0;
  std::vector<uint8_t> rgba;

  virtual ~RasterFrame() = default;
};

class RasterSurface {
 public:
  static constexpr int32_t kBytesPerPixel = 4;

  RasterSurface(int32_t width, int32_t height);

  // Draw `frame` at (0, 0), clipped to the surface. Pixels outside the
  // frame keep their previous content.
  void Draw(const RasterFrame& frame);

  // Fill with opaque black.
  void Clear();

  int32_t width() const { return width_; }
  int32_t height() const { return height_; }
  size_t stride() const { return static_cast<size_t>(width_) * kBytesPerPixel; }
  const std::vector<uint8_t>& pixels() const { return pixels_; }

  // Number of Draw() calls since construction.
  int64_t draw_count() const { return draw_count_; }

 private:
  int32_t width_;
  int32_t height_;
  std::vector<uint8_t> pixels_;
  int64_t draw_count_ = 0;
};

}  // namespace moshline::capture

#endif  // MOSHLINE_CAPTURE_RASTER_SURFACE_HPP_
