// Repository: Moshline
// Component: Raster Surface
// Purpose: Fixed-size RGBA drawing target sampled by the capture sink.
// Copyright (c) 2025 RetroVue

#include "moshline/capture/RasterSurface.hpp"

#include <algorithm>
#include <cstring>

namespace moshline::capture {

RasterSurface::RasterSurface(int32_t width, int32_t height)
    : width_(std::max(0, width)), height_(std::max(0, height)) {
  pixels_.resize(stride() * static_cast<size_t>(height_));
  Clear();
}

void RasterSurface::Clear() {
  for (size_t i = 0; i + 3 < pixels_.size(); i += kBytesPerPixel) {
    pixels_[i] = 0;
    pixels_[i + 1] = 0;
    pixels_[i + 2] = 0;
    pixels_[i + 3] = 0xFF;
  }
}

void RasterSurface::Draw(const RasterFrame& frame) {
  ++draw_count_;
  const int32_t rows = std::min(height_, frame.height);
  const int32_t cols = std::min(width_, frame.width);
  if (rows <= 0 || cols <= 0) return;

  const size_t src_stride = static_cast<size_t>(frame.width) * kBytesPerPixel;
  const size_t row_bytes = static_cast<size_t>(cols) * kBytesPerPixel;
  if (frame.rgba.size() < src_stride * static_cast<size_t>(frame.height)) return;

  for (int32_t y = 0; y < rows; ++y) {
    std::memcpy(pixels_.data() + static_cast<size_t>(y) * stride(),
                frame.rgba.data() + static_cast<size_t>(y) * src_stride, row_bytes);
  }
}

}  // namespace moshline::capture
