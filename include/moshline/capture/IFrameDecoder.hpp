// Repository: Moshline
// Component: Frame Decoder Interface
// Purpose: Chunk -> raster frame decode seam used by the CaptureScheduler.
// Copyright (c) 2025 RetroVue
//
// The decoder keeps reference state across chunks. Feeding delta chunks
// whose original key frame is absent is expected and must not be treated
// as an error by implementations; only malformed input is.

#ifndef MOSHLINE_CAPTURE_IFRAME_DECODER_HPP_
#define MOSHLINE_CAPTURE_IFRAME_DECODER_HPP_

#include <memory>
#include <string>

#include "moshline/capture/RasterSurface.hpp"
#include "moshline/timeline/MoshTypes.hpp"

namespace moshline::capture {

enum class DecodeStatus {
  kFrame,    // A picture is available
  kNoFrame,  // Decoder buffered the chunk; nothing to draw yet
  kError,    // Malformed bitstream or decoder failure
};

struct DecodeOutput {
  DecodeStatus status = DecodeStatus::kNoFrame;
  std::unique_ptr<RasterFrame> frame;
  std::string detail;
};

// Production: FFmpegChunkDecoder. Tests: FakeFrameDecoder.
class IFrameDecoder {
 public:
  virtual ~IFrameDecoder() = default;

  // Must succeed before Decode(). Returns false on malformed config.
  virtual bool Configure(const timeline::DecoderConfig& config) = 0;

  // Output frames are scaled to `width` x `height` RGBA.
  virtual void SetOutputSize(int32_t width, int32_t height) = 0;

  virtual DecodeOutput Decode(const timeline::EncodedChunk& chunk) = 0;

  // Drop reference state and configuration.
  virtual void Reset() = 0;
};

}  // namespace moshline::capture

#endif  // MOSHLINE_CAPTURE_IFRAME_DECODER_HPP_
