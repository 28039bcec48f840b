// Repository: Moshline
// Component: Mosh Timeline Types
// Purpose: Data structures for the segment timeline compositor
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_TIMELINE_MOSH_TYPES_HPP_
#define MOSHLINE_TIMELINE_MOSH_TYPES_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace moshline::timeline {

// =============================================================================
// Error Codes
// =============================================================================

enum class RenderError {
  // No error
  kNone = 0,

  // Empty segment list, empty expansion, bad settings
  kInvalidRequest,

  // Segment names a source that was not loaded
  kUnknownSource,

  // Source could not be demuxed into chunks
  kSourceLoadError,

  // Malformed decoder config or bitstream
  kDecodeError,

  // Capture sink failure
  kEncodeError,

  // Every mux invocation failed
  kMuxError,

  // Render deadline exceeded; item discarded
  kTimeout,

  // Output queue has no free slot
  kQueueFull,
};

// Convert error code to string for logging
const char* RenderErrorToString(RenderError error);

// =============================================================================
// Encoded Chunks
// =============================================================================

enum class ChunkKind : int32_t {
  kKey = 0,    // Decodable on its own (GOP anchor)
  kDelta = 1,  // Inter-predicted from preceding decoder state
};

inline const char* ChunkKindName(ChunkKind k) {
  switch (k) {
    case ChunkKind::kKey:   return "key";
    case ChunkKind::kDelta: return "delta";
  }
  return "unknown";
}

// One compressed frame. Owned by the source map; the expander only borrows.
struct EncodedChunk {
  ChunkKind kind = ChunkKind::kDelta;
  uint64_t timestamp_us = 0;
  uint64_t duration_us = 0;
  std::vector<uint8_t> payload;
};

using ChunkList = std::vector<EncodedChunk>;
using SourceMap = std::map<std::string, ChunkList>;

// Codec parameters for one source, produced by the source reader.
struct DecoderConfig {
  std::string codec;                  // e.g. "avc1.64001f"
  int32_t coded_width = 0;
  int32_t coded_height = 0;
  std::vector<uint8_t> description;   // avcC / hvcC extradata

  bool IsValid() const { return !codec.empty(); }
};

// =============================================================================
// Audio Specification
// =============================================================================

enum class NoiseType : int32_t {
  kWhite = 0,
  kPink = 1,
  kBrown = 2,
};

inline const char* NoiseTypeName(NoiseType t) {
  switch (t) {
    case NoiseType::kWhite: return "white";
    case NoiseType::kPink:  return "pink";
    case NoiseType::kBrown: return "brown";
  }
  return "unknown";
}

struct NoiseSpec {
  NoiseType noise_type = NoiseType::kWhite;
  std::optional<float> volume;
};

struct SineSpec {
  float frequency_hz = 440.0f;
  std::optional<float> volume;
};

struct SampleSpec {
  std::string url;
  std::optional<float> volume;
};

using AudioSpec = std::variant<NoiseSpec, SineSpec, SampleSpec>;

// Per-spec volume (default 1.0) before the global timeline volume.
float AudioSpecVolume(const AudioSpec& spec);

// =============================================================================
// Segment
// =============================================================================

// Frame range [from, to) of one source, played `repeat` times.
// Caller-supplied bounds may be out of range; they are clamped against the
// source length before use (see ClampSegment).
struct Segment {
  std::string source_id;
  int64_t from = 0;
  int64_t to = 0;
  uint32_t repeat = 1;
  std::optional<AudioSpec> audio;

  // Frames of one play. Only meaningful on clamped segments.
  int64_t SinglePlayFrames() const { return to > from ? to - from : 0; }
  int64_t TotalFrames() const { return SinglePlayFrames() * static_cast<int64_t>(repeat); }
};

// =============================================================================
// Output
// =============================================================================

struct Settings {
  int32_t width = 640;
  int32_t height = 480;
};

struct MediaBlob {
  std::string mime_type;
  std::vector<uint8_t> bytes;

  bool Empty() const { return bytes.empty(); }
};

}  // namespace moshline::timeline

#endif  // MOSHLINE_TIMELINE_MOSH_TYPES_HPP_
