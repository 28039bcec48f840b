// Repository: Moshline
// Component: Mosh Timeline Types
// Purpose: Error naming and audio spec helpers
// Copyright (c) 2025 RetroVue

#include "moshline/timeline/MoshTypes.hpp"

namespace moshline::timeline {

const char* RenderErrorToString(RenderError error) {
  switch (error) {
    case RenderError::kNone:
      return "NONE";
    case RenderError::kInvalidRequest:
      return "INVALID_REQUEST";
    case RenderError::kUnknownSource:
      return "UNKNOWN_SOURCE";
    case RenderError::kSourceLoadError:
      return "SOURCE_LOAD_ERROR";
    case RenderError::kDecodeError:
      return "DECODE_ERROR";
    case RenderError::kEncodeError:
      return "ENCODE_ERROR";
    case RenderError::kMuxError:
      return "MUX_ERROR";
    case RenderError::kTimeout:
      return "TIMEOUT";
    case RenderError::kQueueFull:
      return "QUEUE_FULL";
  }
  return "UNKNOWN";
}

float AudioSpecVolume(const AudioSpec& spec) {
  return std::visit(
      [](const auto& s) -> float { return s.volume.value_or(1.0f); }, spec);
}

}  // namespace moshline::timeline
