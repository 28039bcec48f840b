// Repository: Moshline
// Component: Timeline Expander
// Purpose: Turn a segment list plus per-source chunk arrays into one flat,
//          ordered chunk stream (the datamosh operation itself).
// Copyright (c) 2025 RetroVue
//
// Everything here is pure and deterministic. Randomized segment selection
// lives in MoshPresets and only produces Segment lists.

#ifndef MOSHLINE_TIMELINE_TIMELINE_EXPANDER_HPP_
#define MOSHLINE_TIMELINE_TIMELINE_EXPANDER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "moshline/timeline/MoshTypes.hpp"

namespace moshline::timeline {

// Clamp a segment against a source of `source_length` chunks:
//   from' = clamp(from, 0, len-1)
//   to'   = clamp(max(to, from+1), from'+1, len)
// A zero-length source yields from' = to' = 0 (no frames).
// Idempotent: clamping a clamped segment returns it unchanged.
Segment ClampSegment(const Segment& segment, int64_t source_length);

struct ResolveResult {
  bool ok;
  RenderError error;
  std::string detail;
  std::vector<Segment> segments;  // Clamped, same order as input

  static ResolveResult Success(std::vector<Segment> segs) {
    return {true, RenderError::kNone, "", std::move(segs)};
  }
  static ResolveResult Failure(RenderError e, std::string d) {
    return {false, e, std::move(d), {}};
  }
};

// Clamp every segment against its source. Both the video expansion and the
// audio synthesis consume this output, so they share one set of bounds.
// Fails with kUnknownSource when a segment names a source not in `sources`.
ResolveResult ResolveSegments(const std::vector<Segment>& segments,
                              const SourceMap& sources);

// Sum of repeat_i * (to_i - from_i) over already-clamped segments.
int64_t CountExpandedFrames(const std::vector<Segment>& resolved);

struct ExpandResult {
  bool ok;
  RenderError error;
  std::string detail;
  // Borrowed from the source map; valid while `sources` is alive and
  // unmodified. Chunk kinds are the originals.
  std::vector<const EncodedChunk*> chunks;

  static ExpandResult Success(std::vector<const EncodedChunk*> c) {
    return {true, RenderError::kNone, "", std::move(c)};
  }
  static ExpandResult Failure(RenderError e, std::string d) {
    return {false, e, std::move(d), {}};
  }
};

// For each segment in order: clamp, take source[from':to'], append it
// `repeat` times. Output length is CountExpandedFrames(resolved segments).
ExpandResult Expand(const std::vector<Segment>& segments,
                    const SourceMap& sources);

}  // namespace moshline::timeline

#endif  // MOSHLINE_TIMELINE_TIMELINE_EXPANDER_HPP_
