// Repository: Moshline
// Component: Timeline Expander
// Purpose: Segment clamping and chunk stream expansion
// Copyright (c) 2025 RetroVue

#include "moshline/timeline/TimelineExpander.hpp"

#include <algorithm>
#include <sstream>

namespace moshline::timeline {

Segment ClampSegment(const Segment& segment, int64_t source_length) {
  Segment out = segment;
  if (source_length <= 0) {
    out.from = 0;
    out.to = 0;
    return out;
  }
  const int64_t from = std::clamp<int64_t>(segment.from, 0, source_length - 1);
  const int64_t wanted_to = std::max(segment.to, from + 1);
  out.from = from;
  out.to = std::clamp<int64_t>(wanted_to, from + 1, source_length);
  return out;
}

ResolveResult ResolveSegments(const std::vector<Segment>& segments,
                              const SourceMap& sources) {
  std::vector<Segment> resolved;
  resolved.reserve(segments.size());

  for (size_t i = 0; i < segments.size(); ++i) {
    const auto& seg = segments[i];
    auto it = sources.find(seg.source_id);
    if (it == sources.end()) {
      std::ostringstream oss;
      oss << "segment " << i << " references unknown source '" << seg.source_id << "'";
      return ResolveResult::Failure(RenderError::kUnknownSource, oss.str());
    }
    resolved.push_back(ClampSegment(seg, static_cast<int64_t>(it->second.size())));
  }

  return ResolveResult::Success(std::move(resolved));
}

int64_t CountExpandedFrames(const std::vector<Segment>& resolved) {
  int64_t total = 0;
  for (const auto& seg : resolved) {
    total += seg.TotalFrames();
  }
  return total;
}

ExpandResult Expand(const std::vector<Segment>& segments,
                    const SourceMap& sources) {
  auto resolved = ResolveSegments(segments, sources);
  if (!resolved.ok) {
    return ExpandResult::Failure(resolved.error, resolved.detail);
  }

  std::vector<const EncodedChunk*> out;
  out.reserve(static_cast<size_t>(CountExpandedFrames(resolved.segments)));

  for (const auto& seg : resolved.segments) {
    const ChunkList& source = sources.at(seg.source_id);
    for (uint32_t r = 0; r < seg.repeat; ++r) {
      for (int64_t i = seg.from; i < seg.to; ++i) {
        out.push_back(&source[static_cast<size_t>(i)]);
      }
    }
  }

  return ExpandResult::Success(std::move(out));
}

}  // namespace moshline::timeline
