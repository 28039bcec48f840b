// Repository: Moshline
// Component: Timeline Document
// Purpose: JSON timeline file format read by the command-line renderer.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_TIMELINE_TIMELINE_DOCUMENT_HPP_
#define MOSHLINE_TIMELINE_TIMELINE_DOCUMENT_HPP_

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "moshline/timeline/MoshTypes.hpp"
#include "moshline/timeline/RationalFps.hpp"

namespace moshline::timeline {

// A timeline file:
//
//   {
//     "fps": "30000/1001",
//     "volume": 0.8,
//     "settings": { "width": 640, "height": 480 },
//     "sources": { "a": "/media/a.mp4", "b": "/media/b.mp4" },
//     "segments": [
//       { "source": "a", "from": 0, "to": 10, "repeat": 1 },
//       { "source": "b", "from": 3, "to": 5, "repeat": 4,
//         "audio": { "type": "noise", "noise": "pink", "volume": 0.5 } }
//     ]
//   }
//
// "fps", "volume", "settings" and "sources" are optional. Audio types are
// "noise" (with "noise": white|pink|brown), "sine" (with "frequency") and
// "sample" (with "url").
struct TimelineDocument {
  RationalFps fps = FPS_30;
  float volume = 1.0f;
  Settings settings;
  std::map<std::string, std::string> sources;  // source id -> media path
  std::vector<Segment> segments;

  // Parse a timeline from JSON. Returns empty optional on parse or
  // validation failure; `error` receives the reason when non-null.
  static std::optional<TimelineDocument> FromJson(const std::string& json_str,
                                                  std::string* error = nullptr);

  std::string ToJson() const;

  // Every segment names a listed source (when sources are listed), the
  // raster is non-empty and the rate is valid.
  bool IsValid(std::string* error = nullptr) const;

  // Distinct source ids in first-use order.
  std::vector<std::string> ReferencedSources() const;
};

// "30000/1001" or "25" -> RationalFps. Empty optional when malformed.
std::optional<RationalFps> ParseFrameRate(const std::string& text);

}  // namespace moshline::timeline

#endif  // MOSHLINE_TIMELINE_TIMELINE_DOCUMENT_HPP_
