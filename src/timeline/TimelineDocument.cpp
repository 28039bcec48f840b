// Repository: Moshline
// Component: Timeline Document
// Purpose: Parse and validate timeline files from JSON.
// Copyright (c) 2025 RetroVue

#include "moshline/timeline/TimelineDocument.hpp"

#include <cstdint>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>

namespace moshline::timeline {

namespace {
  // Fixed, shallow schema: parsed by hand like the other config readers.

  constexpr const char* kStringPattern = R"re("((?:[^"\\]|\\.)*)")re";

  std::string Unescape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
      if (s[i] == '\\' && i + 1 < s.size()) {
        const char c = s[++i];
        switch (c) {
          case 'n': out += '\n'; break;
          case 't': out += '\t'; break;
          default:  out += c;    break;
        }
      } else {
        out += s[i];
      }
    }
    return out;
  }

  std::string JsonEscape(const std::string& s) {
    std::string out;
    for (char c : s) {
      if (c == '"' || c == '\\') out += '\\';
      out += c;
    }
    return out;
  }

  // Position of the bracket closing the one at `open_pos`, skipping quoted
  // strings. npos when unbalanced.
  size_t MatchingClose(const std::string& json, size_t open_pos) {
    const char open = json[open_pos];
    const char close = open == '{' ? '}' : ']';
    int depth = 0;
    bool in_string = false;
    for (size_t pos = open_pos; pos < json.size(); ++pos) {
      const char c = json[pos];
      if (in_string) {
        if (c == '\\') {
          ++pos;
        } else if (c == '"') {
          in_string = false;
        }
        continue;
      }
      if (c == '"') {
        in_string = true;
      } else if (c == open) {
        ++depth;
      } else if (c == close) {
        if (--depth == 0) return pos;
      }
    }
    return std::string::npos;
  }

  // Extract a nested object or array ("field": { ... } / "field": [ ... ]).
  // `begin`/`end` receive the span of the whole field for removal.
  bool ExtractNested(const std::string& json, const std::string& field_name, char open,
                     std::string& out_json, size_t* begin = nullptr, size_t* end = nullptr) {
    const std::string bracket = open == '{' ? "\\{" : "\\[";
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*" + bracket);
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) {
      return false;
    }
    const size_t open_pos = static_cast<size_t>(match.position() + match.length() - 1);
    const size_t close_pos = MatchingClose(json, open_pos);
    if (close_pos == std::string::npos) {
      return false;
    }
    out_json = json.substr(open_pos, close_pos - open_pos + 1);
    if (begin) *begin = static_cast<size_t>(match.position());
    if (end) *end = close_pos + 1;
    return true;
  }

  // Remove a nested field so its keys do not shadow the enclosing object's.
  std::string StripNested(const std::string& json, const std::string& field_name, char open) {
    std::string ignored;
    size_t begin = 0;
    size_t end = 0;
    if (!ExtractNested(json, field_name, open, ignored, &begin, &end)) {
      return json;
    }
    return json.substr(0, begin) + json.substr(end);
  }

  bool ExtractString(const std::string& json, const std::string& field_name,
                     std::string& out_value) {
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*" + kStringPattern);
    std::smatch match;
    if (std::regex_search(json, match, pattern)) {
      out_value = Unescape(match[1].str());
      return true;
    }
    return false;
  }

  // 1 = found, 0 = absent, -1 = present but malformed.
  int ExtractInt(const std::string& json, const std::string& field_name, int64_t& out_value) {
    std::regex present("\"" + field_name + "\"\\s*:");
    if (!std::regex_search(json, present)) {
      return 0;
    }
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*(-?\\d+)\\s*[,}\\]]");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) {
      return -1;
    }
    try {
      out_value = std::stoll(match[1].str());
    } catch (const std::out_of_range&) {
      return -1;
    }
    return 1;
  }

  int ExtractFloat(const std::string& json, const std::string& field_name, float& out_value) {
    std::regex present("\"" + field_name + "\"\\s*:");
    if (!std::regex_search(json, present)) {
      return 0;
    }
    std::regex pattern("\"" + field_name +
                       "\"\\s*:\\s*(-?\\d+(?:\\.\\d+)?(?:[eE][-+]?\\d+)?)");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) {
      return -1;
    }
    try {
      out_value = std::stof(match[1].str());
    } catch (const std::out_of_range&) {
      return -1;
    }
    return 1;
  }

  // Top-level objects of a JSON array.
  std::vector<std::string> SplitObjects(const std::string& array_json) {
    std::vector<std::string> objects;
    size_t pos = 1;
    while (pos < array_json.size()) {
      const size_t start = array_json.find('{', pos);
      if (start == std::string::npos) break;
      const size_t end = MatchingClose(array_json, start);
      if (end == std::string::npos) break;
      objects.push_back(array_json.substr(start, end - start + 1));
      pos = end + 1;
    }
    return objects;
  }

  bool Fail(std::string* error, const std::string& message) {
    if (error) *error = message;
    return false;
  }

  bool ParseAudio(const std::string& audio_json, AudioSpec& out, std::string* error) {
    std::string type;
    if (!ExtractString(audio_json, "type", type)) {
      return Fail(error, "audio object without \"type\"");
    }

    std::optional<float> volume;
    float v = 1.0f;
    const int has_volume = ExtractFloat(audio_json, "volume", v);
    if (has_volume < 0) return Fail(error, "malformed audio volume");
    if (has_volume > 0) volume = v;

    if (type == "noise") {
      NoiseSpec spec;
      std::string noise = "white";
      ExtractString(audio_json, "noise", noise);
      if (noise == "white") {
        spec.noise_type = NoiseType::kWhite;
      } else if (noise == "pink") {
        spec.noise_type = NoiseType::kPink;
      } else if (noise == "brown") {
        spec.noise_type = NoiseType::kBrown;
      } else {
        return Fail(error, "unknown noise type '" + noise + "'");
      }
      spec.volume = volume;
      out = spec;
      return true;
    }
    if (type == "sine") {
      SineSpec spec;
      if (ExtractFloat(audio_json, "frequency", spec.frequency_hz) < 0) {
        return Fail(error, "malformed sine frequency");
      }
      spec.volume = volume;
      out = spec;
      return true;
    }
    if (type == "sample") {
      SampleSpec spec;
      if (!ExtractString(audio_json, "url", spec.url) || spec.url.empty()) {
        return Fail(error, "sample audio without \"url\"");
      }
      spec.volume = volume;
      out = spec;
      return true;
    }
    return Fail(error, "unknown audio type '" + type + "'");
  }

  // Segment bounds are unsigned 32-bit frame indices.
  bool IsFrameIndex(int64_t value) {
    return value >= 0 && value <= static_cast<int64_t>(UINT32_MAX);
  }

  bool ParseSegment(const std::string& seg_json, size_t index, Segment& out, std::string* error) {
    const std::string where = "segment " + std::to_string(index) + ": ";

    std::string audio_json;
    if (ExtractNested(seg_json, "audio", '{', audio_json)) {
      AudioSpec spec;
      std::string audio_error;
      if (!ParseAudio(audio_json, spec, &audio_error)) {
        return Fail(error, where + audio_error);
      }
      out.audio = spec;
    }
    const std::string fields = StripNested(seg_json, "audio", '{');

    if (!ExtractString(fields, "source", out.source_id) || out.source_id.empty()) {
      return Fail(error, where + "missing \"source\"");
    }
    if (ExtractInt(fields, "from", out.from) <= 0 || !IsFrameIndex(out.from)) {
      return Fail(error, where + "missing or malformed \"from\"");
    }
    if (ExtractInt(fields, "to", out.to) <= 0 || !IsFrameIndex(out.to)) {
      return Fail(error, where + "missing or malformed \"to\"");
    }
    int64_t repeat = 1;
    if (ExtractInt(fields, "repeat", repeat) < 0 || repeat < 0 ||
        repeat > static_cast<int64_t>(UINT32_MAX)) {
      return Fail(error, where + "malformed \"repeat\"");
    }
    out.repeat = static_cast<uint32_t>(repeat);
    return true;
  }

  void AppendAudioJson(std::ostringstream& oss, const AudioSpec& spec) {
    oss << ",\"audio\":{";
    if (const auto* noise = std::get_if<NoiseSpec>(&spec)) {
      oss << "\"type\":\"noise\",\"noise\":\"" << NoiseTypeName(noise->noise_type) << "\"";
    } else if (const auto* sine = std::get_if<SineSpec>(&spec)) {
      oss << "\"type\":\"sine\",\"frequency\":" << sine->frequency_hz;
    } else if (const auto* sample = std::get_if<SampleSpec>(&spec)) {
      oss << "\"type\":\"sample\",\"url\":\"" << JsonEscape(sample->url) << "\"";
    }
    const std::optional<float> volume =
        std::visit([](const auto& s) { return s.volume; }, spec);
    if (volume) {
      oss << ",\"volume\":" << *volume;
    }
    oss << "}";
  }
}  // namespace

std::optional<RationalFps> ParseFrameRate(const std::string& text) {
  std::regex pattern(R"(\s*(\d+)\s*(?:/\s*(\d+))?\s*)");
  std::smatch match;
  if (!std::regex_match(text, match, pattern)) {
    return std::nullopt;
  }
  try {
    const int64_t num = std::stoll(match[1].str());
    const int64_t den = match[2].matched ? std::stoll(match[2].str()) : 1;
    if (num <= 0 || den <= 0) {
      return std::nullopt;
    }
    return RationalFps(num, den);
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::optional<TimelineDocument> TimelineDocument::FromJson(const std::string& json_str,
                                                           std::string* error) {
  if (json_str.find('{') == std::string::npos) {
    Fail(error, "empty document");
    return std::nullopt;
  }

  TimelineDocument doc;

  std::string segments_json;
  if (!ExtractNested(json_str, "segments", '[', segments_json)) {
    Fail(error, "missing \"segments\" array");
    return std::nullopt;
  }
  const auto objects = SplitObjects(segments_json);
  for (size_t i = 0; i < objects.size(); ++i) {
    Segment seg;
    if (!ParseSegment(objects[i], i, seg, error)) {
      return std::nullopt;
    }
    doc.segments.push_back(std::move(seg));
  }

  std::string sources_json;
  if (ExtractNested(json_str, "sources", '{', sources_json)) {
    std::regex pair(std::string(kStringPattern) + "\\s*:\\s*" + kStringPattern);
    for (auto it = std::sregex_iterator(sources_json.begin(), sources_json.end(), pair);
         it != std::sregex_iterator(); ++it) {
      doc.sources[Unescape((*it)[1].str())] = Unescape((*it)[2].str());
    }
  }

  std::string settings_json;
  if (ExtractNested(json_str, "settings", '{', settings_json)) {
    int64_t width = doc.settings.width;
    int64_t height = doc.settings.height;
    if (ExtractInt(settings_json, "width", width) < 0 ||
        ExtractInt(settings_json, "height", height) < 0) {
      Fail(error, "malformed settings");
      return std::nullopt;
    }
    doc.settings.width = static_cast<int32_t>(width);
    doc.settings.height = static_cast<int32_t>(height);
  }

  // Remaining top-level scalars.
  std::string top = StripNested(json_str, "segments", '[');
  top = StripNested(top, "sources", '{');
  top = StripNested(top, "settings", '{');

  std::string fps_text;
  if (ExtractString(top, "fps", fps_text)) {
    auto fps = ParseFrameRate(fps_text);
    if (!fps) {
      Fail(error, "malformed fps '" + fps_text + "'");
      return std::nullopt;
    }
    doc.fps = *fps;
  } else {
    int64_t fps_int = 0;
    const int found = ExtractInt(top, "fps", fps_int);
    if (found < 0 || (found > 0 && fps_int <= 0)) {
      Fail(error, "malformed fps");
      return std::nullopt;
    }
    if (found > 0) doc.fps = RationalFps(fps_int, 1);
  }

  if (ExtractFloat(top, "volume", doc.volume) < 0) {
    Fail(error, "malformed volume");
    return std::nullopt;
  }

  if (!doc.IsValid(error)) {
    return std::nullopt;
  }
  return doc;
}

bool TimelineDocument::IsValid(std::string* error) const {
  if (!fps.IsValid()) {
    return Fail(error, "invalid frame rate");
  }
  if (settings.width <= 0 || settings.height <= 0) {
    return Fail(error, "settings width and height must be positive");
  }
  if (volume < 0.0f) {
    return Fail(error, "volume must not be negative");
  }
  if (segments.empty()) {
    return Fail(error, "timeline has no segments");
  }
  if (!sources.empty()) {
    for (const auto& seg : segments) {
      if (sources.find(seg.source_id) == sources.end()) {
        return Fail(error, "segment names unlisted source '" + seg.source_id + "'");
      }
    }
  }
  return true;
}

std::vector<std::string> TimelineDocument::ReferencedSources() const {
  std::vector<std::string> ids;
  std::set<std::string> seen;
  for (const auto& seg : segments) {
    if (seen.insert(seg.source_id).second) {
      ids.push_back(seg.source_id);
    }
  }
  return ids;
}

std::string TimelineDocument::ToJson() const {
  std::ostringstream oss;
  oss << "{"
      << "\"fps\":\"" << fps.num << "/" << fps.den << "\","
      << "\"volume\":" << volume << ","
      << "\"settings\":{\"width\":" << settings.width << ",\"height\":" << settings.height
      << "},"
      << "\"sources\":{";
  bool first = true;
  for (const auto& [id, path] : sources) {
    if (!first) oss << ",";
    first = false;
    oss << "\"" << JsonEscape(id) << "\":\"" << JsonEscape(path) << "\"";
  }
  oss << "},\"segments\":[";
  for (size_t i = 0; i < segments.size(); ++i) {
    const auto& seg = segments[i];
    if (i > 0) oss << ",";
    oss << "{\"source\":\"" << JsonEscape(seg.source_id) << "\""
        << ",\"from\":" << seg.from << ",\"to\":" << seg.to << ",\"repeat\":" << seg.repeat;
    if (seg.audio) {
      AppendAudioJson(oss, *seg.audio);
    }
    oss << "}";
  }
  oss << "]}";
  return oss.str();
}

}  // namespace moshline::timeline
