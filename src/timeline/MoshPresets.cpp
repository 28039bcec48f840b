// Repository: Moshline
// Component: Mosh Presets
// Purpose: Named segment templates and randomized segment builders.
// Copyright (c) 2025 RetroVue

#include "moshline/timeline/MoshPresets.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <utility>

#include "moshline/timeline/RationalFps.hpp"
#include "moshline/timeline/TimelineExpander.hpp"
#include "moshline/util/Logger.hpp"

namespace moshline::timeline {

namespace {

using util::Logger;
using Run = std::pair<int64_t, int64_t>;  // [first, last)

double Uniform01(std::mt19937& rng) {
  return std::uniform_real_distribution<double>(0.0, 1.0)(rng);
}

// Uniform integer in [lo, lo + span - 1]; lo when span <= 0.
int64_t UniformSpan(std::mt19937& rng, int64_t lo, int64_t span) {
  if (span <= 0) return lo;
  const auto offset = static_cast<int64_t>(
      std::floor(Uniform01(rng) * static_cast<double>(span)));
  return lo + std::min(offset, span - 1);
}

// Lower bound wins when the range is inverted.
template <typename T>
T ClampLoose(T v, T lo, T hi) {
  return std::max(lo, std::min(hi, v));
}

Segment MakeSegment(const std::string& source_id, int64_t from, int64_t to, uint32_t repeat) {
  Segment seg;
  seg.source_id = source_id;
  seg.from = from;
  seg.to = to;
  seg.repeat = repeat;
  return seg;
}

double ShortSegmentWeight(PresetStyle style) {
  switch (style) {
    case PresetStyle::kQuick:        return 0.7;
    case PresetStyle::kEcho:         return 0.4;
    case PresetStyle::kStutter:      return 0.9;
    case PresetStyle::kSuperchop:    return 0.6;
    case PresetStyle::kMicroStutter: return 0.95;
  }
  return 0.7;
}

bool Contains(const std::string& haystack, const char* needle) {
  return haystack.find(needle) != std::string::npos;
}

// Contiguous runs of delta chunks within [begin, end).
std::vector<Run> DeltaRuns(const ChunkList& chunks, int64_t begin, int64_t end) {
  std::vector<Run> runs;
  end = std::min<int64_t>(end, static_cast<int64_t>(chunks.size()));
  int64_t run_start = -1;
  for (int64_t i = begin; i < end; ++i) {
    const bool is_delta = chunks[static_cast<size_t>(i)].kind == ChunkKind::kDelta;
    if (is_delta && run_start < 0) {
      run_start = i;
    } else if (!is_delta && run_start >= 0) {
      runs.emplace_back(run_start, i);
      run_start = -1;
    }
  }
  if (run_start >= 0) {
    runs.emplace_back(run_start, end);
  }
  return runs;
}

int64_t RunFrames(const std::vector<Run>& runs) {
  int64_t total = 0;
  for (const auto& r : runs) total += r.second - r.first;
  return total;
}

// Replay the run sequence `times` times. A single run collapses into one
// repeated segment.
void AppendRepeatedRuns(std::vector<Segment>& out, const std::string& source_id,
                        const std::vector<Run>& runs, uint32_t times) {
  if (times == 0 || runs.empty()) return;
  if (runs.size() == 1) {
    out.push_back(MakeSegment(source_id, runs[0].first, runs[0].second, times));
    return;
  }
  for (uint32_t t = 0; t < times; ++t) {
    for (const auto& r : runs) {
      out.push_back(MakeSegment(source_id, r.first, r.second, 1));
    }
  }
}

std::vector<int64_t> IndicesOfKind(const ChunkList& chunks, ChunkKind kind) {
  std::vector<int64_t> out;
  for (size_t i = 0; i < chunks.size(); ++i) {
    if (chunks[i].kind == kind) out.push_back(static_cast<int64_t>(i));
  }
  return out;
}

}  // namespace

const std::vector<SegmentPreset>& BuiltinPresets() {
  static const std::vector<SegmentPreset> kPresets = {
      {"longbasic",
       {{0, 33, 1}, {30, 36, 12}, {35, 70, 1}, {65, 74, 30}, {72, 90, 1},
        {89, 100, 1}, {98, 104, 23}, {103, 120, 1}, {120, 126, 7}}},
      {"7segmentOddTimings",
       {{0, 30, 1}, {29, 35, 30}, {34, 39, 1}, {37, 44, 15}, {40, 47, 1},
        {46, 60, 5}, {58, 63, 30}}},
      {"basic", {{0, 72, 1}, {70, 77, 27}, {75, 85, 1}, {85, 89, 20}}},
      {"Quick Glitch", {{0, 30, 1}, {10, 25, 3}, {30, 60, 1}}},
      {"Echo Loop", {{0, 20, 1}, {15, 35, 5}, {20, 40, 2}}},
      {"Stutter Effect", {{0, 10, 1}, {5, 15, 8}, {10, 30, 1}}},
      {"Superchop",
       {{0, 3, 4}, {8, 25, 1}, {2, 5, 6}, {15, 35, 1}, {10, 12, 8}, {30, 50, 2}}},
      {"Micro Stutter",
       {{0, 2, 35}, {10, 13, 25}, {20, 22, 40}, {25, 45, 1}, {50, 53, 45},
        {60, 85, 1}, {90, 92, 30}, {100, 120, 1}, {125, 127, 25}}},
      {"Blends",
       {{0, 39, 1}, {38, 44, 39}, {4, 50, 1}, {48, 55, 40}, {53, 57, 25},
        {90, 120, 1}, {118, 122, 54}}},
  };
  return kPresets;
}

const SegmentPreset* FindPreset(const std::string& name) {
  for (const auto& p : BuiltinPresets()) {
    if (p.name == name) return &p;
  }
  return nullptr;
}

const char* PresetStyleName(PresetStyle style) {
  switch (style) {
    case PresetStyle::kQuick:        return "quick";
    case PresetStyle::kEcho:         return "echo";
    case PresetStyle::kStutter:      return "stutter";
    case PresetStyle::kSuperchop:    return "superchop";
    case PresetStyle::kMicroStutter: return "microstutter";
  }
  return "unknown";
}

PresetStyle StyleForPresetName(const std::string& name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (Contains(lower, "echo") || Contains(lower, "loop")) return PresetStyle::kEcho;
  if (Contains(lower, "micro") && Contains(lower, "stutter")) return PresetStyle::kMicroStutter;
  if (Contains(lower, "stutter") || Contains(lower, "glitch")) return PresetStyle::kStutter;
  if (Contains(lower, "chop")) return PresetStyle::kSuperchop;
  return PresetStyle::kQuick;
}

uint32_t GenerateWeightedRepeat(uint32_t base, std::mt19937& rng) {
  const double r = Uniform01(rng);
  if (base > 10) {
    if (r < 0.6) return static_cast<uint32_t>(UniformSpan(rng, 20, 11));
    if (r < 0.85) return static_cast<uint32_t>(UniformSpan(rng, 31, 10));
    return static_cast<uint32_t>(UniformSpan(rng, 41, 10));
  }
  if (r < 0.8) return 1;
  if (r < 0.92) return 2;
  if (r < 0.97) return static_cast<uint32_t>(UniformSpan(rng, 3, 2));
  if (r < 0.99) return static_cast<uint32_t>(UniformSpan(rng, 5, 3));
  return static_cast<uint32_t>(UniformSpan(rng, 8, 5));
}

std::vector<Segment> ApplyPresetWithProbabilities(const SegmentPreset& preset,
                                                  const std::vector<SourceInfo>& sources,
                                                  std::mt19937& rng) {
  std::vector<SourceInfo> shuffled;
  for (const auto& s : sources) {
    if (s.length > 0) shuffled.push_back(s);
  }
  std::shuffle(shuffled.begin(), shuffled.end(), rng);

  const PresetStyle style = StyleForPresetName(preset.name);
  const double short_weight = ShortSegmentWeight(style);

  std::vector<Segment> segments;

  for (size_t vid_index = 0; vid_index < shuffled.size(); ++vid_index) {
    const SourceInfo& src = shuffled[vid_index];
    const int64_t max_frames = src.length;
    const double seconds = FPS_30.FrameDurationSec() * static_cast<double>(max_frames);

    double scale = static_cast<double>(max_frames) / 100.0;
    if (seconds < 3.0) scale *= 0.7;
    if (seconds > 10.0) scale *= 1.2;

    auto push = [&](int64_t from, int64_t to, uint32_t repeat) {
      segments.push_back(ClampSegment(MakeSegment(src.id, from, to, repeat), max_frames));
    };

    for (const auto& ps : preset.segments) {
      if (Uniform01(rng) >= 0.6 + 0.15 * static_cast<double>(vid_index)) continue;

      const double size_factor = Uniform01(rng) < short_weight ? 0.5 : 1.5;
      const auto from = static_cast<int64_t>(std::floor(ClampLoose(
          static_cast<double>(ps.from) * scale * size_factor, 0.0,
          static_cast<double>(max_frames - 5))));
      const auto to = static_cast<int64_t>(std::floor(ClampLoose(
          static_cast<double>(ps.to) * scale * size_factor,
          static_cast<double>(from + 3), static_cast<double>(max_frames))));

      uint32_t repeat = GenerateWeightedRepeat(ps.repeat, rng);

      if (vid_index > 0) {
        if (Uniform01(rng) < 0.3) {
          repeat = GenerateWeightedRepeat(repeat, rng);
        }
        if (Uniform01(rng) < 0.4) {
          const auto offset = static_cast<int64_t>(std::floor(Uniform01(rng) * 10.0 - 5.0));
          const int64_t shifted_from = ClampLoose<int64_t>(from + offset, 0, max_frames - 5);
          const int64_t shifted_to = ClampLoose<int64_t>(to + offset, shifted_from + 3, max_frames);
          push(shifted_from, shifted_to, repeat);
        } else {
          push(from, to, repeat);
        }
      } else {
        push(from, to, repeat);
      }

      switch (style) {
        case PresetStyle::kEcho:
          if (Uniform01(rng) < 0.3) {
            const int64_t offset = UniformSpan(rng, 5, 10);
            const int64_t echo_from = ClampLoose<int64_t>(from + offset, 0, max_frames - 5);
            const int64_t echo_to = ClampLoose<int64_t>(to + offset, echo_from + 3, max_frames);
            push(echo_from, echo_to, GenerateWeightedRepeat(1, rng));
          }
          break;

        case PresetStyle::kStutter:
          if (Uniform01(rng) < 0.6) {
            const int64_t count = UniformSpan(rng, 2, 3);
            for (int64_t s = 0; s < count; ++s) {
              const int64_t length = UniformSpan(rng, 2, 4);
              const int64_t start = UniformSpan(rng, 0, max_frames - length - 10);
              push(start, start + length, GenerateWeightedRepeat(5, rng));
            }
          }
          break;

        case PresetStyle::kSuperchop:
          if (Uniform01(rng) < 0.7) {
            const int64_t count = UniformSpan(rng, 3, 4);
            for (int64_t c = 0; c < count; ++c) {
              const int64_t length = UniformSpan(rng, 1, 3);
              const int64_t start = UniformSpan(rng, 0, max_frames - length - 10);
              push(start, start + length, GenerateWeightedRepeat(2, rng));
            }
          }
          break;

        case PresetStyle::kMicroStutter:
          if (Uniform01(rng) < 0.8) {
            const int64_t count = UniformSpan(rng, 2, 4);
            for (int64_t m = 0; m < count; ++m) {
              if (Uniform01(rng) < 0.3) {
                // Longer expressive section, single play.
                const int64_t length = UniformSpan(rng, 15, 26);
                const int64_t start = UniformSpan(rng, 0, max_frames - length - 10);
                push(start, std::min(start + length, max_frames), 1);
              } else {
                const int64_t length = UniformSpan(rng, 2, 2);
                const int64_t start = UniformSpan(rng, 0, max_frames - length - 10);
                push(start, start + length, GenerateWeightedRepeat(25, rng));
              }
            }
          }
          break;

        case PresetStyle::kQuick:
          break;
      }
    }
  }

  std::shuffle(segments.begin(), segments.end(), rng);

  std::vector<Segment> limited;
  int64_t frame_count = 0;
  for (auto& seg : segments) {
    const int64_t frames = seg.TotalFrames();
    if (frame_count + frames <= kMaxPresetFrames) {
      frame_count += frames;
      limited.push_back(std::move(seg));
      continue;
    }
    // Trim the overflowing segment's repeat and stop.
    const int64_t length = seg.SinglePlayFrames();
    const int64_t max_repeats = length > 0 ? (kMaxPresetFrames - frame_count) / length : 0;
    if (max_repeats > 0) {
      seg.repeat = static_cast<uint32_t>(max_repeats);
      limited.push_back(std::move(seg));
    }
    break;
  }

  // First segment starts at frame 0; its length is kept so the cap holds.
  if (!limited.empty()) {
    Segment& first = limited.front();
    first.to -= first.from;
    first.from = 0;
  }

  std::ostringstream oss;
  oss << "[MoshPresets] Applied preset '" << preset.name << "' style="
      << PresetStyleName(style) << " sources=" << shuffled.size()
      << " segments=" << limited.size() << " frames=" << CountExpandedFrames(limited);
  Logger::Debug(oss.str());

  return limited;
}

std::vector<Segment> AdaptPresetToSource(const SegmentPreset& preset,
                                         const std::string& source_id,
                                         int64_t source_length,
                                         const std::optional<std::string>& sample_url) {
  std::vector<Segment> out;
  out.reserve(preset.segments.size());
  for (size_t i = 0; i < preset.segments.size(); ++i) {
    const auto& ps = preset.segments[i];
    Segment seg = ClampSegment(MakeSegment(source_id, ps.from, ps.to, ps.repeat), source_length);
    if (sample_url.has_value()) {
      SampleSpec sample;
      sample.url = *sample_url;
      sample.volume = 0.5f + 0.1f * static_cast<float>(i % 3);
      seg.audio = sample;
    }
    out.push_back(std::move(seg));
  }
  return out;
}

SegmentPreset MergePresets(const std::string& name,
                           const std::vector<SegmentPreset>& presets,
                           std::mt19937& rng) {
  SegmentPreset merged;
  merged.name = name;
  for (const auto& p : presets) {
    const auto n = static_cast<int64_t>(p.segments.size());
    if (n == 0) continue;
    const int64_t start = UniformSpan(rng, 0, n);
    const int64_t count = UniformSpan(rng, 1, n - start);
    for (int64_t i = start; i < start + count; ++i) {
      merged.segments.push_back(p.segments[static_cast<size_t>(i)]);
    }
  }
  return merged;
}

const char* MoshRecipeName(MoshRecipe recipe) {
  switch (recipe) {
    case MoshRecipe::kClassicMelt: return "Classic Melt";
    case MoshRecipe::kStutter:     return "Stutter";
  }
  return "unknown";
}

MoshRecipe PickRecipe(std::mt19937& rng) {
  return UniformSpan(rng, 0, 2) == 0 ? MoshRecipe::kClassicMelt : MoshRecipe::kStutter;
}

std::vector<Segment> BuildClassicMelt(const std::string& source_id,
                                      const ChunkList& chunks,
                                      int64_t target_frames,
                                      std::mt19937& rng) {
  const auto length = static_cast<int64_t>(chunks.size());
  if (length < 10) {
    return {MakeSegment(source_id, 0, length, 1)};
  }

  const auto keys = IndicesOfKind(chunks, ChunkKind::kKey);
  if (keys.empty()) {
    Logger::Warn("[MoshPresets] Classic Melt: no key frame in '" + source_id +
                 "', using first chunk");
    return {MakeSegment(source_id, 0, 1, 1)};
  }

  const int64_t key = keys.front();
  std::vector<Segment> out;
  out.push_back(MakeSegment(source_id, key, key + 1, 1));

  const auto runs = DeltaRuns(chunks, key + 1, key + 16);
  const int64_t run_frames = RunFrames(runs);
  if (run_frames == 0) {
    Logger::Warn("[MoshPresets] Classic Melt: no delta frames after key in '" +
                 source_id + "'");
    return out;
  }

  const int64_t times = std::min<int64_t>(20, target_frames / run_frames);
  AppendRepeatedRuns(out, source_id, runs, static_cast<uint32_t>(std::max<int64_t>(0, times)));

  const auto deltas = IndicesOfKind(chunks, ChunkKind::kDelta);
  const auto random_count = std::min<size_t>(8, deltas.size());
  for (size_t i = 0; i < random_count; ++i) {
    const int64_t idx = deltas[static_cast<size_t>(
        UniformSpan(rng, 0, static_cast<int64_t>(deltas.size())))];
    out.push_back(MakeSegment(source_id, idx, idx + 1, 1));
  }

  std::ostringstream oss;
  oss << "[MoshPresets] Classic Melt source=" << source_id << " key=" << key
      << " run=" << run_frames << " x" << times << " frames=" << CountExpandedFrames(out);
  Logger::Debug(oss.str());
  return out;
}

std::vector<Segment> BuildStutter(const std::string& source_id,
                                  const ChunkList& chunks,
                                  int64_t target_frames,
                                  std::mt19937& rng) {
  const auto length = static_cast<int64_t>(chunks.size());
  if (length < 10) {
    return {MakeSegment(source_id, 0, length, 1)};
  }

  const auto keys = IndicesOfKind(chunks, ChunkKind::kKey);
  if (keys.empty()) {
    Logger::Warn("[MoshPresets] Stutter: no key frames in '" + source_id + "'");
    return {MakeSegment(source_id, 0, length, 1)};
  }

  std::vector<Segment> out;
  int64_t produced = 0;
  for (int64_t key : keys) {
    if (produced >= target_frames) break;
    out.push_back(MakeSegment(source_id, key, key + 1, 1));
    produced += 1;

    const auto runs = DeltaRuns(chunks, key + 1, key + 9);
    const int64_t run_frames = RunFrames(runs);
    if (run_frames > 0) {
      const int64_t times = UniformSpan(rng, 3, 4);
      AppendRepeatedRuns(out, source_id, runs, static_cast<uint32_t>(times));
      produced += run_frames * times;
    }
  }

  const auto deltas = IndicesOfKind(chunks, ChunkKind::kDelta);
  if (!deltas.empty()) {
    const int64_t holds = std::min<int64_t>(4, UniformSpan(rng, 2, 5));
    for (int64_t i = 0; i < holds; ++i) {
      const int64_t idx = deltas[static_cast<size_t>(
          UniformSpan(rng, 0, static_cast<int64_t>(deltas.size())))];
      const auto hold = static_cast<uint32_t>(UniformSpan(rng, 5, 8));
      out.push_back(MakeSegment(source_id, idx, idx + 1, hold));
    }
  }

  std::ostringstream oss;
  oss << "[MoshPresets] Stutter source=" << source_id << " keys=" << keys.size()
      << " frames=" << CountExpandedFrames(out);
  Logger::Debug(oss.str());
  return out;
}

std::vector<Segment> BuildRecipe(MoshRecipe recipe,
                                 const std::string& source_id,
                                 const ChunkList& chunks,
                                 int64_t target_frames,
                                 std::mt19937& rng) {
  switch (recipe) {
    case MoshRecipe::kClassicMelt:
      return BuildClassicMelt(source_id, chunks, target_frames, rng);
    case MoshRecipe::kStutter:
      return BuildStutter(source_id, chunks, target_frames, rng);
  }
  return {};
}

}  // namespace moshline::timeline
