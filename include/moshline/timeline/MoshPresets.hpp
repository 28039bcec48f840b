// Repository: Moshline
// Component: Mosh Presets
// Purpose: Named segment templates and randomized segment builders.
// Copyright (c) 2025 RetroVue
//
// Every function that makes a random choice takes the generator explicitly.
// The outputs are plain Segment lists; Expand and Synthesize never see the RNG.

#ifndef MOSHLINE_TIMELINE_MOSH_PRESETS_HPP_
#define MOSHLINE_TIMELINE_MOSH_PRESETS_HPP_

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "moshline/timeline/MoshTypes.hpp"

namespace moshline::timeline {

// Upper bound on frames produced by ApplyPresetWithProbabilities (60 s @ 30 fps).
inline constexpr int64_t kMaxPresetFrames = 1800;

struct PresetSegment {
  int64_t from;
  int64_t to;
  uint32_t repeat;
};

struct SegmentPreset {
  std::string name;
  std::vector<PresetSegment> segments;
};

// Built-in templates in display order.
const std::vector<SegmentPreset>& BuiltinPresets();

// Lookup by exact name; nullptr when not found.
const SegmentPreset* FindPreset(const std::string& name);

// Style inferred from the preset name; drives segment sizing and extras.
enum class PresetStyle {
  kQuick,
  kEcho,
  kStutter,
  kSuperchop,
  kMicroStutter,
};

const char* PresetStyleName(PresetStyle style);
PresetStyle StyleForPresetName(const std::string& name);

// Weighted repeat count. For base <= 10: 1 (80%), 2 (12%), 3-4 (5%),
// 5-7 (2%), 8-12 (1%). For base > 10 the micro-stutter range 20-50.
uint32_t GenerateWeightedRepeat(uint32_t base, std::mt19937& rng);

struct SourceInfo {
  std::string id;
  int64_t length = 0;  // chunk count
};

// Distribute a template across every source with per-source scaling,
// style-specific extra segments and a final shuffle. Output segments are
// clamped to their sources, total frames never exceed kMaxPresetFrames and
// the first segment starts at frame 0. Sources with no chunks are skipped.
std::vector<Segment> ApplyPresetWithProbabilities(const SegmentPreset& preset,
                                                  const std::vector<SourceInfo>& sources,
                                                  std::mt19937& rng);

// Deterministic fit of a template onto one source. When `sample_url` is set
// every segment carries Sample audio with volume 0.5 + 0.1 * (index % 3).
std::vector<Segment> AdaptPresetToSource(const SegmentPreset& preset,
                                         const std::string& source_id,
                                         int64_t source_length,
                                         const std::optional<std::string>& sample_url);

// Hybrid template: a random contiguous run of segments from each input,
// concatenated in input order. Empty inputs are skipped.
SegmentPreset MergePresets(const std::string& name,
                           const std::vector<SegmentPreset>& presets,
                           std::mt19937& rng);

// =============================================================================
// Chunk-aware recipes
// =============================================================================

enum class MoshRecipe {
  kClassicMelt,
  kStutter,
};

const char* MoshRecipeName(MoshRecipe recipe);
MoshRecipe PickRecipe(std::mt19937& rng);

// Key frame, then the delta run after it replayed until it melts, then a
// handful of random delta frames. Sources under 10 chunks play through once.
std::vector<Segment> BuildClassicMelt(const std::string& source_id,
                                      const ChunkList& chunks,
                                      int64_t target_frames,
                                      std::mt19937& rng);

// Per key frame: the key then its delta run repeated 3-6 times, until the
// target is reached; then a few single delta frames held for 5-12 frames.
std::vector<Segment> BuildStutter(const std::string& source_id,
                                  const ChunkList& chunks,
                                  int64_t target_frames,
                                  std::mt19937& rng);

std::vector<Segment> BuildRecipe(MoshRecipe recipe,
                                 const std::string& source_id,
                                 const ChunkList& chunks,
                                 int64_t target_frames,
                                 std::mt19937& rng);

}  // namespace moshline::timeline

#endif  // MOSHLINE_TIMELINE_MOSH_PRESETS_HPP_
