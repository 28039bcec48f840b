// Repository: Moshline
// Component: Standalone Mosh Renderer
// Purpose: Command-line harness: load sources, build a timeline, render one
//          deliverable to disk.
// Copyright (c) 2025 RetroVue
//
// MODES OF OPERATION:
// 1. Timeline mode: --timeline timeline.json
// 2. Preset mode:   --source a=clip.mp4 ... --preset NAME | --merge A,B | --recipe NAME

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "moshline/decode/FFmpegChunkDecoder.hpp"
#include "moshline/decode/FFmpegSampleSource.hpp"
#include "moshline/decode/FFmpegSourceReader.hpp"
#include "moshline/encode/FFmpegCaptureSink.hpp"
#include "moshline/encode/FFmpegTranscoder.hpp"
#include "moshline/pipeline/RenderPipeline.hpp"
#include "moshline/timeline/MoshPresets.hpp"
#include "moshline/timeline/TimelineDocument.hpp"
#include "moshline/timing/ITimeSource.hpp"

namespace {

using namespace moshline;

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  // Timeline mode
  std::string timeline_path;

  // Preset mode
  std::map<std::string, std::string> sources;  // id -> path
  std::vector<std::string> source_order;
  std::string preset;
  std::vector<std::string> merge;
  std::string recipe;  // "classic-melt", "stutter" or "random"
  std::string adapt_sample_url;
  int64_t recipe_frames = 150;
  std::optional<uint32_t> seed;

  // Render options
  std::optional<int32_t> width;
  std::optional<int32_t> height;
  std::optional<timeline::RationalFps> fps;
  std::optional<float> volume;
  int32_t sample_rate = 44100;
  int64_t timeout_ms = 10 * 60 * 1000;
  bool silent_audio = false;
  bool continuous_noise = false;

  // Output options
  std::string output_path;
  std::string journal_csv_path;
  std::string dump_timeline_path;
  bool list_presets = false;
  bool help = false;
  bool valid = false;
  std::string error;

  bool IsTimelineMode() const { return !timeline_path.empty(); }
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Render a datamosh timeline to a single audio+video file.\n"
            << "\n"
            << "TIMELINE MODE:\n"
            << "  --timeline PATH       Render a timeline JSON file\n"
            << "\n"
            << "PRESET MODE:\n"
            << "  --source ID=PATH      Register a source clip (repeatable)\n"
            << "  --preset NAME         Apply a preset across all sources\n"
            << "  --merge A,B[,...]     Apply a hybrid of several presets\n"
            << "  --adapt NAME          Fit a preset onto the first source only\n"
            << "  --sample-url URL      Sample audio for --adapt segments\n"
            << "  --recipe NAME         classic-melt | stutter | random (first source)\n"
            << "  --frames N            Target frames for --recipe (default: 150)\n"
            << "  --seed N              RNG seed (default: random)\n"
            << "\n"
            << "RENDER OPTIONS:\n"
            << "  --width N --height N  Output raster (default: 640x480)\n"
            << "  --fps RATE            Frame rate, e.g. 30 or 30000/1001 (default: 30)\n"
            << "  --volume V            Global audio volume (default: 1.0)\n"
            << "  --sample-rate HZ      Audio sample rate (default: 44100)\n"
            << "  --timeout-ms MS       Render deadline, 0 disables (default: 600000)\n"
            << "  --silent-audio        Mux a silent track when no segment has audio\n"
            << "  --continuous-noise    Noise continues across repeats\n"
            << "\n"
            << "OUTPUT OPTIONS:\n"
            << "  --output PATH         Write the deliverable\n"
            << "  --journal-csv PATH    Write the render journal as CSV\n"
            << "  --dump-timeline PATH  Write the rendered timeline as JSON\n"
            << "  --list-presets        Print the built-in presets and exit\n"
            << "  --help                Show this help message\n"
            << "\n"
            << "EXAMPLES:\n"
            << "  " << program_name << " --timeline mosh.json --output /tmp/mosh.mp4\n"
            << "  " << program_name << " --source a=a.mp4 --source b=b.mp4 \\\n"
            << "                   --preset basic --seed 7 --output /tmp/basic.mp4\n"
            << "\n";
}

std::vector<std::string> SplitList(const std::string& text) {
  std::vector<std::string> parts;
  std::stringstream ss(text);
  std::string part;
  while (std::getline(ss, part, ',')) {
    if (!part.empty()) parts.push_back(part);
  }
  return parts;
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        args.help = true;
        args.valid = true;
        return args;
      } else if (arg == "--list-presets") {
        args.list_presets = true;
        args.valid = true;
        return args;
      } else if (arg == "--timeline" && i + 1 < argc) {
        args.timeline_path = argv[++i];
      } else if (arg == "--source" && i + 1 < argc) {
        const std::string spec = argv[++i];
        const size_t eq = spec.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == spec.size()) {
          args.error = "--source expects ID=PATH, got: " + spec;
          return args;
        }
        const std::string id = spec.substr(0, eq);
        if (args.sources.count(id) == 0) args.source_order.push_back(id);
        args.sources[id] = spec.substr(eq + 1);
      } else if (arg == "--preset" && i + 1 < argc) {
        args.preset = argv[++i];
      } else if (arg == "--adapt" && i + 1 < argc) {
        args.preset = argv[++i];
        args.recipe = "adapt";
      } else if (arg == "--sample-url" && i + 1 < argc) {
        args.adapt_sample_url = argv[++i];
      } else if (arg == "--merge" && i + 1 < argc) {
        args.merge = SplitList(argv[++i]);
      } else if (arg == "--recipe" && i + 1 < argc) {
        args.recipe = argv[++i];
      } else if (arg == "--frames" && i + 1 < argc) {
        args.recipe_frames = std::stoll(argv[++i]);
      } else if (arg == "--seed" && i + 1 < argc) {
        args.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
      } else if (arg == "--width" && i + 1 < argc) {
        args.width = std::stoi(argv[++i]);
      } else if (arg == "--height" && i + 1 < argc) {
        args.height = std::stoi(argv[++i]);
      } else if (arg == "--fps" && i + 1 < argc) {
        args.fps = timeline::ParseFrameRate(argv[++i]);
        if (!args.fps) {
          args.error = "Invalid --fps value";
          return args;
        }
      } else if (arg == "--volume" && i + 1 < argc) {
        args.volume = std::stof(argv[++i]);
      } else if (arg == "--sample-rate" && i + 1 < argc) {
        args.sample_rate = std::stoi(argv[++i]);
      } else if (arg == "--timeout-ms" && i + 1 < argc) {
        args.timeout_ms = std::stoll(argv[++i]);
      } else if (arg == "--silent-audio") {
        args.silent_audio = true;
      } else if (arg == "--continuous-noise") {
        args.continuous_noise = true;
      } else if (arg == "--output" && i + 1 < argc) {
        args.output_path = argv[++i];
      } else if (arg == "--journal-csv" && i + 1 < argc) {
        args.journal_csv_path = argv[++i];
      } else if (arg == "--dump-timeline" && i + 1 < argc) {
        args.dump_timeline_path = argv[++i];
      } else {
        args.error = "Unknown argument: " + arg;
        return args;
      }
    }
  } catch (const std::exception& e) {
    args.error = std::string("Invalid numeric argument: ") + e.what();
    return args;
  }

  // Validate arguments
  const int modes = (!args.preset.empty() && args.recipe != "adapt" ? 1 : 0) +
                    (!args.merge.empty() ? 1 : 0) + (!args.recipe.empty() ? 1 : 0);
  if (args.IsTimelineMode() && (modes > 0 || !args.sources.empty())) {
    args.error = "Cannot combine --timeline with --source/--preset/--merge/--recipe/--adapt";
    return args;
  }
  if (!args.IsTimelineMode()) {
    if (args.sources.empty()) {
      args.error = "Must specify either --timeline or at least one --source";
      return args;
    }
    if (modes != 1) {
      args.error = "Preset mode needs exactly one of --preset, --merge, --recipe, --adapt";
      return args;
    }
  }
  if (args.output_path.empty()) {
    args.error = "Must specify --output";
    return args;
  }
  if (args.sample_rate <= 0) {
    args.error = "--sample-rate must be positive";
    return args;
  }

  args.valid = true;
  return args;
}

std::string ReadFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return "";
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

bool WriteFile(const std::string& path, const void* data, size_t size) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) return false;
  file.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
  return static_cast<bool>(file);
}

void PrintPresets() {
  for (const auto& preset : timeline::BuiltinPresets()) {
    int64_t frames = 0;
    for (const auto& seg : preset.segments) {
      frames += (seg.to - seg.from) * static_cast<int64_t>(seg.repeat);
    }
    std::cout << std::left << std::setw(14) << preset.name << " "
              << std::setw(10) << timeline::PresetStyleName(timeline::StyleForPresetName(preset.name))
              << " " << preset.segments.size() << " segments, " << frames << " frames\n";
  }
}

// Segments for preset mode, built against the loaded chunk arrays.
std::optional<std::vector<timeline::Segment>> BuildPresetSegments(
    const CliArgs& args, const pipeline::PoolResult& loaded, std::mt19937& rng) {
  std::vector<timeline::SourceInfo> infos;
  for (const auto& id : args.source_order) {
    auto it = loaded.sources.find(id);
    infos.push_back({id, it == loaded.sources.end() ? 0 : static_cast<int64_t>(it->second.size())});
  }
  const std::string& first = args.source_order.front();
  const timeline::ChunkList& first_chunks = loaded.sources.at(first);

  if (args.recipe == "adapt") {
    const timeline::SegmentPreset* preset = timeline::FindPreset(args.preset);
    if (!preset) {
      std::cerr << "[moshrender] Unknown preset: " << args.preset << "\n";
      return std::nullopt;
    }
    std::optional<std::string> sample;
    if (!args.adapt_sample_url.empty()) sample = args.adapt_sample_url;
    return timeline::AdaptPresetToSource(*preset, first,
                                         static_cast<int64_t>(first_chunks.size()), sample);
  }
  if (!args.recipe.empty()) {
    timeline::MoshRecipe recipe;
    if (args.recipe == "random") {
      recipe = timeline::PickRecipe(rng);
    } else if (args.recipe == "classic-melt") {
      recipe = timeline::MoshRecipe::kClassicMelt;
    } else if (args.recipe == "stutter") {
      recipe = timeline::MoshRecipe::kStutter;
    } else {
      std::cerr << "[moshrender] Unknown recipe: " << args.recipe << "\n";
      return std::nullopt;
    }
    std::cerr << "[moshrender] Recipe: " << timeline::MoshRecipeName(recipe) << "\n";
    return timeline::BuildRecipe(recipe, first, first_chunks, args.recipe_frames, rng);
  }

  timeline::SegmentPreset preset;
  if (!args.merge.empty()) {
    std::vector<timeline::SegmentPreset> parts;
    for (const auto& name : args.merge) {
      const timeline::SegmentPreset* p = timeline::FindPreset(name);
      if (!p) {
        std::cerr << "[moshrender] Unknown preset: " << name << "\n";
        return std::nullopt;
      }
      parts.push_back(*p);
    }
    preset = timeline::MergePresets("hybrid", parts, rng);
  } else {
    const timeline::SegmentPreset* p = timeline::FindPreset(args.preset);
    if (!p) {
      std::cerr << "[moshrender] Unknown preset: " << args.preset << "\n";
      return std::nullopt;
    }
    preset = *p;
  }
  return timeline::ApplyPresetWithProbabilities(preset, infos, rng);
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (args.list_presets) {
    PrintPresets();
    return 0;
  }

  // Timeline document (timeline mode) or defaults (preset mode).
  timeline::TimelineDocument doc;
  if (args.IsTimelineMode()) {
    const std::string json = ReadFile(args.timeline_path);
    if (json.empty()) {
      std::cerr << "[moshrender] Failed to read: " << args.timeline_path << "\n";
      return 1;
    }
    std::string error;
    auto parsed = timeline::TimelineDocument::FromJson(json, &error);
    if (!parsed) {
      std::cerr << "[moshrender] Failed to parse " << args.timeline_path << ": " << error << "\n";
      return 1;
    }
    doc = std::move(*parsed);
    if (doc.sources.empty()) {
      std::cerr << "[moshrender] Timeline lists no \"sources\"\n";
      return 1;
    }
  } else {
    doc.sources = args.sources;
  }
  if (args.width) doc.settings.width = *args.width;
  if (args.height) doc.settings.height = *args.height;
  if (args.fps) doc.fps = *args.fps;
  if (args.volume) doc.volume = *args.volume;

  pipeline::RenderConfig config;
  config.fps = doc.fps;
  config.sample_rate = args.sample_rate;
  config.render_timeout_ms = args.timeout_ms;
  config.include_silent_audio = args.silent_audio;
  config.noise_continuity = args.continuous_noise ? audio::NoiseContinuity::kContinuousAcrossRepeats
                                                  : audio::NoiseContinuity::kRestartEachPlay;
  config.mux.audio_sample_rate = args.sample_rate;

  decode::FFmpegChunkDecoder decoder;
  encode::FFmpegCaptureSink capture_sink;
  encode::FFmpegTranscoder transcoder;
  decode::FFmpegSampleSource sample_source;
  timing::SteadyTimeSource time_source;
  pipeline::RenderPipeline pipeline(config, decoder, capture_sink, transcoder, &sample_source,
                                    time_source, nullptr);

  // Load sources.
  decode::FFmpegSourceReader reader(doc.sources);
  std::vector<std::string> ids;
  if (args.IsTimelineMode()) {
    ids = doc.ReferencedSources();
  } else {
    ids = args.source_order;
  }
  pipeline::PoolResult loaded = pipeline.LoadSources(ids, reader.AsLoader());
  if (!loaded.ok) {
    std::cerr << "[moshrender] " << timeline::RenderErrorToString(loaded.error) << ": "
              << loaded.detail << "\n";
    return 2;
  }

  if (!args.IsTimelineMode()) {
    const uint32_t seed = args.seed ? *args.seed : std::random_device{}();
    std::cerr << "[moshrender] Seed: " << seed << "\n";
    std::mt19937 rng(seed);
    auto segments = BuildPresetSegments(args, loaded, rng);
    if (!segments) {
      return 1;
    }
    doc.segments = std::move(*segments);
  }

  if (!args.dump_timeline_path.empty()) {
    const std::string json = doc.ToJson();
    if (!WriteFile(args.dump_timeline_path, json.data(), json.size())) {
      std::cerr << "[moshrender] Failed to write: " << args.dump_timeline_path << "\n";
      return 1;
    }
  }

  // One decoder configuration per render: the first segment's source.
  pipeline::RenderRequest request;
  request.item_id = args.IsTimelineMode() ? args.timeline_path : "cli";
  request.segments = doc.segments;
  request.sources = std::move(loaded.sources);
  request.settings = doc.settings;
  request.global_volume = doc.volume;
  if (!request.segments.empty()) {
    auto it = loaded.configs.find(request.segments.front().source_id);
    if (it != loaded.configs.end()) request.decoder_config = it->second;
  }

  auto progress = [](double value) {
    std::cerr << "\r[moshrender] " << std::setw(3) << static_cast<int>(value * 100.0) << "%"
              << std::flush;
  };
  pipeline::RenderResult result = pipeline.Render(request, progress);
  std::cerr << "\n";

  int exit_code = 0;
  if (!result.ok) {
    std::cerr << "[moshrender] Render failed: " << timeline::RenderErrorToString(result.error)
              << " (" << result.detail << ")\n";
    exit_code = 2;
  } else {
    auto item = pipeline.output_queue().Pop();
    if (!item || !WriteFile(args.output_path, item->media.bytes.data(), item->media.bytes.size())) {
      std::cerr << "[moshrender] Failed to write: " << args.output_path << "\n";
      exit_code = 1;
    } else {
      std::cerr << "[moshrender] Wrote " << args.output_path << " (" << item->media.mime_type
                << ", " << item->media.bytes.size() << " bytes, " << item->frame_count
                << " frames" << (item->has_audio ? ", with audio" : ", video only") << ")\n";
    }
  }

  if (!args.journal_csv_path.empty()) {
    const std::string csv = pipeline.journal().ToCsv();
    if (!WriteFile(args.journal_csv_path, csv.data(), csv.size())) {
      std::cerr << "[moshrender] Failed to write: " << args.journal_csv_path << "\n";
      if (exit_code == 0) exit_code = 1;
    }
  }

  return exit_code;
}
