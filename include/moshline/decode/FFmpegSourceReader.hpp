// Repository: Moshline
// Component: FFmpeg Source Reader
// Purpose: Demux a media file into encoded chunks plus its decoder config.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_DECODE_FFMPEG_SOURCE_READER_HPP_
#define MOSHLINE_DECODE_FFMPEG_SOURCE_READER_HPP_

#include <map>
#include <string>

#include "moshline/pipeline/SourceDecodePool.hpp"

namespace moshline::decode {

// Reads the first video stream of each source in decode order. No decoding
// happens here; payloads are the container's compressed samples.
//
// Thread Safety:
// - Load() is safe to call concurrently (each call owns its demuxer)
class FFmpegSourceReader {
 public:
  // `paths` maps source id -> file path or URL understood by libavformat.
  explicit FFmpegSourceReader(std::map<std::string, std::string> paths);

  pipeline::SourceLoadResult Load(const std::string& source_id) const;

  // Loader bound to this reader, for SourceDecodePool::LoadAll().
  pipeline::SourceLoaderFn AsLoader() const;

  static pipeline::SourceLoadResult ReadFile(const std::string& path);

 private:
  std::map<std::string, std::string> paths_;
};

}  // namespace moshline::decode

#endif  // MOSHLINE_DECODE_FFMPEG_SOURCE_READER_HPP_
