// Repository: Moshline
// Component: Chunk Factory (test only)
// Purpose: Synthetic encoded chunk arrays with recognizable payloads.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_TESTS_FIXTURES_CHUNK_FACTORY_HPP_
#define MOSHLINE_TESTS_FIXTURES_CHUNK_FACTORY_HPP_

#include <cstdint>
#include <string>

#include "moshline/timeline/MoshTypes.hpp"

namespace moshline::testing {

// `count` chunks, a key frame every `key_interval` (first chunk is key).
// payload = { tag, index & 0xff }, so tests can tell sources and positions
// apart after expansion.
inline timeline::ChunkList MakeChunks(int64_t count, int64_t key_interval = 30,
                                      uint8_t tag = 0) {
  timeline::ChunkList chunks;
  chunks.reserve(static_cast<size_t>(count));
  for (int64_t i = 0; i < count; ++i) {
    timeline::EncodedChunk c;
    c.kind = (key_interval > 0 && i % key_interval == 0) ? timeline::ChunkKind::kKey
                                                         : timeline::ChunkKind::kDelta;
    c.timestamp_us = static_cast<uint64_t>(i) * 33'333;
    c.duration_us = 33'333;
    c.payload = {tag, static_cast<uint8_t>(i & 0xff)};
    chunks.push_back(std::move(c));
  }
  return chunks;
}

inline timeline::Segment MakeSegment(const std::string& source, int64_t from, int64_t to,
                                     uint32_t repeat = 1) {
  timeline::Segment s;
  s.source_id = source;
  s.from = from;
  s.to = to;
  s.repeat = repeat;
  return s;
}

inline timeline::DecoderConfig MakeDecoderConfig() {
  timeline::DecoderConfig cfg;
  cfg.codec = "avc1.64001f";
  cfg.coded_width = 64;
  cfg.coded_height = 48;
  cfg.description = {0x01, 0x64, 0x00, 0x1f};
  return cfg;
}

}  // namespace moshline::testing

#endif  // MOSHLINE_TESTS_FIXTURES_CHUNK_FACTORY_HPP_
