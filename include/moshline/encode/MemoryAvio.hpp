// Repository: Moshline
// Component: In-Memory AVIO
// Purpose: libavformat I/O over byte vectors so capture, mux and source
//          reads never touch temporary files.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_ENCODE_MEMORY_AVIO_HPP_
#define MOSHLINE_ENCODE_MEMORY_AVIO_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVIOContext;

namespace moshline::encode {

// Readable, seekable view of a caller-owned buffer. The buffer must outlive
// the reader.
class MemoryInput {
 public:
  MemoryInput(const uint8_t* data, size_t size);
  ~MemoryInput();

  MemoryInput(const MemoryInput&) = delete;
  MemoryInput& operator=(const MemoryInput&) = delete;

  // Returns false when the AVIO context cannot be allocated.
  bool Open();
  AVIOContext* context() const { return avio_ctx_; }

 private:
  static int ReadThunk(void* opaque, uint8_t* buf, int buf_size);
  static int64_t SeekThunk(void* opaque, int64_t offset, int whence);

  const uint8_t* data_;
  size_t size_;
  size_t pos_ = 0;
  AVIOContext* avio_ctx_ = nullptr;
};

// Growable, seekable output. MP4 rewrites its header on trailer, so the
// writer supports seeking back into already written bytes.
class MemoryOutput {
 public:
  MemoryOutput() = default;
  ~MemoryOutput();

  MemoryOutput(const MemoryOutput&) = delete;
  MemoryOutput& operator=(const MemoryOutput&) = delete;

  bool Open();
  AVIOContext* context() const { return avio_ctx_; }

  // Flush the AVIO buffer and hand over everything written so far.
  std::vector<uint8_t> TakeBytes();

  size_t size() const { return bytes_.size(); }

 private:
  static int WriteThunk(void* opaque, uint8_t* buf, int buf_size);
  static int64_t SeekThunk(void* opaque, int64_t offset, int whence);

  std::vector<uint8_t> bytes_;
  size_t pos_ = 0;
  AVIOContext* avio_ctx_ = nullptr;
};

// av_strerror() into a std::string.
std::string AvErrorString(int errnum);

}  // namespace moshline::encode

#endif  // MOSHLINE_ENCODE_MEMORY_AVIO_HPP_
