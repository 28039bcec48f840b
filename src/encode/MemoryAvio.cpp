// Repository: Moshline
// Component: In-Memory AVIO
// Purpose: libavformat I/O over byte vectors.
// Copyright (c) 2025 RetroVue

#include "moshline/encode/MemoryAvio.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

extern "C" {
#include <libavformat/avio.h>
#include <libavutil/error.h>
#include <libavutil/mem.h>
}

namespace moshline::encode {

namespace {

constexpr int kAvioBufferSize = 64 * 1024;

void FreeAvio(AVIOContext*& ctx) {
  if (!ctx) return;
  av_freep(&ctx->buffer);
  avio_context_free(&ctx);
  ctx = nullptr;
}

// Resolve a seek request against `size`. Returns -1 for unknown whence.
int64_t ResolveSeek(int64_t offset, int whence, size_t pos, size_t size) {
  switch (whence & ~AVSEEK_FORCE) {
    case AVSEEK_SIZE: return static_cast<int64_t>(size);
    case SEEK_SET:    return offset;
    case SEEK_CUR:    return static_cast<int64_t>(pos) + offset;
    case SEEK_END:    return static_cast<int64_t>(size) + offset;
    default:          return -1;
  }
}

}  // namespace

std::string AvErrorString(int errnum) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(errnum, errbuf, sizeof(errbuf));
  return errbuf;
}

// =============================================================================
// MemoryInput
// =============================================================================

MemoryInput::MemoryInput(const uint8_t* data, size_t size) : data_(data), size_(size) {}

MemoryInput::~MemoryInput() { FreeAvio(avio_ctx_); }

bool MemoryInput::Open() {
  auto* buffer = static_cast<uint8_t*>(av_malloc(kAvioBufferSize));
  if (!buffer) return false;
  avio_ctx_ = avio_alloc_context(buffer, kAvioBufferSize, 0, this, &MemoryInput::ReadThunk,
                                 nullptr, &MemoryInput::SeekThunk);
  if (!avio_ctx_) {
    av_free(buffer);
    return false;
  }
  return true;
}

int MemoryInput::ReadThunk(void* opaque, uint8_t* buf, int buf_size) {
  auto* self = static_cast<MemoryInput*>(opaque);
  if (self->pos_ >= self->size_) return AVERROR_EOF;
  const size_t n = std::min(static_cast<size_t>(buf_size), self->size_ - self->pos_);
  std::memcpy(buf, self->data_ + self->pos_, n);
  self->pos_ += n;
  return static_cast<int>(n);
}

int64_t MemoryInput::SeekThunk(void* opaque, int64_t offset, int whence) {
  auto* self = static_cast<MemoryInput*>(opaque);
  const int64_t target = ResolveSeek(offset, whence, self->pos_, self->size_);
  if ((whence & ~AVSEEK_FORCE) == AVSEEK_SIZE) return target;
  if (target < 0 || target > static_cast<int64_t>(self->size_)) return AVERROR(EINVAL);
  self->pos_ = static_cast<size_t>(target);
  return target;
}

// =============================================================================
// MemoryOutput
// =============================================================================

MemoryOutput::~MemoryOutput() { FreeAvio(avio_ctx_); }

bool MemoryOutput::Open() {
  auto* buffer = static_cast<uint8_t*>(av_malloc(kAvioBufferSize));
  if (!buffer) return false;
  avio_ctx_ = avio_alloc_context(buffer, kAvioBufferSize, 1, this, nullptr,
                                 &MemoryOutput::WriteThunk, &MemoryOutput::SeekThunk);
  if (!avio_ctx_) {
    av_free(buffer);
    return false;
  }
  return true;
}

std::vector<uint8_t> MemoryOutput::TakeBytes() {
  if (avio_ctx_) avio_flush(avio_ctx_);
  pos_ = 0;
  return std::move(bytes_);
}

int MemoryOutput::WriteThunk(void* opaque, uint8_t* buf, int buf_size) {
  auto* self = static_cast<MemoryOutput*>(opaque);
  if (buf_size <= 0) return 0;
  const size_t end = self->pos_ + static_cast<size_t>(buf_size);
  if (end > self->bytes_.size()) self->bytes_.resize(end);
  std::memcpy(self->bytes_.data() + self->pos_, buf, static_cast<size_t>(buf_size));
  self->pos_ = end;
  return buf_size;
}

int64_t MemoryOutput::SeekThunk(void* opaque, int64_t offset, int whence) {
  auto* self = static_cast<MemoryOutput*>(opaque);
  const int64_t target = ResolveSeek(offset, whence, self->pos_, self->bytes_.size());
  if ((whence & ~AVSEEK_FORCE) == AVSEEK_SIZE) return target;
  if (target < 0) return AVERROR(EINVAL);
  self->pos_ = static_cast<size_t>(target);
  return target;
}

}  // namespace moshline::encode
