// Repository: Moshline
// Component: Render Queue
// Purpose: Bounded FIFO of finished deliverables owned by a RenderPipeline
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_PIPELINE_RENDER_QUEUE_HPP_
#define MOSHLINE_PIPELINE_RENDER_QUEUE_HPP_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "moshline/timeline/MoshTypes.hpp"

namespace moshline::pipeline {

// One complete render. Only fully muxed (or deliberately video-only)
// results are ever enqueued.
struct RenderedItem {
  std::string item_id;
  timeline::MediaBlob media;
  bool has_audio = false;
  int64_t frame_count = 0;
  int64_t audio_samples = 0;
  int64_t render_ms = 0;
};

// Thread-safe. Consumers may Pop() from another thread while renders run.
class RenderQueue {
 public:
  explicit RenderQueue(size_t capacity);

  RenderQueue(const RenderQueue&) = delete;
  RenderQueue& operator=(const RenderQueue&) = delete;

  struct EnqueueResult {
    bool success;
    timeline::RenderError error;
    size_t depth;  // Queue depth after the call

    static EnqueueResult Success(size_t d) {
      return {true, timeline::RenderError::kNone, d};
    }
    static EnqueueResult Failure(timeline::RenderError e, size_t d) {
      return {false, e, d};
    }
  };

  // Rejects with kQueueFull at capacity, kInvalidRequest on empty media or
  // a duplicate item id.
  EnqueueResult Enqueue(RenderedItem item);

  std::optional<RenderedItem> Pop();

  size_t Size() const;
  bool Empty() const { return Size() == 0; }
  bool Full() const { return Size() >= capacity_; }
  size_t Capacity() const { return capacity_; }

  void Clear();

 private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<RenderedItem> items_;
};

}  // namespace moshline::pipeline

#endif  // MOSHLINE_PIPELINE_RENDER_QUEUE_HPP_
