// Repository: Moshline
// Component: Render Queue Implementation
// Copyright (c) 2025 RetroVue

#include "moshline/pipeline/RenderQueue.hpp"

#include <algorithm>

namespace moshline::pipeline {

using timeline::RenderError;

RenderQueue::RenderQueue(size_t capacity) : capacity_(std::max<size_t>(1, capacity)) {}

RenderQueue::EnqueueResult RenderQueue::Enqueue(RenderedItem item) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (items_.size() >= capacity_) {
    return EnqueueResult::Failure(RenderError::kQueueFull, items_.size());
  }

  if (item.media.Empty()) {
    return EnqueueResult::Failure(RenderError::kInvalidRequest, items_.size());
  }

  const bool duplicate = !item.item_id.empty() &&
      std::any_of(items_.begin(), items_.end(),
                  [&](const RenderedItem& q) { return q.item_id == item.item_id; });
  if (duplicate) {
    return EnqueueResult::Failure(RenderError::kInvalidRequest, items_.size());
  }

  items_.push_back(std::move(item));
  return EnqueueResult::Success(items_.size());
}

std::optional<RenderedItem> RenderQueue::Pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (items_.empty()) {
    return std::nullopt;
  }
  RenderedItem front = std::move(items_.front());
  items_.pop_front();
  return front;
}

size_t RenderQueue::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.size();
}

void RenderQueue::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  items_.clear();
}

}  // namespace moshline::pipeline
