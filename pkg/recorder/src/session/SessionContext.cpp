// Repository: Segcast-recorder
// Component: Session Context
// Purpose: Session-scoped shared state: shutdown/drain flags and start-time slots.
// Copyright (c) 2025 Segcast

#include "segcast/session/SessionContext.hpp"

namespace segcast {

void SessionContext::RequestShutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_.store(true, std::memory_order_release);
  }
  cv_.notify_all();
}

bool SessionContext::SleepUnlessShutdown(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, duration,
                      [this] { return shutdown_.load(std::memory_order_acquire); });
}

void SessionContext::MarkEncodersStopped() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    encoders_stopped_.store(true, std::memory_order_release);
  }
  cv_.notify_all();
}

bool SessionContext::WaitForEncodersStopped(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout,
                      [this] { return encoders_stopped_.load(std::memory_order_acquire); });
}

void SessionContext::MarkDrained(StreamKind kind) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    (kind == StreamKind::kAudio ? audio_drained_ : video_drained_)
        .store(true, std::memory_order_release);
  }
  cv_.notify_all();
}

bool SessionContext::IsDrained(StreamKind kind) const {
  return (kind == StreamKind::kAudio ? audio_drained_ : video_drained_)
      .load(std::memory_order_acquire);
}

bool SessionContext::WaitForAllDrained(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] {
    return audio_drained_.load(std::memory_order_acquire) &&
           video_drained_.load(std::memory_order_acquire);
  });
}

}  // namespace segcast
