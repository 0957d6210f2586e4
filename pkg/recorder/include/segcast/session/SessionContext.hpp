// Repository: Segcast-recorder
// Component: Session Context
// Purpose: Session-scoped shared state: shutdown/drain flags and start-time slots.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_SESSION_SESSION_CONTEXT_HPP_
#define SEGCAST_SESSION_SESSION_CONTEXT_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

#include "segcast/StreamKind.hpp"
#include "segcast/sync/StartTimeSlot.hpp"

namespace segcast {

// SessionContext is created per start() and handed by reference to every
// task of that session. Nothing in it is process-global.
//
// All flags move false -> true once and are never reset.
//   shutdown          written by stop(); read by every loop
//   encoders_stopped  written by stop() after encoder termination; gates
//                     the watchers' final pass
//   drained(kind)     written by that stream's SegmentWatcher when Done
class SessionContext {
 public:
  SessionContext() = default;
  SessionContext(const SessionContext&) = delete;
  SessionContext& operator=(const SessionContext&) = delete;

  void RequestShutdown();
  bool IsShuttingDown() const { return shutdown_.load(std::memory_order_acquire); }
  const std::atomic<bool>& ShutdownFlag() const { return shutdown_; }

  // Sleeps up to `duration`, returning early (true) if shutdown is requested.
  bool SleepUnlessShutdown(std::chrono::milliseconds duration);

  void MarkEncodersStopped();
  bool EncodersStopped() const { return encoders_stopped_.load(std::memory_order_acquire); }
  bool WaitForEncodersStopped(std::chrono::milliseconds timeout);

  void MarkDrained(StreamKind kind);
  bool IsDrained(StreamKind kind) const;
  // True once both streams are drained; false on timeout.
  bool WaitForAllDrained(std::chrono::milliseconds timeout);

  sync::StartTimeSlot& StartSlot(StreamKind kind) {
    return kind == StreamKind::kAudio ? audio_start_ : video_start_;
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;

  std::atomic<bool> shutdown_{false};
  std::atomic<bool> encoders_stopped_{false};
  std::atomic<bool> audio_drained_{false};
  std::atomic<bool> video_drained_{false};

  sync::StartTimeSlot audio_start_;
  sync::StartTimeSlot video_start_;
};

}  // namespace segcast

#endif  // SEGCAST_SESSION_SESSION_CONTEXT_HPP_
