// Repository: Segcast-recorder
// Component: Synchronization Resolver
// Purpose: One-shot start-time alignment between the audio and video encoders.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_SYNC_SYNC_RESOLVER_HPP_
#define SEGCAST_SYNC_SYNC_RESOLVER_HPP_

#include <atomic>
#include <chrono>
#include <string>

#include "segcast/StreamKind.hpp"
#include "segcast/encoder/EncoderInvocation.hpp"
#include "segcast/sync/StartTimeSlot.hpp"

namespace segcast::sync {

// Which invocation receives the input offset.
struct SyncAdjustment {
  enum class Target { kNone, kAudio, kVideo };

  Target target = Target::kNone;
  std::chrono::nanoseconds offset{0};  // Magnitude; zero iff target == kNone.
};

const char* SyncTargetName(SyncAdjustment::Target target);

enum class WaitStatus {
  kReady,      // Both slots populated.
  kTimedOut,   // Deadline passed with at least one slot empty.
  kCancelled,  // Shutdown observed before both slots populated.
};

struct WaitOutcome {
  WaitStatus status = WaitStatus::kReady;
  bool audio_ready = false;
  bool video_ready = false;
};

// SyncResolver runs once per session, before the encoders are spawned.
// Later drift is not corrected; segment boundaries are the playback unit.
class SyncResolver {
 public:
  SyncResolver(const StartTimeSlot& audio, const StartTimeSlot& video);

  // Polls both slots every `poll_interval` until both are set, `timeout`
  // elapses, or `shutdown` (if given) becomes true.
  WaitOutcome WaitForStartTimes(std::chrono::milliseconds poll_interval,
                                std::chrono::milliseconds timeout,
                                const std::atomic<bool>* shutdown = nullptr) const;

  // Pure rule: the stream that started earlier is shifted forward by the
  // difference, so the invocation adjusted is the one opposite to the later
  // starter. Equal times produce no adjustment.
  static SyncAdjustment Compute(Clock::time_point audio_start, Clock::time_point video_start);

  // Applies `adjustment` to exactly one invocation (or none). Returns false if
  // the target invocation already carried an offset.
  static bool Apply(const SyncAdjustment& adjustment,
                    encoder::EncoderInvocation& audio,
                    encoder::EncoderInvocation& video);

  // Compute + Apply from the current slot values. Both slots must be set;
  // returns false otherwise.
  bool Resolve(encoder::EncoderInvocation& audio, encoder::EncoderInvocation& video,
               SyncAdjustment* applied = nullptr) const;

 private:
  const StartTimeSlot& audio_;
  const StartTimeSlot& video_;
};

}  // namespace segcast::sync

#endif  // SEGCAST_SYNC_SYNC_RESOLVER_HPP_
