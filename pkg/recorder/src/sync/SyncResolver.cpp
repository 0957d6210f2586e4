// Repository: Segcast-recorder
// Component: Synchronization Resolver
// Purpose: One-shot start-time alignment between the audio and video encoders.
// Copyright (c) 2025 Segcast

#include "segcast/sync/SyncResolver.hpp"

#include <thread>

#include "segcast/util/Logger.hpp"

namespace segcast::sync {

const char* SyncTargetName(SyncAdjustment::Target target) {
  switch (target) {
    case SyncAdjustment::Target::kNone:
      return "none";
    case SyncAdjustment::Target::kAudio:
      return "audio";
    case SyncAdjustment::Target::kVideo:
      return "video";
  }
  return "unknown";
}

SyncResolver::SyncResolver(const StartTimeSlot& audio, const StartTimeSlot& video)
    : audio_(audio), video_(video) {}

WaitOutcome SyncResolver::WaitForStartTimes(std::chrono::milliseconds poll_interval,
                                            std::chrono::milliseconds timeout,
                                            const std::atomic<bool>* shutdown) const {
  const auto deadline = Clock::now() + timeout;
  WaitOutcome outcome;
  while (true) {
    outcome.audio_ready = audio_.IsSet();
    outcome.video_ready = video_.IsSet();
    if (outcome.audio_ready && outcome.video_ready) {
      outcome.status = WaitStatus::kReady;
      return outcome;
    }
    if (shutdown != nullptr && shutdown->load(std::memory_order_acquire)) {
      outcome.status = WaitStatus::kCancelled;
      return outcome;
    }
    if (Clock::now() >= deadline) {
      outcome.status = WaitStatus::kTimedOut;
      return outcome;
    }
    std::this_thread::sleep_for(poll_interval);
  }
}

SyncAdjustment SyncResolver::Compute(Clock::time_point audio_start,
                                     Clock::time_point video_start) {
  SyncAdjustment adj;
  if (audio_start > video_start) {
    adj.target = SyncAdjustment::Target::kVideo;
    adj.offset = audio_start - video_start;
  } else if (video_start > audio_start) {
    adj.target = SyncAdjustment::Target::kAudio;
    adj.offset = video_start - audio_start;
  }
  return adj;
}

bool SyncResolver::Apply(const SyncAdjustment& adjustment,
                         encoder::EncoderInvocation& audio,
                         encoder::EncoderInvocation& video) {
  switch (adjustment.target) {
    case SyncAdjustment::Target::kNone:
      return true;
    case SyncAdjustment::Target::kAudio:
      return audio.ApplyInputOffset(adjustment.offset);
    case SyncAdjustment::Target::kVideo:
      return video.ApplyInputOffset(adjustment.offset);
  }
  return false;
}

bool SyncResolver::Resolve(encoder::EncoderInvocation& audio, encoder::EncoderInvocation& video,
                           SyncAdjustment* applied) const {
  auto audio_start = audio_.Get();
  auto video_start = video_.Get();
  if (!audio_start || !video_start) {
    return false;
  }
  SyncAdjustment adj = Compute(*audio_start, *video_start);
  if (!Apply(adj, audio, video)) {
    util::Logger::Warn(std::string("[SyncResolver] offset already applied target=") +
                       SyncTargetName(adj.target));
    return false;
  }
  util::Logger::Info(std::string("[SyncResolver] start times resolved target=") +
                     SyncTargetName(adj.target) +
                     " offset_s=" + encoder::FormatOffsetSeconds(adj.offset));
  if (applied) {
    *applied = adj;
  }
  return true;
}

}  // namespace segcast::sync
