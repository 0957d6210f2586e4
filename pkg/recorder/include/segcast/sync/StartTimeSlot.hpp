// Repository: Segcast-recorder
// Component: Start-Time Slot
// Purpose: Write-once record of the instant a stream's first data arrived.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_SYNC_START_TIME_SLOT_HPP_
#define SEGCAST_SYNC_START_TIME_SLOT_HPP_

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>

namespace segcast::sync {

using Clock = std::chrono::steady_clock;

// StartTimeSlot is written by the capture side (single writer, best effort)
// and read by the SyncResolver.
//
// TryMark() never waits: if the slot is set, or another thread holds the
// guard at that moment, the write is skipped. Once set the value never changes.
class StartTimeSlot {
 public:
  StartTimeSlot() = default;
  StartTimeSlot(const StartTimeSlot&) = delete;
  StartTimeSlot& operator=(const StartTimeSlot&) = delete;

  // Records Clock::now(). Returns true only for the call that set the slot.
  bool TryMark();
  bool TryMark(Clock::time_point at);

  std::optional<Clock::time_point> Get() const;
  bool IsSet() const { return set_.load(std::memory_order_acquire); }

 private:
  mutable std::mutex mutex_;
  std::optional<Clock::time_point> value_;
  std::atomic<bool> set_{false};
};

}  // namespace segcast::sync

#endif  // SEGCAST_SYNC_START_TIME_SLOT_HPP_
