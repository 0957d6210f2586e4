// Repository: Segcast-recorder
// Component: Start-Time Slot
// Purpose: Write-once record of the instant a stream's first data arrived.
// Copyright (c) 2025 Segcast

#include "segcast/sync/StartTimeSlot.hpp"

namespace segcast::sync {

bool StartTimeSlot::TryMark() { return TryMark(Clock::now()); }

bool StartTimeSlot::TryMark(Clock::time_point at) {
  // Fast path for every delivery after the first.
  if (set_.load(std::memory_order_acquire)) {
    return false;
  }
  std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
  if (!lock.owns_lock() || value_.has_value()) {
    return false;
  }
  value_ = at;
  set_.store(true, std::memory_order_release);
  return true;
}

std::optional<Clock::time_point> StartTimeSlot::Get() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return value_;
}

}  // namespace segcast::sync
