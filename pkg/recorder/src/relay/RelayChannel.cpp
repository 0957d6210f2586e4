// Repository: Segcast-recorder
// Component: Relay Channel
// Purpose: Bounded single-producer/single-consumer byte-buffer queue with drop-on-full ingress.
// Copyright (c) 2025 Segcast

#include "segcast/relay/RelayChannel.hpp"

#include <stdexcept>

#include "segcast/util/Logger.hpp"

namespace segcast::relay {

namespace {

int64_t SteadyNowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

}  // namespace

RelayChannel::RelayChannel(size_t capacity, std::string name)
    : capacity_(capacity), name_(std::move(name)) {
  if (capacity_ == 0) {
    throw std::invalid_argument("RelayChannel: capacity must be > 0");
  }
}

RelayChannel::~RelayChannel() { Close(); }

bool RelayChannel::TryOffer(const uint8_t* data, size_t len) {
  if (data == nullptr || len == 0) {
    return false;
  }
  return TryOffer(Buffer(data, data + len));
}

bool RelayChannel::TryOffer(Buffer buffer) {
  if (closed_.load(std::memory_order_acquire)) {
    return false;
  }
  offered_.fetch_add(1, std::memory_order_relaxed);

  size_t queued = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.size() >= capacity_) {
      queued = queue_.size();
    } else {
      queue_.push_back(std::move(buffer));
      queued = 0;
    }
  }

  if (queued != 0) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    LogDropRateLimited(queued);
    return false;
  }
  cv_.notify_one();
  return true;
}

void RelayChannel::LogDropRateLimited(size_t queued) {
  const int64_t now_ms = SteadyNowMs();
  int64_t last = last_drop_log_ms_.load(std::memory_order_relaxed);
  if (now_ms - last <= 1000) {
    return;
  }
  if (!last_drop_log_ms_.compare_exchange_strong(last, now_ms, std::memory_order_relaxed)) {
    return;
  }
  util::Logger::Warn("[RelayChannel:" + name_ + "] channel full, dropping data" +
                     " queued=" + std::to_string(queued) +
                     " capacity=" + std::to_string(capacity_) +
                     " dropped_total=" + std::to_string(DroppedCount()));
}

std::optional<Buffer> RelayChannel::Receive() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] {
    return !queue_.empty() || closed_.load(std::memory_order_acquire);
  });
  if (queue_.empty()) {
    return std::nullopt;
  }
  Buffer out = std::move(queue_.front());
  queue_.pop_front();
  return out;
}

std::optional<Buffer> RelayChannel::ReceiveFor(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] {
    return !queue_.empty() || closed_.load(std::memory_order_acquire);
  });
  if (queue_.empty()) {
    return std::nullopt;
  }
  Buffer out = std::move(queue_.front());
  queue_.pop_front();
  return out;
}

void RelayChannel::Close() {
  bool expected = false;
  if (!closed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return;
  }
  {
    // Publish the close under the lock so a waiter cannot miss the wakeup.
    std::lock_guard<std::mutex> lock(mutex_);
  }
  cv_.notify_all();

  const uint64_t dropped = DroppedCount();
  if (dropped > 0) {
    util::Logger::Warn("[RelayChannel:" + name_ + "] closed offered=" +
                       std::to_string(OfferedCount()) +
                       " dropped=" + std::to_string(dropped));
  }
}

size_t RelayChannel::DiscardPending() {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t n = queue_.size();
  queue_.clear();
  return n;
}

size_t RelayChannel::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

}  // namespace segcast::relay
