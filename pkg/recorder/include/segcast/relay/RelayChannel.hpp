// Repository: Segcast-recorder
// Component: Relay Channel
// Purpose: Bounded single-producer/single-consumer byte-buffer queue with drop-on-full ingress.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_RELAY_RELAY_CHANNEL_HPP_
#define SEGCAST_RELAY_RELAY_CHANNEL_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace segcast::relay {

using Buffer = std::vector<uint8_t>;

// RelayChannel decouples a real-time producer (audio callback, frame-polling
// thread) from the StreamPump that writes into the encoder pipe.
//
// Producer side:
//   TryOffer() never blocks on a full queue. When `capacity` buffers are
//   queued the incoming buffer is dropped and counted; a warning is emitted
//   at most once per second. The only wait is the short queue mutex.
//
// Consumer side:
//   Receive() blocks until a buffer is available or the channel is closed.
//   After Close(), buffers already queued are still handed out in order;
//   Receive() returns nullopt once the channel is closed and empty.
class RelayChannel {
 public:
  // capacity: maximum queued buffers. Throws std::invalid_argument if 0.
  explicit RelayChannel(size_t capacity, std::string name = "relay");
  ~RelayChannel();

  RelayChannel(const RelayChannel&) = delete;
  RelayChannel& operator=(const RelayChannel&) = delete;

  // Returns true if queued; false if dropped (full) or the channel is closed.
  bool TryOffer(Buffer buffer);
  bool TryOffer(const uint8_t* data, size_t len);

  // Blocks until a buffer is available or the channel is closed and empty.
  std::optional<Buffer> Receive();

  // Like Receive() but gives up after `timeout`. Returns nullopt on timeout
  // as well as on closed-and-empty; use IsClosed() to tell them apart.
  std::optional<Buffer> ReceiveFor(std::chrono::milliseconds timeout);

  // Idempotent. Wakes a blocked Receive(). Logs the drop total once.
  void Close();

  // Discards queued buffers and returns how many were discarded.
  size_t DiscardPending();

  bool IsClosed() const { return closed_.load(std::memory_order_acquire); }
  size_t Size() const;
  size_t Capacity() const { return capacity_; }
  uint64_t OfferedCount() const { return offered_.load(std::memory_order_relaxed); }
  uint64_t DroppedCount() const { return dropped_.load(std::memory_order_relaxed); }
  const std::string& Name() const { return name_; }

 private:
  void LogDropRateLimited(size_t queued);

  const size_t capacity_;
  const std::string name_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Buffer> queue_;

  std::atomic<bool> closed_{false};
  std::atomic<uint64_t> offered_{0};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<int64_t> last_drop_log_ms_{0};
};

}  // namespace segcast::relay

#endif  // SEGCAST_RELAY_RELAY_CHANNEL_HPP_
