// Repository: Segcast-recorder
// Component: Stream Pump
// Purpose: Drains a RelayChannel into an encoder's stdin on a dedicated writer thread.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_RELAY_STREAM_PUMP_HPP_
#define SEGCAST_RELAY_STREAM_PUMP_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "segcast/encoder/IEncoderInput.hpp"
#include "segcast/relay/RelayChannel.hpp"

namespace segcast::relay {

// StreamPump is the single consumer of one RelayChannel. Buffers are written
// to the encoder input strictly in receive order.
//
// The pump ends when:
//   - the channel is closed and empty (normal end-of-stream), or
//   - a write fails (broken pipe): the failure is recorded, logged, and the
//     channel is closed so the producer stops queueing. Only this stream is
//     affected.
// In both cases the encoder input is closed on exit, signaling EOF.
class StreamPump {
 public:
  // The pump takes ownership of `input`. `channel` must outlive the pump.
  StreamPump(std::string name, RelayChannel& channel,
             std::unique_ptr<encoder::IEncoderInput> input);
  ~StreamPump();

  StreamPump(const StreamPump&) = delete;
  StreamPump& operator=(const StreamPump&) = delete;

  void Start();

  // Closes the channel and lets the pump flush queued buffers for at most
  // `flush_timeout`. After that the input is closed (aborting any write) and
  // whatever is still queued is discarded. Joins the writer thread.
  // Returns the number of discarded buffers. Idempotent.
  size_t Shutdown(std::chrono::milliseconds flush_timeout);

  bool HasFailed() const { return failed_.load(std::memory_order_acquire); }
  std::string FailureDetail() const;
  uint64_t BytesWritten() const { return bytes_written_.load(std::memory_order_relaxed); }
  uint64_t BuffersWritten() const { return buffers_written_.load(std::memory_order_relaxed); }
  bool IsFinished() const { return finished_.load(std::memory_order_acquire); }

 private:
  void WriterLoop();

  const std::string name_;
  RelayChannel& channel_;
  std::unique_ptr<encoder::IEncoderInput> input_;

  std::thread writer_thread_;
  std::atomic<bool> started_{false};
  std::atomic<bool> shut_down_{false};
  std::atomic<bool> stop_{false};
  std::atomic<bool> failed_{false};
  std::atomic<bool> finished_{false};

  std::atomic<uint64_t> bytes_written_{0};
  std::atomic<uint64_t> buffers_written_{0};

  mutable std::mutex mutex_;
  std::condition_variable finished_cv_;
  std::string failure_detail_;
};

}  // namespace segcast::relay

#endif  // SEGCAST_RELAY_STREAM_PUMP_HPP_
