// Repository: Segcast-recorder
// Component: Stream Pump
// Purpose: Drains a RelayChannel into an encoder's stdin on a dedicated writer thread.
// Copyright (c) 2025 Segcast

#include "segcast/relay/StreamPump.hpp"

#include <stdexcept>

#include "segcast/util/Logger.hpp"

namespace segcast::relay {

namespace {
constexpr auto kReceiveSlice = std::chrono::milliseconds(100);
}  // namespace

StreamPump::StreamPump(std::string name, RelayChannel& channel,
                       std::unique_ptr<encoder::IEncoderInput> input)
    : name_(std::move(name)), channel_(channel), input_(std::move(input)) {
  if (!input_) {
    throw std::invalid_argument("StreamPump: input must not be null");
  }
}

StreamPump::~StreamPump() { Shutdown(std::chrono::milliseconds(0)); }

void StreamPump::Start() {
  bool expected = false;
  if (!started_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return;
  }
  writer_thread_ = std::thread(&StreamPump::WriterLoop, this);
}

std::string StreamPump::FailureDetail() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failure_detail_;
}

void StreamPump::WriterLoop() {
  std::string error;
  while (!stop_.load(std::memory_order_acquire)) {
    auto buffer = channel_.ReceiveFor(kReceiveSlice);
    if (!buffer) {
      if (channel_.IsClosed() && channel_.Size() == 0) {
        break;
      }
      continue;
    }

    if (!input_->WriteAll(buffer->data(), buffer->size(), &error)) {
      if (stop_.load(std::memory_order_acquire)) {
        // Input was closed by Shutdown() while this write was in flight.
        break;
      }
      {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_detail_ = error;
      }
      failed_.store(true, std::memory_order_release);
      util::Logger::Error("[StreamPump:" + name_ + "] write to encoder failed: " + error +
                          " bytes_written=" + std::to_string(BytesWritten()));
      channel_.Close();
      break;
    }
    bytes_written_.fetch_add(buffer->size(), std::memory_order_relaxed);
    buffers_written_.fetch_add(1, std::memory_order_relaxed);
  }

  input_->Close();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_.store(true, std::memory_order_release);
  }
  finished_cv_.notify_all();
}

size_t StreamPump::Shutdown(std::chrono::milliseconds flush_timeout) {
  bool expected = false;
  if (!shut_down_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return 0;
  }

  channel_.Close();

  if (started_.load(std::memory_order_acquire)) {
    bool flushed = false;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      flushed = finished_cv_.wait_for(lock, flush_timeout, [this] {
        return finished_.load(std::memory_order_acquire);
      });
    }
    if (!flushed) {
      stop_.store(true, std::memory_order_release);
      input_->Close();
    }
    if (writer_thread_.joinable()) {
      writer_thread_.join();
    }
  } else {
    input_->Close();
  }

  size_t discarded = channel_.DiscardPending();
  if (discarded > 0) {
    util::Logger::Warn("[StreamPump:" + name_ + "] flush timed out, discarded=" +
                       std::to_string(discarded) + " buffers");
  }
  util::Logger::Info("[StreamPump:" + name_ + "] stopped bytes_written=" +
                     std::to_string(BytesWritten()) +
                     " buffers_written=" + std::to_string(BuffersWritten()) +
                     (HasFailed() ? " failed=true" : ""));
  return discarded;
}

}  // namespace segcast::relay
