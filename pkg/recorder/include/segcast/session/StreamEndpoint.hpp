// Repository: Segcast-recorder
// Component: Stream Endpoint
// Purpose: Per-stream wiring: relay channel, start-time slot and the pump owning the encoder input.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_SESSION_STREAM_ENDPOINT_HPP_
#define SEGCAST_SESSION_STREAM_ENDPOINT_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "segcast/StreamKind.hpp"
#include "segcast/encoder/IEncoderInput.hpp"
#include "segcast/relay/RelayChannel.hpp"
#include "segcast/relay/StreamPump.hpp"
#include "segcast/sync/StartTimeSlot.hpp"

namespace segcast {

// StreamEndpoint exists once per stream kind per session.
// The capture driver calls Deliver(); the pump is attached once the encoder
// has been spawned and then owns the encoder's stdin.
class StreamEndpoint {
 public:
  StreamEndpoint(StreamKind kind, size_t capacity, sync::StartTimeSlot& start_slot);

  StreamEndpoint(const StreamEndpoint&) = delete;
  StreamEndpoint& operator=(const StreamEndpoint&) = delete;

  // Real-time safe: never blocks on a full channel. The first accepted
  // buffer marks the stream's start time.
  void Deliver(const uint8_t* data, size_t len);

  // Starts the pump writing into `input`. Returns false if already attached
  // or `input` is null.
  bool AttachEncoderInput(std::unique_ptr<encoder::IEncoderInput> input);

  // Closes the channel and flushes it into the encoder for at most
  // `flush_timeout`; closes the encoder input. Idempotent.
  void Close(std::chrono::milliseconds flush_timeout);

  bool PipeFailed() const;
  std::string PipeFailureDetail() const;

  StreamKind Kind() const { return kind_; }
  relay::RelayChannel& Channel() { return channel_; }

 private:
  const StreamKind kind_;
  relay::RelayChannel channel_;
  sync::StartTimeSlot& start_slot_;
  std::unique_ptr<relay::StreamPump> pump_;
};

}  // namespace segcast

#endif  // SEGCAST_SESSION_STREAM_ENDPOINT_HPP_
