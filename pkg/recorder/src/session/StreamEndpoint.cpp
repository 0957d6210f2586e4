// Repository: Segcast-recorder
// Component: Stream Endpoint
// Purpose: Per-stream wiring: relay channel, start-time slot and the pump owning the encoder input.
// Copyright (c) 2025 Segcast

#include "segcast/session/StreamEndpoint.hpp"

namespace segcast {

StreamEndpoint::StreamEndpoint(StreamKind kind, size_t capacity, sync::StartTimeSlot& start_slot)
    : kind_(kind), channel_(capacity, StreamKindName(kind)), start_slot_(start_slot) {}

void StreamEndpoint::Deliver(const uint8_t* data, size_t len) {
  if (channel_.TryOffer(data, len)) {
    start_slot_.TryMark();
  }
}

bool StreamEndpoint::AttachEncoderInput(std::unique_ptr<encoder::IEncoderInput> input) {
  if (pump_ || !input) {
    return false;
  }
  pump_ = std::make_unique<relay::StreamPump>(StreamKindName(kind_), channel_, std::move(input));
  pump_->Start();
  return true;
}

void StreamEndpoint::Close(std::chrono::milliseconds flush_timeout) {
  if (pump_) {
    pump_->Shutdown(flush_timeout);
  } else {
    channel_.Close();
  }
}

bool StreamEndpoint::PipeFailed() const { return pump_ && pump_->HasFailed(); }

std::string StreamEndpoint::PipeFailureDetail() const {
  return pump_ ? pump_->FailureDetail() : std::string();
}

}  // namespace segcast
