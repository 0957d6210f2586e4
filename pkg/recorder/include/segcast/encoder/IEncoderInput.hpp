// Repository: Segcast-recorder
// Component: Encoder Input
// Purpose: Write end of an encoder's standard input.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_ENCODER_IENCODER_INPUT_HPP_
#define SEGCAST_ENCODER_IENCODER_INPUT_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

namespace segcast::encoder {

// IEncoderInput is the single-owner write end of an encoder's stdin.
// Ownership moves from the process into exactly one StreamPump.
class IEncoderInput {
 public:
  virtual ~IEncoderInput() = default;

  // Writes all `len` bytes. Returns false (with *error set) on a broken pipe,
  // any other write error, or when Close() is called during the write.
  virtual bool WriteAll(const uint8_t* data, size_t len, std::string* error) = 0;

  // Idempotent and safe to call from any thread. Signals end-of-stream to
  // the encoder. An in-progress WriteAll returns within one poll period.
  virtual void Close() = 0;

  virtual bool IsClosed() const = 0;
};

}  // namespace segcast::encoder

#endif  // SEGCAST_ENCODER_IENCODER_INPUT_HPP_
