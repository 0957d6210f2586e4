// Repository: Segcast-recorder
// Component: Pipe Encoder Input
// Purpose: poll()+write() writer for a non-blocking encoder stdin file descriptor.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_ENCODER_PIPE_ENCODER_INPUT_HPP_
#define SEGCAST_ENCODER_PIPE_ENCODER_INPUT_HPP_

#include <atomic>
#include <mutex>
#include <string>

#include "segcast/encoder/IEncoderInput.hpp"

namespace segcast::encoder {

// PipeEncoderInput takes ownership of `fd`, which MUST be O_NONBLOCK.
// WriteAll waits for POLLOUT in 100ms slices and re-checks the closed flag
// between slices; Close() waits for an in-flight WriteAll to notice, then
// closes the descriptor, so the fd is never closed under a running write.
class PipeEncoderInput : public IEncoderInput {
 public:
  explicit PipeEncoderInput(int fd, std::string name = "encoder");
  ~PipeEncoderInput() override;

  PipeEncoderInput(const PipeEncoderInput&) = delete;
  PipeEncoderInput& operator=(const PipeEncoderInput&) = delete;

  bool WriteAll(const uint8_t* data, size_t len, std::string* error) override;
  void Close() override;
  bool IsClosed() const override { return closed_.load(std::memory_order_acquire); }

 private:
  int fd_;
  const std::string name_;
  std::atomic<bool> closed_{false};
  std::mutex write_mutex_;
};

}  // namespace segcast::encoder

#endif  // SEGCAST_ENCODER_PIPE_ENCODER_INPUT_HPP_
