// Repository: Segcast-recorder
// Component: Pipe Encoder Input
// Purpose: poll()+write() writer for a non-blocking encoder stdin file descriptor.
// Copyright (c) 2025 Segcast

#include "segcast/encoder/PipeEncoderInput.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace segcast::encoder {

namespace {
constexpr int kPollTimeoutMs = 100;

void SetError(std::string* error, const std::string& text) {
  if (error) *error = text;
}
}  // namespace

PipeEncoderInput::PipeEncoderInput(int fd, std::string name) : fd_(fd), name_(std::move(name)) {}

PipeEncoderInput::~PipeEncoderInput() { Close(); }

bool PipeEncoderInput::WriteAll(const uint8_t* data, size_t len, std::string* error) {
  std::lock_guard<std::mutex> lock(write_mutex_);

  size_t offset = 0;
  while (offset < len) {
    if (closed_.load(std::memory_order_acquire) || fd_ < 0) {
      SetError(error, name_ + ": input closed");
      return false;
    }

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    int rc = ::poll(&pfd, 1, kPollTimeoutMs);
    if (rc < 0) {
      if (errno == EINTR) continue;
      SetError(error, name_ + ": poll failed: " + std::strerror(errno));
      return false;
    }
    if (rc == 0) {
      continue;
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
      SetError(error, name_ + ": broken pipe (encoder closed its input)");
      return false;
    }

    ssize_t n = ::write(fd_, data + offset, len - offset);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
      if (errno == EPIPE) {
        SetError(error, name_ + ": broken pipe (encoder exited)");
      } else {
        SetError(error, name_ + ": write failed: " + std::strerror(errno));
      }
      return false;
    }
    offset += static_cast<size_t>(n);
  }
  return true;
}

void PipeEncoderInput::Close() {
  bool expected = false;
  if (!closed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return;
  }
  // An in-flight WriteAll observes closed_ within one poll slice.
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

}  // namespace segcast::encoder
