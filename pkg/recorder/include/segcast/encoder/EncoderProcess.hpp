// Repository: Segcast-recorder
// Component: Encoder Process
// Purpose: Spawned external encoder: stdin pipe handle, stderr drain, termination.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_ENCODER_ENCODER_PROCESS_HPP_
#define SEGCAST_ENCODER_ENCODER_PROCESS_HPP_

#include <chrono>
#include <memory>
#include <string>

#include "segcast/encoder/EncoderInvocation.hpp"
#include "segcast/encoder/IEncoderInput.hpp"

namespace segcast::encoder {

class IEncoderProcess {
 public:
  virtual ~IEncoderProcess() = default;

  // Transfers ownership of the stdin write end. Returns nullptr after the
  // first call.
  virtual std::unique_ptr<IEncoderInput> TakeInput() = 0;

  // Returns true once the process has exited and been reaped.
  virtual bool WaitForExit(std::chrono::milliseconds timeout) = 0;

  // Forcibly kills the process (if still running) and reaps it. Idempotent.
  virtual void Terminate() = 0;

  virtual std::string Label() const = 0;
};

class IEncoderLauncher {
 public:
  virtual ~IEncoderLauncher() = default;

  // Returns nullptr with *error set when the process cannot be started
  // (pipe/fork failure or exec failure such as a missing binary).
  virtual std::unique_ptr<IEncoderProcess> Launch(const EncoderInvocation& invocation,
                                                  std::string* error) = 0;
};

// fork/execvp launcher.
//   stdin  = pipe; parent keeps the write end (O_NONBLOCK, FD_CLOEXEC)
//   stderr = pipe; drained line by line into Logger::Debug by a thread
//   stdout = /dev/null
// Exec failure is reported through a close-on-exec status pipe.
// Constructing a launcher ignores SIGPIPE process-wide so a dead encoder
// surfaces as EPIPE on write.
class PosixEncoderLauncher : public IEncoderLauncher {
 public:
  PosixEncoderLauncher();

  std::unique_ptr<IEncoderProcess> Launch(const EncoderInvocation& invocation,
                                          std::string* error) override;
};

}  // namespace segcast::encoder

#endif  // SEGCAST_ENCODER_ENCODER_PROCESS_HPP_
