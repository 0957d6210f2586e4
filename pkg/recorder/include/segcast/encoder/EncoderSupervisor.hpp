// Repository: Segcast-recorder
// Component: Encoder Process Supervisor
// Purpose: Owns both encoder processes for a session; hands out stdin handles; ordered termination.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_ENCODER_ENCODER_SUPERVISOR_HPP_
#define SEGCAST_ENCODER_ENCODER_SUPERVISOR_HPP_

#include <chrono>
#include <memory>
#include <mutex>

#include "segcast/StreamKind.hpp"
#include "segcast/encoder/EncoderInvocation.hpp"
#include "segcast/encoder/EncoderProcess.hpp"
#include "segcast/session/SessionErrors.hpp"

namespace segcast::encoder {

// EncoderSupervisor spawns the audio and video encoders as a pair.
//
// Termination order is fixed: every stdin still held here is closed first,
// each process gets `grace` to finalize its last segment and exit, and only
// then is it killed. Every process is reaped.
class EncoderSupervisor {
 public:
  explicit EncoderSupervisor(IEncoderLauncher& launcher);
  ~EncoderSupervisor();

  EncoderSupervisor(const EncoderSupervisor&) = delete;
  EncoderSupervisor& operator=(const EncoderSupervisor&) = delete;

  // Spawns audio then video. If either fails, nothing is left running and
  // the result is kProcessError.
  SessionResult SpawnAll(const EncoderInvocation& audio, const EncoderInvocation& video);

  // Moves the stdin handle for `kind` to the caller. nullptr if not spawned
  // or already taken.
  std::unique_ptr<IEncoderInput> TakeInput(StreamKind kind);

  // Closes held inputs, waits up to `grace` for each process, kills the
  // ones still running. Returns the number of processes that had to be
  // killed. Idempotent.
  size_t TerminateAll(std::chrono::milliseconds grace);

  bool IsRunning() const;

 private:
  struct Slot {
    std::unique_ptr<IEncoderProcess> process;
    std::unique_ptr<IEncoderInput> input;
  };

  Slot& SlotFor(StreamKind kind) { return kind == StreamKind::kAudio ? audio_ : video_; }

  IEncoderLauncher& launcher_;
  mutable std::mutex mutex_;
  Slot audio_;
  Slot video_;
};

}  // namespace segcast::encoder

#endif  // SEGCAST_ENCODER_ENCODER_SUPERVISOR_HPP_
