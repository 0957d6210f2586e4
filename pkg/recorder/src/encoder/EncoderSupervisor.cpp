// Repository: Segcast-recorder
// Component: Encoder Process Supervisor
// Purpose: Owns both encoder processes for a session; hands out stdin handles; ordered termination.
// Copyright (c) 2025 Segcast

#include "segcast/encoder/EncoderSupervisor.hpp"

#include "segcast/util/Logger.hpp"

namespace segcast::encoder {

EncoderSupervisor::EncoderSupervisor(IEncoderLauncher& launcher) : launcher_(launcher) {}

EncoderSupervisor::~EncoderSupervisor() { TerminateAll(std::chrono::milliseconds(0)); }

SessionResult EncoderSupervisor::SpawnAll(const EncoderInvocation& audio,
                                          const EncoderInvocation& video) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (audio_.process || video_.process) {
    return SessionResult::Failure(ErrorCode::kProcessError, "encoders already spawned");
  }

  std::string error;
  auto audio_process = launcher_.Launch(audio, &error);
  if (!audio_process) {
    util::Logger::Error("[EncoderSupervisor] audio encoder spawn failed: " + error);
    return SessionResult::Failure(ErrorCode::kProcessError, "audio encoder: " + error);
  }

  auto video_process = launcher_.Launch(video, &error);
  if (!video_process) {
    util::Logger::Error("[EncoderSupervisor] video encoder spawn failed: " + error);
    // No half-started pipeline: the audio encoder goes down with it.
    auto input = audio_process->TakeInput();
    if (input) input->Close();
    audio_process->Terminate();
    return SessionResult::Failure(ErrorCode::kProcessError, "video encoder: " + error);
  }

  audio_.input = audio_process->TakeInput();
  audio_.process = std::move(audio_process);
  video_.input = video_process->TakeInput();
  video_.process = std::move(video_process);
  util::Logger::Info("[EncoderSupervisor] encoders spawned");
  return SessionResult::Success();
}

std::unique_ptr<IEncoderInput> EncoderSupervisor::TakeInput(StreamKind kind) {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::move(SlotFor(kind).input);
}

size_t EncoderSupervisor::TerminateAll(std::chrono::milliseconds grace) {
  std::lock_guard<std::mutex> lock(mutex_);

  // 1. End-of-stream first, so each encoder can flush its final segment.
  for (Slot* slot : {&audio_, &video_}) {
    if (slot->input) {
      slot->input->Close();
      slot->input.reset();
    }
  }

  // 2. Grace period shared by both processes, then SIGKILL.
  const auto deadline = std::chrono::steady_clock::now() + grace;
  size_t killed = 0;
  for (Slot* slot : {&audio_, &video_}) {
    if (!slot->process) continue;
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() < 0) remaining = std::chrono::milliseconds(0);
    if (!slot->process->WaitForExit(remaining)) {
      util::Logger::Warn("[EncoderSupervisor] " + slot->process->Label() +
                         " encoder still running after grace, killing");
      ++killed;
    }
    slot->process->Terminate();
    slot->process.reset();
  }
  return killed;
}

bool EncoderSupervisor::IsRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return audio_.process != nullptr || video_.process != nullptr;
}

}  // namespace segcast::encoder
