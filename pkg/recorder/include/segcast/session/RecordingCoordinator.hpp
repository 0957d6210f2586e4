// Repository: Segcast-recorder
// Component: Recording Session Coordinator
// Purpose: Top-level start/stop of a recording session and owner of its pipeline.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_SESSION_RECORDING_COORDINATOR_HPP_
#define SEGCAST_SESSION_RECORDING_COORDINATOR_HPP_

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "segcast/capture/ICaptureBackend.hpp"
#include "segcast/encoder/EncoderProcess.hpp"
#include "segcast/session/RecordingOptions.hpp"
#include "segcast/session/SessionErrors.hpp"
#include "segcast/upload/IChunkUploader.hpp"

namespace segcast {

// RecordingCoordinator owns at most one live session.
//
// Start(): prepares <data_dir>/chunks/{audio,video}, opens both capture
// devices, waits (bounded) for both first samples, applies the one-shot sync
// offset, spawns both encoders, attaches the stream pumps, starts the two
// segment watchers and schedules the startup screenshot. Returns once setup
// is done. Any setup failure tears down everything already started.
//
// Stop(): sets shutdown, stops capture, closes both encoder inputs, then
// terminates the encoders, and blocks until both watchers have drained
// (including in-flight uploads). Every step runs even if an earlier one
// failed; the first failure is returned. Stop() without a live session is
// a no-op success.
//
// Setup runs outside the coordinator lock, so IsRecording() answers false
// while a start is pending and a Stop() issued then cancels it: the pending
// Start() tears down what it built and fails with kConfigurationError. Only
// one start may be pending. The collaborators must outlive the coordinator.
class RecordingCoordinator {
 public:
  RecordingCoordinator(RecorderConfig config, capture::ICaptureBackend& backend,
                       encoder::IEncoderLauncher& launcher, upload::IChunkUploader& uploader);
  ~RecordingCoordinator();

  RecordingCoordinator(const RecordingCoordinator&) = delete;
  RecordingCoordinator& operator=(const RecordingCoordinator&) = delete;

  SessionResult Start(const RecordingOptions& options);
  SessionResult Stop();

  bool IsRecording() const;

  std::vector<std::string> ListAudioDevices();

  const RecorderConfig& Config() const { return config_; }

 private:
  struct Session;

  SessionResult BuildPipeline(Session& session);
  void AbortStart(Session& session);
  void ScheduleScreenshot(Session& session);

  const RecorderConfig config_;
  capture::ICaptureBackend& backend_;
  encoder::IEncoderLauncher& launcher_;
  upload::IChunkUploader& uploader_;

  mutable std::mutex mutex_;
  std::unique_ptr<Session> session_;
  Session* starting_ = nullptr;  // Set while Start() builds outside the lock.
};

}  // namespace segcast

#endif  // SEGCAST_SESSION_RECORDING_COORDINATOR_HPP_
