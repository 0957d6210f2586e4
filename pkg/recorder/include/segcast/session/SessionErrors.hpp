// Repository: Segcast-recorder
// Component: Session Errors
// Purpose: Error taxonomy and terminal result type for start/stop.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_SESSION_SESSION_ERRORS_HPP_
#define SEGCAST_SESSION_SESSION_ERRORS_HPP_

#include <string>

namespace segcast {

enum class ErrorCode {
  kOk,
  kConfigurationError,  // Missing data directory, start while recording, start cancelled.
  kDeviceError,         // No usable capture device/display, or a stream never started.
  kPlatformError,       // No capture backend for this OS.
  kPipeError,           // Write to a closed/broken encoder pipe.
  kUploadError,         // One segment failed to upload (never retried).
  kProcessError,        // Encoder failed to spawn or to terminate.
};

const char* ErrorCodeName(ErrorCode code);

// Terminal outcome of RecordingCoordinator::Start / Stop and of the
// supervisor-level steps that feed them.
struct SessionResult {
  bool success = true;
  ErrorCode code = ErrorCode::kOk;
  std::string message;

  static SessionResult Success() { return SessionResult{}; }

  static SessionResult Failure(ErrorCode code, std::string message) {
    SessionResult r;
    r.success = false;
    r.code = code;
    r.message = std::move(message);
    return r;
  }

  explicit operator bool() const { return success; }
};

}  // namespace segcast

#endif  // SEGCAST_SESSION_SESSION_ERRORS_HPP_
