// Repository: Segcast-recorder
// Component: Session Errors
// Purpose: Error taxonomy and terminal result type for start/stop.
// Copyright (c) 2025 Segcast

#include "segcast/session/SessionErrors.hpp"

namespace segcast {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "Ok";
    case ErrorCode::kConfigurationError:
      return "ConfigurationError";
    case ErrorCode::kDeviceError:
      return "DeviceError";
    case ErrorCode::kPlatformError:
      return "PlatformError";
    case ErrorCode::kPipeError:
      return "PipeError";
    case ErrorCode::kUploadError:
      return "UploadError";
    case ErrorCode::kProcessError:
      return "ProcessError";
  }
  return "Unknown";
}

}  // namespace segcast
