// Repository: Segcast-recorder
// Component: Chunk Uploader
// Purpose: Upload collaborator interface for segments and the startup screenshot.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_UPLOAD_ICHUNK_UPLOADER_HPP_
#define SEGCAST_UPLOAD_ICHUNK_UPLOADER_HPP_

#include <optional>
#include <string>

#include "segcast/StreamKind.hpp"
#include "segcast/session/RecordingOptions.hpp"
#include "segcast/session/SessionErrors.hpp"

namespace segcast::upload {

enum class UploadKind {
  kAudio,
  kVideo,
  kScreenshot,
};

// Wire names: "audio", "video", "screenshot".
const char* UploadKindName(UploadKind kind);

UploadKind UploadKindFor(StreamKind kind);

struct UploadResult {
  bool success = true;
  ErrorCode code = ErrorCode::kOk;
  std::string message;

  static UploadResult Success() { return UploadResult{}; }

  static UploadResult Failure(std::string message) {
    UploadResult r;
    r.success = false;
    r.code = ErrorCode::kUploadError;
    r.message = std::move(message);
    return r;
  }
};

// Called concurrently from worker threads; implementations must be
// thread-safe. Failures are reported, never retried by the caller.
class IChunkUploader {
 public:
  virtual ~IChunkUploader() = default;

  virtual UploadResult Upload(const std::optional<RecordingOptions>& options,
                              const std::string& file_path, UploadKind kind) = 0;
};

}  // namespace segcast::upload

#endif  // SEGCAST_UPLOAD_ICHUNK_UPLOADER_HPP_
