// Repository: Segcast-recorder
// Component: Chunk Uploader
// Purpose: Upload kind wire names.
// Copyright (c) 2025 Segcast

#include "segcast/upload/IChunkUploader.hpp"

namespace segcast::upload {

const char* UploadKindName(UploadKind kind) {
  switch (kind) {
    case UploadKind::kAudio:
      return "audio";
    case UploadKind::kVideo:
      return "video";
    case UploadKind::kScreenshot:
      return "screenshot";
  }
  return "unknown";
}

UploadKind UploadKindFor(StreamKind kind) {
  return kind == StreamKind::kAudio ? UploadKind::kAudio : UploadKind::kVideo;
}

}  // namespace segcast::upload
