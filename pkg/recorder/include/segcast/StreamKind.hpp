// Repository: Segcast-recorder
// Component: Stream Kind
// Purpose: Identifies the two media streams of a recording session.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_STREAM_KIND_HPP_
#define SEGCAST_STREAM_KIND_HPP_

namespace segcast {

enum class StreamKind {
  kAudio,
  kVideo,
};

// Lowercase name used in log tags, directory names and upload metadata.
inline const char* StreamKindName(StreamKind kind) {
  switch (kind) {
    case StreamKind::kAudio:
      return "audio";
    case StreamKind::kVideo:
      return "video";
  }
  return "unknown";
}

inline StreamKind OtherStream(StreamKind kind) {
  return kind == StreamKind::kAudio ? StreamKind::kVideo : StreamKind::kAudio;
}

}  // namespace segcast

#endif  // SEGCAST_STREAM_KIND_HPP_
