// Repository: Segcast-recorder
// Component: Encoder Invocation
// Purpose: Argument set for one segmenting encoder process, plus the one-shot sync offset.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_ENCODER_ENCODER_INVOCATION_HPP_
#define SEGCAST_ENCODER_ENCODER_INVOCATION_HPP_

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "segcast/StreamKind.hpp"
#include "segcast/capture/CaptureFormats.hpp"

namespace segcast::encoder {

// EncoderInvocation describes how an encoder is launched: it reads raw bytes
// on pipe:0 and writes <dir>/<kind>_recording_%03d.<ext> plus
// <dir>/segment_list.txt.
//
// The input offset is mutable exactly once, before spawn. When present it is
// emitted as the leading "-itsoffset <seconds>" pair.
class EncoderInvocation {
 public:
  EncoderInvocation(StreamKind kind, std::string binary, std::vector<std::string> args,
                    std::string output_dir);

  static EncoderInvocation ForAudio(const std::string& binary,
                                    const capture::AudioFormat& format,
                                    const std::string& output_dir, int segment_seconds);

  // `resolution` is appended as a scale filter when it parses as "WxH".
  static EncoderInvocation ForVideo(const std::string& binary,
                                    const capture::VideoFormat& format,
                                    const std::string& resolution,
                                    const std::string& output_dir, int segment_seconds);

  // Returns false (and changes nothing) if an offset was already applied.
  bool ApplyInputOffset(std::chrono::nanoseconds offset);

  const std::optional<std::chrono::nanoseconds>& InputOffset() const { return input_offset_; }

  // Full argument list, excluding the binary.
  std::vector<std::string> BuildArgs() const;

  // Binary plus arguments joined by spaces, for logs.
  std::string CommandLine() const;

  StreamKind Kind() const { return kind_; }
  const std::string& Binary() const { return binary_; }
  const std::string& OutputDir() const { return output_dir_; }
  std::string ManifestPath() const;

 private:
  StreamKind kind_;
  std::string binary_;
  std::vector<std::string> args_;
  std::string output_dir_;
  std::optional<std::chrono::nanoseconds> input_offset_;
};

// Seconds with three decimals, e.g. 80ms -> "0.080".
std::string FormatOffsetSeconds(std::chrono::nanoseconds offset);

}  // namespace segcast::encoder

#endif  // SEGCAST_ENCODER_ENCODER_INVOCATION_HPP_
