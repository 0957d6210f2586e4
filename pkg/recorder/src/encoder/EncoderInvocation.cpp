// Repository: Segcast-recorder
// Component: Encoder Invocation
// Purpose: Argument set for one segmenting encoder process, plus the one-shot sync offset.
// Copyright (c) 2025 Segcast

#include "segcast/encoder/EncoderInvocation.hpp"

#include <cstdio>

#include "segcast/segments/SegmentManifest.hpp"
#include "segcast/session/RecordingOptions.hpp"

namespace segcast::encoder {

namespace {

constexpr const char* kThreadQueueSize = "4096";
constexpr const char* kAudioResample = "aresample=async=1:min_hard_comp=0.100000:first_pts=0";
constexpr const char* kStereoDownmix = "pan=stereo|FL=FL+0.5*FC|FR=FR+0.5*FC";

}  // namespace

std::string FormatOffsetSeconds(std::chrono::nanoseconds offset) {
  const double seconds = std::chrono::duration<double>(offset).count();
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.3f", seconds);
  return buf;
}

EncoderInvocation::EncoderInvocation(StreamKind kind, std::string binary,
                                     std::vector<std::string> args, std::string output_dir)
    : kind_(kind),
      binary_(std::move(binary)),
      args_(std::move(args)),
      output_dir_(std::move(output_dir)) {}

EncoderInvocation EncoderInvocation::ForAudio(const std::string& binary,
                                              const capture::AudioFormat& format,
                                              const std::string& output_dir,
                                              int segment_seconds) {
  std::string filters = kAudioResample;
  if (format.channels > 2) {
    filters = std::string(kStereoDownmix) + "," + filters;
  }

  std::vector<std::string> args = {
      "-f", format.sample_format,
      "-ar", std::to_string(format.sample_rate),
      "-ac", std::to_string(format.channels),
      "-thread_queue_size", kThreadQueueSize,
      "-i", "pipe:0",
      "-af", filters,
      "-c:a", "aac",
      "-b:a", "128k",
      "-async", "1",
      "-f", "segment",
      "-segment_time", std::to_string(segment_seconds),
      "-segment_list", output_dir + "/" + segments::kManifestFileName,
      "-reset_timestamps", "1",
      output_dir + "/audio_recording_%03d.aac",
  };
  return EncoderInvocation(StreamKind::kAudio, binary, std::move(args), output_dir);
}

EncoderInvocation EncoderInvocation::ForVideo(const std::string& binary,
                                              const capture::VideoFormat& format,
                                              const std::string& resolution,
                                              const std::string& output_dir,
                                              int segment_seconds) {
  const std::string fps = std::to_string(format.framerate);
  std::string filters = "fps=" + fps;
  int width = 0;
  int height = 0;
  if (ParseResolution(resolution, &width, &height)) {
    filters += ",scale=" + std::to_string(width) + ":" + std::to_string(height);
  }

  std::vector<std::string> args = {
      "-f", "rawvideo",
      "-pix_fmt", format.pixel_format,
      "-s", std::to_string(format.width) + "x" + std::to_string(format.height),
      "-r", fps,
      "-thread_queue_size", kThreadQueueSize,
      "-i", "pipe:0",
      "-vf", filters,
      "-c:v", "libx264",
      "-preset", "ultrafast",
      "-pix_fmt", "yuv420p",
      "-tune", "zerolatency",
      "-vsync", "1",
      "-f", "segment",
      "-segment_time", std::to_string(segment_seconds),
      "-segment_list", output_dir + "/" + segments::kManifestFileName,
      "-segment_format", "mpegts",
      "-reset_timestamps", "1",
      output_dir + "/video_recording_%03d.ts",
  };
  return EncoderInvocation(StreamKind::kVideo, binary, std::move(args), output_dir);
}

bool EncoderInvocation::ApplyInputOffset(std::chrono::nanoseconds offset) {
  if (input_offset_.has_value()) {
    return false;
  }
  input_offset_ = offset;
  return true;
}

std::vector<std::string> EncoderInvocation::BuildArgs() const {
  std::vector<std::string> out;
  out.reserve(args_.size() + 2);
  if (input_offset_) {
    out.push_back("-itsoffset");
    out.push_back(FormatOffsetSeconds(*input_offset_));
  }
  out.insert(out.end(), args_.begin(), args_.end());
  return out;
}

std::string EncoderInvocation::CommandLine() const {
  std::string line = binary_;
  for (const auto& arg : BuildArgs()) {
    line += ' ';
    line += arg;
  }
  return line;
}

std::string EncoderInvocation::ManifestPath() const {
  return output_dir_ + "/" + segments::kManifestFileName;
}

}  // namespace segcast::encoder
