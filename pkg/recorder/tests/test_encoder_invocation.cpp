// Repository: Segcast-recorder
// Component: Encoder invocation unit tests
// Purpose: ffmpeg argument lists for the audio and video segmenters.
// Copyright (c) 2025 Segcast

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "segcast/encoder/EncoderInvocation.hpp"

namespace segcast::encoder {
namespace {

// Value following `flag`, or "" when the flag is absent.
std::string ValueOf(const std::vector<std::string>& args, const std::string& flag) {
  auto it = std::find(args.begin(), args.end(), flag);
  if (it == args.end() || it + 1 == args.end()) return "";
  return *(it + 1);
}

TEST(EncoderInvocationTest, AudioReadsRawPcmFromStdinAndSegments) {
  capture::AudioFormat fmt;
  fmt.sample_format = "f32le";
  fmt.sample_rate = 44100;
  fmt.channels = 2;
  auto inv = EncoderInvocation::ForAudio("/usr/bin/ffmpeg", fmt, "/data/chunks/audio", 10);
  const auto args = inv.BuildArgs();

  EXPECT_EQ(inv.Kind(), StreamKind::kAudio);
  EXPECT_EQ(ValueOf(args, "-f"), "f32le");
  EXPECT_EQ(ValueOf(args, "-ar"), "44100");
  EXPECT_EQ(ValueOf(args, "-ac"), "2");
  EXPECT_EQ(ValueOf(args, "-i"), "pipe:0");
  EXPECT_EQ(ValueOf(args, "-segment_time"), "10");
  EXPECT_EQ(ValueOf(args, "-segment_list"), "/data/chunks/audio/segment_list.txt");
  EXPECT_EQ(inv.ManifestPath(), "/data/chunks/audio/segment_list.txt");
  EXPECT_EQ(args.back(), "/data/chunks/audio/audio_recording_%03d.aac");
  EXPECT_EQ(ValueOf(args, "-af").find("pan="), std::string::npos);
}

TEST(EncoderInvocationTest, MultichannelAudioIsDownmixed) {
  capture::AudioFormat fmt;
  fmt.channels = 6;
  auto inv = EncoderInvocation::ForAudio("ffmpeg", fmt, "/a", 10);
  EXPECT_EQ(ValueOf(inv.BuildArgs(), "-af").rfind("pan=stereo", 0), 0u);
}

TEST(EncoderInvocationTest, VideoDescribesRawFramesAndScales) {
  capture::VideoFormat fmt;
  fmt.width = 2560;
  fmt.height = 1440;
  fmt.framerate = 24;
  auto inv = EncoderInvocation::ForVideo("ffmpeg", fmt, "1280x720", "/v", 10);
  const auto args = inv.BuildArgs();

  EXPECT_EQ(ValueOf(args, "-f"), "rawvideo");
  EXPECT_EQ(ValueOf(args, "-pix_fmt"), "bgra");
  EXPECT_EQ(ValueOf(args, "-s"), "2560x1440");
  EXPECT_EQ(ValueOf(args, "-r"), "24");
  EXPECT_EQ(ValueOf(args, "-vf"), "fps=24,scale=1280:720");
  EXPECT_EQ(ValueOf(args, "-segment_format"), "mpegts");
  EXPECT_EQ(args.back(), "/v/video_recording_%03d.ts");
}

TEST(EncoderInvocationTest, UnparsableResolutionKeepsCaptureSize) {
  capture::VideoFormat fmt;
  fmt.width = 800;
  fmt.height = 600;
  auto inv = EncoderInvocation::ForVideo("ffmpeg", fmt, "huge", "/v", 10);
  EXPECT_EQ(ValueOf(inv.BuildArgs(), "-vf"), "fps=30");
}

TEST(EncoderInvocationTest, OffsetPrecedesInputAndIsWriteOnce) {
  auto inv = EncoderInvocation::ForAudio("ffmpeg", capture::AudioFormat{}, "/a", 10);
  EXPECT_FALSE(inv.InputOffset().has_value());
  EXPECT_TRUE(inv.ApplyInputOffset(std::chrono::milliseconds(1250)));
  EXPECT_FALSE(inv.ApplyInputOffset(std::chrono::milliseconds(5)));

  const auto args = inv.BuildArgs();
  ASSERT_GE(args.size(), 2u);
  EXPECT_EQ(args[0], "-itsoffset");
  EXPECT_EQ(args[1], "1.250");
  EXPECT_EQ(inv.CommandLine().rfind("ffmpeg -itsoffset 1.250 ", 0), 0u);
}

TEST(EncoderInvocationTest, FormatOffsetSecondsRoundsToMilliseconds) {
  EXPECT_EQ(FormatOffsetSeconds(std::chrono::nanoseconds(0)), "0.000");
  EXPECT_EQ(FormatOffsetSeconds(std::chrono::microseconds(80400)), "0.080");
  EXPECT_EQ(FormatOffsetSeconds(std::chrono::seconds(3)), "3.000");
}

}  // namespace
}  // namespace segcast::encoder
