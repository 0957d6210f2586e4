// Repository: Segcast-recorder
// Component: Recording coordinator contract tests
// Purpose: End-to-end start/stop lifecycle over fake capture, encoders and uploader:
//          stream alignment, close-before-kill shutdown, drain-before-return,
//          and the error taxonomy reported by Start()/Stop().
// Copyright (c) 2025 Segcast

#include <gtest/gtest.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <string>
#include <thread>

#include "fixtures/FakeCaptureBackend.h"
#include "fixtures/FakeEncoder.h"
#include "fixtures/RecordingUploader.h"
#include "segcast/segments/SegmentManifest.hpp"
#include "segcast/session/RecordingCoordinator.hpp"

namespace segcast {
namespace {

namespace fs = std::filesystem;
using segcast::tests::fixtures::FakeCaptureBackend;
using segcast::tests::fixtures::FakeEncoderLauncher;
using segcast::tests::fixtures::RecordingUploader;

bool WaitUntil(const std::function<bool()>& pred,
               std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

// Appends `name` to the manifest in `dir` and writes the segment itself.
void PublishSegment(const std::string& dir, const std::string& name) {
  {
    std::ofstream seg(dir + "/" + name, std::ios::binary | std::ios::trunc);
    seg << "segment-bytes";
  }
  std::ofstream manifest(dir + "/" + segments::kManifestFileName, std::ios::app);
  manifest << name << "\n";
}

class RecordingCoordinatorContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    data_dir_ = "/tmp/segcast_contract_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
                "_" + std::to_string(getpid());
    fs::remove_all(data_dir_);

    config_.data_dir = data_dir_;
    config_.encoder_binary = "ffmpeg";
    config_.relay_capacity = 64;
    config_.upload_workers = 2;
    config_.sync_poll_interval = std::chrono::milliseconds(5);
    config_.sync_timeout = std::chrono::seconds(2);
    config_.manifest_poll_interval = std::chrono::milliseconds(20);
    config_.pump_flush_timeout = std::chrono::milliseconds(200);
    config_.encoder_exit_grace = std::chrono::milliseconds(20);
    config_.drain_gate_timeout = std::chrono::milliseconds(500);
    config_.screenshot_delay = std::chrono::seconds(30);

    options_.user_id = "user-1";
    options_.video_id = "video-1";
    options_.bucket = "bucket";
    options_.region = "us-east-1";
  }

  void TearDown() override { fs::remove_all(data_dir_); }

  std::unique_ptr<RecordingCoordinator> MakeCoordinator() {
    return std::make_unique<RecordingCoordinator>(config_, backend_, launcher_, uploader_);
  }

  std::string AudioDir() const { return data_dir_ + "/chunks/audio"; }
  std::string VideoDir() const { return data_dir_ + "/chunks/video"; }

  std::string data_dir_;
  RecorderConfig config_;
  RecordingOptions options_;
  FakeCaptureBackend backend_;
  FakeEncoderLauncher launcher_;
  RecordingUploader uploader_;
};

// =============================================================================
// Shutdown ordering
// =============================================================================

// -----------------------------------------------------------------------------
// Stop() closes both encoder inputs before any encoder is terminated
// -----------------------------------------------------------------------------
TEST_F(RecordingCoordinatorContractTest, StopClosesInputsBeforeTerminatingEncoders) {
  auto coordinator = MakeCoordinator();
  auto started = coordinator->Start(options_);
  ASSERT_TRUE(started) << started.message;
  EXPECT_TRUE(coordinator->IsRecording());

  auto audio_state = launcher_.StateFor(StreamKind::kAudio);
  auto video_state = launcher_.StateFor(StreamKind::kVideo);
  ASSERT_TRUE(WaitUntil([&] { return audio_state->bytes > 0 && video_state->bytes > 0; }));

  auto stopped = coordinator->Stop();
  ASSERT_TRUE(stopped) << stopped.message;
  EXPECT_FALSE(coordinator->IsRecording());

  auto& log = launcher_.Log();
  const int close_audio = log.IndexOf("close:audio");
  const int close_video = log.IndexOf("close:video");
  const int kill_audio = log.IndexOf("kill:audio");
  const int kill_video = log.IndexOf("kill:video");
  ASSERT_GE(close_audio, 0);
  ASSERT_GE(close_video, 0);
  ASSERT_GE(kill_audio, 0);
  ASSERT_GE(kill_video, 0);
  EXPECT_LT(close_audio, kill_audio);
  EXPECT_LT(close_audio, kill_video);
  EXPECT_LT(close_video, kill_audio);
  EXPECT_LT(close_video, kill_video);
}

TEST_F(RecordingCoordinatorContractTest, StopWithoutStartAndDoubleStopAreNoOps) {
  auto coordinator = MakeCoordinator();
  EXPECT_TRUE(coordinator->Stop());

  ASSERT_TRUE(coordinator->Start(options_));
  EXPECT_TRUE(coordinator->Stop());
  EXPECT_TRUE(coordinator->Stop());
  EXPECT_EQ(launcher_.Log().Count("kill:audio"), 1u);
}

// =============================================================================
// Stream alignment
// =============================================================================

// -----------------------------------------------------------------------------
// Video delivers its first frame later than audio: the audio encoder gets
// -itsoffset, the video encoder does not
// -----------------------------------------------------------------------------
TEST_F(RecordingCoordinatorContractTest, LateVideoStartOffsetsAudioEncoderOnly) {
  backend_.video_first_delay = std::chrono::milliseconds(150);
  auto coordinator = MakeCoordinator();
  ASSERT_TRUE(coordinator->Start(options_));

  auto launched = launcher_.Launched();
  ASSERT_EQ(launched.size(), 2u);
  EXPECT_EQ(launched[0].Kind(), StreamKind::kAudio);
  ASSERT_TRUE(launched[0].InputOffset().has_value());
  EXPECT_GE(*launched[0].InputOffset(), std::chrono::milliseconds(100));
  EXPECT_EQ(launched[0].BuildArgs()[0], "-itsoffset");
  EXPECT_FALSE(launched[1].InputOffset().has_value());

  EXPECT_TRUE(coordinator->Stop());
}

TEST_F(RecordingCoordinatorContractTest, InvocationsUseCaptureFormatsAndChunkDirs) {
  options_.resolution = "1280x720";
  auto coordinator = MakeCoordinator();
  ASSERT_TRUE(coordinator->Start(options_));
  auto launched = launcher_.Launched();
  ASSERT_EQ(launched.size(), 2u);
  EXPECT_EQ(launched[0].ManifestPath(), AudioDir() + "/segment_list.txt");
  EXPECT_EQ(launched[1].ManifestPath(), VideoDir() + "/segment_list.txt");
  EXPECT_NE(launched[0].CommandLine().find("-f f32le"), std::string::npos);
  EXPECT_NE(launched[1].CommandLine().find("-s 16x8"), std::string::npos);
  EXPECT_NE(launched[1].CommandLine().find("scale=1280:720"), std::string::npos);
  EXPECT_TRUE(coordinator->Stop());
}

// =============================================================================
// Segment drain
// =============================================================================

// -----------------------------------------------------------------------------
// A segment the encoder finalizes as it goes down is still uploaded, exactly once
// -----------------------------------------------------------------------------
TEST_F(RecordingCoordinatorContractTest, SegmentFlushedAtEncoderExitIsUploaded) {
  auto coordinator = MakeCoordinator();
  ASSERT_TRUE(coordinator->Start(options_));

  PublishSegment(AudioDir(), "audio_recording_000.aac");
  ASSERT_TRUE(WaitUntil([&] { return uploader_.CountFor("audio_recording_000.aac") == 1; }));

  const std::string audio_dir = AudioDir();
  launcher_.OnTerminate(StreamKind::kAudio,
                        [audio_dir] { PublishSegment(audio_dir, "audio_recording_001.aac"); });

  ASSERT_TRUE(coordinator->Stop());
  EXPECT_EQ(uploader_.CountFor("audio_recording_000.aac"), 1u);
  EXPECT_EQ(uploader_.CountFor("audio_recording_001.aac"), 1u);
  for (const auto& call : uploader_.Calls()) {
    EXPECT_TRUE(call.had_options);
  }
}

// -----------------------------------------------------------------------------
// Stop() does not return while an upload is still in flight
// -----------------------------------------------------------------------------
TEST_F(RecordingCoordinatorContractTest, StopWaitsForInFlightUpload) {
  auto coordinator = MakeCoordinator();
  ASSERT_TRUE(coordinator->Start(options_));

  uploader_.CloseGate();
  PublishSegment(VideoDir(), "video_recording_000.ts");
  ASSERT_TRUE(WaitUntil([&] { return uploader_.Started() == 1; }));

  auto stop = std::async(std::launch::async, [&] { return coordinator->Stop(); });
  EXPECT_EQ(stop.wait_for(std::chrono::milliseconds(300)), std::future_status::timeout);
  EXPECT_EQ(uploader_.Finished(), 0u);

  uploader_.Release();
  ASSERT_EQ(stop.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_TRUE(stop.get());
  EXPECT_EQ(uploader_.Finished(), 1u);
}

TEST_F(RecordingCoordinatorContractTest, StartWipesStaleChunkDirectories) {
  fs::create_directories(AudioDir());
  { std::ofstream(AudioDir() + "/audio_recording_007.aac") << "old"; }
  PublishSegment(VideoDir(), "video_recording_003.ts");

  auto coordinator = MakeCoordinator();
  ASSERT_TRUE(coordinator->Start(options_));
  EXPECT_FALSE(fs::exists(AudioDir() + "/audio_recording_007.aac"));
  EXPECT_TRUE(fs::exists(AudioDir() + "/segment_list.txt"));
  EXPECT_TRUE(fs::exists(VideoDir() + "/segment_list.txt"));
  ASSERT_TRUE(coordinator->Stop());
  EXPECT_EQ(uploader_.CountFor("video_recording_003.ts"), 0u);
}

// =============================================================================
// Start() failures
// =============================================================================

TEST_F(RecordingCoordinatorContractTest, MissingDataDirIsConfigurationError) {
  config_.data_dir.reset();
  auto coordinator = MakeCoordinator();
  auto result = coordinator->Start(options_);
  EXPECT_FALSE(result);
  EXPECT_EQ(result.code, ErrorCode::kConfigurationError);
  EXPECT_TRUE(launcher_.Launched().empty());
  EXPECT_FALSE(coordinator->IsRecording());
}

TEST_F(RecordingCoordinatorContractTest, UnsupportedPlatformIsPlatformError) {
  backend_.platform_supported = false;
  auto coordinator = MakeCoordinator();
  auto result = coordinator->Start(options_);
  EXPECT_EQ(result.code, ErrorCode::kPlatformError);
  EXPECT_EQ(result.message, "Unsupported OS");
  EXPECT_FALSE(fs::exists(AudioDir()));
}

TEST_F(RecordingCoordinatorContractTest, UnavailableMicrophoneIsDeviceError) {
  backend_.audio_available = false;
  auto coordinator = MakeCoordinator();
  auto result = coordinator->Start(options_);
  EXPECT_EQ(result.code, ErrorCode::kDeviceError);
  EXPECT_TRUE(launcher_.Launched().empty());
}

TEST_F(RecordingCoordinatorContractTest, UnavailableDisplayIsDeviceError) {
  backend_.video_available = false;
  auto coordinator = MakeCoordinator();
  auto result = coordinator->Start(options_);
  EXPECT_EQ(result.code, ErrorCode::kDeviceError);
  EXPECT_NE(result.message.find("display"), std::string::npos);
}

// -----------------------------------------------------------------------------
// A capture that never produces data fails Start() instead of waiting forever
// -----------------------------------------------------------------------------
TEST_F(RecordingCoordinatorContractTest, SilentCaptureTimesOutBeforeSpawning) {
  backend_.video_silent = true;
  config_.sync_timeout = std::chrono::milliseconds(100);
  auto coordinator = MakeCoordinator();
  auto result = coordinator->Start(options_);
  EXPECT_EQ(result.code, ErrorCode::kDeviceError);
  EXPECT_NE(result.message.find("video"), std::string::npos) << result.message;
  EXPECT_EQ(result.message.find("audio"), std::string::npos) << result.message;
  EXPECT_TRUE(launcher_.Launched().empty());
  EXPECT_FALSE(coordinator->IsRecording());
}

// -----------------------------------------------------------------------------
// A pending start does not hold the coordinator: IsRecording() answers and
// Stop() cancels the start while it waits for the first samples
// -----------------------------------------------------------------------------
TEST_F(RecordingCoordinatorContractTest, StopCancelsStartWaitingForFirstSamples) {
  backend_.video_silent = true;
  config_.sync_timeout = std::chrono::seconds(30);
  auto coordinator = MakeCoordinator();

  const auto begin = std::chrono::steady_clock::now();
  auto pending = std::async(std::launch::async, [&] { return coordinator->Start(options_); });
  ASSERT_TRUE(WaitUntil([&] { return backend_.video_opens.load() == 1; }));

  EXPECT_FALSE(coordinator->IsRecording());
  EXPECT_EQ(coordinator->Start(options_).code, ErrorCode::kConfigurationError);
  EXPECT_TRUE(coordinator->Stop());

  ASSERT_EQ(pending.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  auto result = pending.get();
  EXPECT_EQ(result.code, ErrorCode::kConfigurationError);
  EXPECT_NE(result.message.find("cancelled"), std::string::npos) << result.message;
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(10));
  EXPECT_TRUE(launcher_.Launched().empty());
  EXPECT_FALSE(coordinator->IsRecording());

  // Nothing is left pending: the next start runs normally.
  backend_.video_silent = false;
  ASSERT_TRUE(coordinator->Start(options_));
  EXPECT_TRUE(coordinator->Stop());
}

TEST_F(RecordingCoordinatorContractTest, VideoEncoderSpawnFailureIsProcessError) {
  launcher_.FailLaunchOf(StreamKind::kVideo);
  auto coordinator = MakeCoordinator();
  auto result = coordinator->Start(options_);
  EXPECT_EQ(result.code, ErrorCode::kProcessError);
  EXPECT_EQ(launcher_.Log().Count("kill:audio"), 1u);
  EXPECT_FALSE(coordinator->IsRecording());

  // The coordinator is reusable after a failed start.
  launcher_.FailLaunchOf(StreamKind::kAudio);
  EXPECT_EQ(coordinator->Start(options_).code, ErrorCode::kProcessError);
}

TEST_F(RecordingCoordinatorContractTest, SecondStartWhileRecordingIsRejected) {
  auto coordinator = MakeCoordinator();
  ASSERT_TRUE(coordinator->Start(options_));
  auto again = coordinator->Start(options_);
  EXPECT_EQ(again.code, ErrorCode::kConfigurationError);
  EXPECT_EQ(launcher_.Launched().size(), 2u);
  EXPECT_TRUE(coordinator->Stop());
}

// =============================================================================
// Stop() reporting
// =============================================================================

TEST_F(RecordingCoordinatorContractTest, BrokenEncoderPipeIsReportedByStop) {
  launcher_.StateFor(StreamKind::kAudio)->fail_writes.store(true);
  auto coordinator = MakeCoordinator();
  ASSERT_TRUE(coordinator->Start(options_));
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  auto result = coordinator->Stop();
  EXPECT_EQ(result.code, ErrorCode::kPipeError);
  EXPECT_EQ(result.message.rfind("audio encoder pipe", 0), 0u) << result.message;
  EXPECT_FALSE(coordinator->IsRecording());
  EXPECT_GT(launcher_.StateFor(StreamKind::kVideo)->bytes.load(), 0u);
}

TEST_F(RecordingCoordinatorContractTest, DestructorStopsActiveRecording) {
  {
    auto coordinator = MakeCoordinator();
    ASSERT_TRUE(coordinator->Start(options_));
  }
  EXPECT_EQ(launcher_.Log().Count("kill:audio"), 1u);
  EXPECT_EQ(launcher_.Log().Count("kill:video"), 1u);
}

// =============================================================================
// Screenshot and devices
// =============================================================================

TEST_F(RecordingCoordinatorContractTest, ScreenshotIsCapturedAndUploadedAfterDelay) {
  config_.screenshot_delay = std::chrono::milliseconds(20);
  auto coordinator = MakeCoordinator();
  ASSERT_TRUE(coordinator->Start(options_));
  ASSERT_TRUE(WaitUntil(
      [&] { return uploader_.CountKind(upload::UploadKind::kScreenshot) == 1; }));
  EXPECT_EQ(uploader_.CountFor("screen-capture.jpg"), 1u);
  EXPECT_TRUE(fs::exists(data_dir_ + "/screen-capture.jpg"));
  EXPECT_TRUE(coordinator->Stop());
}

TEST_F(RecordingCoordinatorContractTest, ScreenshotIsSkippedWhenStoppedEarly) {
  auto coordinator = MakeCoordinator();
  ASSERT_TRUE(coordinator->Start(options_));
  const auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(coordinator->Stop());
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
  EXPECT_EQ(backend_.screenshots.load(), 0);
  EXPECT_EQ(uploader_.CountKind(upload::UploadKind::kScreenshot), 0u);
}

TEST_F(RecordingCoordinatorContractTest, RequestedAudioDeviceIsOpened) {
  options_.audio_name = "USB Mic";
  auto coordinator = MakeCoordinator();
  ASSERT_TRUE(coordinator->Start(options_));
  EXPECT_EQ(backend_.last_opened_audio, "USB Mic");
  EXPECT_TRUE(coordinator->Stop());

  auto devices = coordinator->ListAudioDevices();
  ASSERT_EQ(devices.size(), 2u);
  EXPECT_EQ(devices[0], "Built-in Microphone");
}

}  // namespace
}  // namespace segcast
