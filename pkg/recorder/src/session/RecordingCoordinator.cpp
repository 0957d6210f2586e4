// Repository: Segcast-recorder
// Component: Recording Session Coordinator
// Purpose: Top-level start/stop of a recording session and owner of its pipeline.
// Copyright (c) 2025 Segcast

#include "segcast/session/RecordingCoordinator.hpp"

#include <chrono>

#include "segcast/encoder/EncoderInvocation.hpp"
#include "segcast/encoder/EncoderSupervisor.hpp"
#include "segcast/segments/SegmentManifest.hpp"
#include "segcast/segments/SegmentWatcher.hpp"
#include "segcast/session/SessionContext.hpp"
#include "segcast/session/StreamEndpoint.hpp"
#include "segcast/sync/SyncResolver.hpp"
#include "segcast/util/Logger.hpp"
#include "segcast/util/WorkerPool.hpp"

namespace segcast {

namespace {
constexpr const char* kTag = "[RecordingCoordinator] ";
constexpr const char* kScreenshotFileName = "screen-capture.jpg";
constexpr auto kDrainLogInterval = std::chrono::seconds(5);
}  // namespace

// Member order is teardown order in reverse: watchers and capture drivers go
// first, the upload pool last.
struct RecordingCoordinator::Session {
  Session(const RecorderConfig& config, const RecordingOptions& opts,
          encoder::IEncoderLauncher& launcher)
      : options(opts),
        pool(config.upload_workers == 0 ? 1 : config.upload_workers, "UploadPool"),
        audio(StreamKind::kAudio, config.relay_capacity, context.StartSlot(StreamKind::kAudio)),
        video(StreamKind::kVideo, config.relay_capacity, context.StartSlot(StreamKind::kVideo)),
        supervisor(launcher) {}

  RecordingOptions options;
  std::string data_dir;
  std::string audio_dir;
  std::string video_dir;

  util::WorkerPool pool;
  SessionContext context;
  StreamEndpoint audio;
  StreamEndpoint video;
  encoder::EncoderSupervisor supervisor;

  std::unique_ptr<capture::IAudioCapture> audio_capture;
  std::unique_ptr<capture::IVideoCapture> video_capture;

  util::TaskGroup screenshot;
  std::unique_ptr<segments::SegmentWatcher> audio_watcher;
  std::unique_ptr<segments::SegmentWatcher> video_watcher;
};

RecordingCoordinator::RecordingCoordinator(RecorderConfig config,
                                           capture::ICaptureBackend& backend,
                                           encoder::IEncoderLauncher& launcher,
                                           upload::IChunkUploader& uploader)
    : config_(std::move(config)), backend_(backend), launcher_(launcher), uploader_(uploader) {}

RecordingCoordinator::~RecordingCoordinator() {
  if (IsRecording()) {
    SessionResult result = Stop();
    if (!result.success) {
      util::Logger::Error(std::string(kTag) + "stop on destruction failed: " + result.message);
    }
  }
}

bool RecordingCoordinator::IsRecording() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_ != nullptr;
}

std::vector<std::string> RecordingCoordinator::ListAudioDevices() {
  return backend_.ListAudioInputDevices();
}

SessionResult RecordingCoordinator::Start(const RecordingOptions& options) {
  std::unique_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_ || starting_) {
      return SessionResult::Failure(ErrorCode::kConfigurationError,
                                    "a recording is already in progress");
    }
    if (!config_.data_dir || config_.data_dir->empty()) {
      return SessionResult::Failure(ErrorCode::kConfigurationError, "data directory is not set");
    }
    std::string error;
    if (!backend_.IsPlatformSupported(&error)) {
      return SessionResult::Failure(ErrorCode::kPlatformError, error);
    }
    session = std::make_unique<Session>(config_, options, launcher_);
    session->data_dir = *config_.data_dir;
    session->audio_dir = session->data_dir + "/chunks/audio";
    session->video_dir = session->data_dir + "/chunks/video";
    starting_ = session.get();
  }

  SessionResult built = BuildPipeline(*session);

  bool cancelled = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    starting_ = nullptr;
    if (built.success) {
      // Stop() raises the flag under this lock, so the check cannot race it.
      cancelled = session->context.ShutdownFlag().load();
      if (!cancelled) {
        util::Logger::Info(std::string(kTag) + "recording started video_id=" +
                           session->options.video_id + " data_dir=" + session->data_dir);
        session_ = std::move(session);
        return SessionResult::Success();
      }
    }
  }
  if (cancelled) {
    AbortStart(*session);
    return SessionResult::Failure(ErrorCode::kConfigurationError, "start cancelled by stop");
  }
  return built;
}

SessionResult RecordingCoordinator::BuildPipeline(Session& session) {
  const RecordingOptions& options = session.options;
  std::string error;
  if (!segments::PrepareChunkDirectory(session.audio_dir, &error) ||
      !segments::PrepareChunkDirectory(session.video_dir, &error)) {
    return SessionResult::Failure(ErrorCode::kConfigurationError,
                                  "chunk directory: " + error);
  }

  // Capture devices.
  session.audio_capture = backend_.OpenAudio(options.audio_name, &error);
  if (!session.audio_capture) {
    AbortStart(session);
    return SessionResult::Failure(ErrorCode::kDeviceError, error);
  }
  session.video_capture = backend_.OpenVideo(options.screen_index, options.framerate, &error);
  if (!session.video_capture) {
    AbortStart(session);
    return SessionResult::Failure(ErrorCode::kDeviceError, error);
  }

  StreamEndpoint* audio_ep = &session.audio;
  StreamEndpoint* video_ep = &session.video;
  if (!session.audio_capture->Start(
          [audio_ep](const uint8_t* data, size_t len) { audio_ep->Deliver(data, len); },
          &error) ||
      !session.video_capture->Start(
          [video_ep](const uint8_t* data, size_t len) { video_ep->Deliver(data, len); },
          &error)) {
    AbortStart(session);
    return SessionResult::Failure(ErrorCode::kDeviceError, error);
  }

  auto audio_invocation = encoder::EncoderInvocation::ForAudio(
      config_.encoder_binary, session.audio_capture->Format(), session.audio_dir,
      config_.segment_seconds);
  auto video_invocation = encoder::EncoderInvocation::ForVideo(
      config_.encoder_binary, session.video_capture->Format(), options.resolution,
      session.video_dir, config_.segment_seconds);

  // Start-time alignment, once, before any encoder exists.
  SessionContext& ctx = session.context;
  sync::SyncResolver resolver(ctx.StartSlot(StreamKind::kAudio),
                              ctx.StartSlot(StreamKind::kVideo));
  sync::WaitOutcome wait = resolver.WaitForStartTimes(config_.sync_poll_interval,
                                                      config_.sync_timeout, &ctx.ShutdownFlag());
  if (wait.status == sync::WaitStatus::kCancelled) {
    AbortStart(session);
    return SessionResult::Failure(ErrorCode::kConfigurationError, "start cancelled by stop");
  }
  if (wait.status != sync::WaitStatus::kReady) {
    std::string silent;
    if (!wait.audio_ready) silent = "audio";
    if (!wait.video_ready) silent += silent.empty() ? "video" : " and video";
    AbortStart(session);
    return SessionResult::Failure(ErrorCode::kDeviceError,
                                  "no data from " + silent + " capture within " +
                                      std::to_string(config_.sync_timeout.count()) + "ms");
  }
  if (!resolver.Resolve(audio_invocation, video_invocation)) {
    AbortStart(session);
    return SessionResult::Failure(ErrorCode::kDeviceError, "start times unavailable");
  }

  // Encoders and pumps.
  SessionResult spawned = session.supervisor.SpawnAll(audio_invocation, video_invocation);
  if (!spawned.success) {
    AbortStart(session);
    return spawned;
  }
  if (!session.audio.AttachEncoderInput(session.supervisor.TakeInput(StreamKind::kAudio)) ||
      !session.video.AttachEncoderInput(session.supervisor.TakeInput(StreamKind::kVideo))) {
    AbortStart(session);
    return SessionResult::Failure(ErrorCode::kProcessError, "encoder input unavailable");
  }

  // Segment watchers.
  std::optional<RecordingOptions> upload_options = session.options;
  segments::SegmentWatcherConfig audio_watch{StreamKind::kAudio, session.audio_dir,
                                             config_.manifest_poll_interval,
                                             config_.drain_gate_timeout};
  segments::SegmentWatcherConfig video_watch{StreamKind::kVideo, session.video_dir,
                                             config_.manifest_poll_interval,
                                             config_.drain_gate_timeout};
  session.audio_watcher = std::make_unique<segments::SegmentWatcher>(
      audio_watch, ctx, uploader_, session.pool, upload_options);
  session.video_watcher = std::make_unique<segments::SegmentWatcher>(
      video_watch, ctx, uploader_, session.pool, upload_options);
  session.audio_watcher->Start();
  session.video_watcher->Start();

  ScheduleScreenshot(session);
  return SessionResult::Success();
}

void RecordingCoordinator::ScheduleScreenshot(Session& session) {
  Session* s = &session;
  bool queued = s->pool.Submit(s->screenshot, [this, s] {
    if (s->context.SleepUnlessShutdown(config_.screenshot_delay)) {
      util::Logger::Info(std::string(kTag) + "screenshot skipped, recording stopped");
      return;
    }
    const std::string path = s->data_dir + "/" + kScreenshotFileName;
    std::string error;
    if (!backend_.CaptureScreenshot(s->options.screen_index, path, &error)) {
      util::Logger::Error(std::string(kTag) + "screenshot failed: " + error);
      return;
    }
    upload::UploadResult result =
        uploader_.Upload(s->options, path, upload::UploadKind::kScreenshot);
    if (!result.success) {
      util::Logger::Error(std::string(kTag) + "screenshot upload failed: " + result.message);
      return;
    }
    util::Logger::Info(std::string(kTag) + "screenshot uploaded " + path);
  });
  if (!queued) {
    util::Logger::Warn(std::string(kTag) + "screenshot not scheduled");
  }
}

void RecordingCoordinator::AbortStart(Session& session) {
  session.context.RequestShutdown();
  if (session.audio_capture) session.audio_capture->Stop();
  if (session.video_capture) session.video_capture->Stop();
  session.audio.Close(std::chrono::milliseconds(0));
  session.video.Close(std::chrono::milliseconds(0));
  session.supervisor.TerminateAll(std::chrono::milliseconds(0));
  session.context.MarkEncodersStopped();
  if (session.audio_watcher) session.audio_watcher->Join();
  if (session.video_watcher) session.video_watcher->Join();
  session.screenshot.Wait();
  util::Logger::Warn(std::string(kTag) + "start aborted, pipeline torn down");
}

SessionResult RecordingCoordinator::Stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!session_) {
    if (starting_) {
      starting_->context.RequestShutdown();
      util::Logger::Info(std::string(kTag) + "stop requested during start, cancelling");
      return SessionResult::Success();
    }
    util::Logger::Warn(std::string(kTag) + "stop requested with no active recording");
    return SessionResult::Success();
  }
  Session& s = *session_;
  util::Logger::Info(std::string(kTag) + "stopping video_id=" + s.options.video_id);

  // 1. Shutdown flag: every loop sees it from here on.
  s.context.RequestShutdown();

  // 2. No more captured data.
  s.audio_capture->Stop();
  s.video_capture->Stop();

  // 3. Close both encoder inputs (after a bounded flush) so each encoder
  //    finalizes its last segment.
  s.audio.Close(config_.pump_flush_timeout);
  s.video.Close(config_.pump_flush_timeout);

  // 4. Terminate the encoders; only now may the watchers run their final pass.
  size_t killed = s.supervisor.TerminateAll(config_.encoder_exit_grace);
  if (killed > 0) {
    util::Logger::Warn(std::string(kTag) + "encoders killed after grace count=" +
                       std::to_string(killed));
  }
  s.context.MarkEncodersStopped();

  // 5. Block until both streams have drained, in-flight uploads included.
  while (!s.context.WaitForAllDrained(kDrainLogInterval)) {
    util::Logger::Info(std::string(kTag) + "waiting for uploads to drain audio=" +
                       (s.context.IsDrained(StreamKind::kAudio) ? "done" : "pending") +
                       " video=" +
                       (s.context.IsDrained(StreamKind::kVideo) ? "done" : "pending"));
  }
  s.audio_watcher->Join();
  s.video_watcher->Join();
  s.screenshot.Wait();

  SessionResult result = SessionResult::Success();
  for (StreamEndpoint* ep : {&s.audio, &s.video}) {
    if (result.success && ep->PipeFailed()) {
      result = SessionResult::Failure(ErrorCode::kPipeError,
                                      std::string(StreamKindName(ep->Kind())) +
                                          " encoder pipe: " + ep->PipeFailureDetail());
    }
  }

  session_.reset();
  util::Logger::Info(std::string(kTag) + "recording stopped" +
                     (result.success ? "" : " with error: " + result.message));
  return result;
}

}  // namespace segcast
