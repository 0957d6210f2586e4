// Repository: Segcast-recorder
// Component: Segment Watcher
// Purpose: Per-stream manifest polling, exactly-once upload dispatch, final drain on shutdown.
// Copyright (c) 2025 Segcast

#include "segcast/segments/SegmentWatcher.hpp"

#include <filesystem>

#include "segcast/segments/SegmentManifest.hpp"
#include "segcast/util/Logger.hpp"

namespace segcast::segments {

const char* WatcherStateName(SegmentWatcher::State state) {
  switch (state) {
    case SegmentWatcher::State::kIdle:
      return "Idle";
    case SegmentWatcher::State::kRunning:
      return "Running";
    case SegmentWatcher::State::kDraining:
      return "Draining";
    case SegmentWatcher::State::kDone:
      return "Done";
  }
  return "Unknown";
}

SegmentWatcher::SegmentWatcher(SegmentWatcherConfig config, SessionContext& context,
                               upload::IChunkUploader& uploader, util::WorkerPool& pool,
                               std::optional<RecordingOptions> options)
    : config_(std::move(config)),
      tag_(std::string("[SegmentWatcher:") + StreamKindName(config_.kind) + "]"),
      manifest_path_(config_.chunk_dir + "/" + kManifestFileName),
      context_(context),
      uploader_(uploader),
      pool_(pool),
      options_(std::move(options)) {}

SegmentWatcher::~SegmentWatcher() {
  Join();
  // Uploads capture `this`; never let one outlive the watcher.
  WaitForUploads();
}

void SegmentWatcher::Start() {
  if (thread_.joinable()) return;
  state_.store(State::kRunning, std::memory_order_release);
  thread_ = std::thread(&SegmentWatcher::Run, this);
}

void SegmentWatcher::Join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

size_t SegmentWatcher::SeenCount() const {
  std::lock_guard<std::mutex> lock(seen_mutex_);
  return seen_.size();
}

void SegmentWatcher::WaitForUploads() { uploads_.Wait(); }

void SegmentWatcher::Run() {
  util::Logger::Info(tag_ + " running manifest=" + manifest_path_);

  while (!context_.IsShuttingDown()) {
    RunPass();
    context_.SleepUnlessShutdown(config_.poll_interval);
  }

  state_.store(State::kDraining, std::memory_order_release);
  if (!context_.WaitForEncodersStopped(config_.drain_gate_timeout)) {
    util::Logger::Warn(tag_ + " encoders not stopped within drain gate, final pass anyway");
  }
  size_t last = RunPass();
  util::Logger::Info(tag_ + " final pass dispatched=" + std::to_string(last) +
                     " in_flight=" + std::to_string(uploads_.Pending()));
  WaitForUploads();

  state_.store(State::kDone, std::memory_order_release);
  util::Logger::Info(tag_ + " drained seen=" + std::to_string(SeenCount()) +
                     " uploaded=" + std::to_string(UploadedCount()) +
                     " failed=" + std::to_string(FailedCount()));
  context_.MarkDrained(config_.kind);
}

size_t SegmentWatcher::RunPass() {
  std::string error;
  auto entries = LoadManifest(manifest_path_, &error);
  if (!entries) {
    util::Logger::Warn(tag_ + " manifest read failed: " + error);
    return 0;
  }

  std::vector<std::string> fresh;
  {
    std::lock_guard<std::mutex> lock(seen_mutex_);
    for (const auto& name : *entries) {
      if (seen_.insert(name).second) {
        fresh.push_back(name);
      }
    }
  }

  size_t dispatched = 0;
  for (const auto& name : fresh) {
    const std::string path = config_.chunk_dir + "/" + name;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
      util::Logger::Warn(tag_ + " listed segment missing on disk: " + name);
      continue;
    }
    Dispatch(path);
    ++dispatched;
  }
  if (dispatched > 0) {
    util::Logger::Debug(tag_ + " pass dispatched=" + std::to_string(dispatched));
  }
  return dispatched;
}

void SegmentWatcher::Dispatch(const std::string& path) {
  dispatched_.fetch_add(1, std::memory_order_relaxed);
  const upload::UploadKind kind = upload::UploadKindFor(config_.kind);
  bool queued = pool_.Submit(uploads_, [this, path, kind] {
    upload::UploadResult result = uploader_.Upload(options_, path, kind);
    if (result.success) {
      uploaded_.fetch_add(1, std::memory_order_relaxed);
      util::Logger::Info(tag_ + " uploaded " + path);
    } else {
      failed_.fetch_add(1, std::memory_order_relaxed);
      util::Logger::Error(tag_ + " upload failed " + path + ": " + result.message);
    }
  });
  if (!queued) {
    failed_.fetch_add(1, std::memory_order_relaxed);
    util::Logger::Error(tag_ + " upload pool stopped, not uploaded: " + path);
  }
}

}  // namespace segcast::segments
