// Repository: Segcast-recorder
// Component: Segment Watcher
// Purpose: Per-stream manifest polling, exactly-once upload dispatch, final drain on shutdown.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_SEGMENTS_SEGMENT_WATCHER_HPP_
#define SEGCAST_SEGMENTS_SEGMENT_WATCHER_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>

#include "segcast/StreamKind.hpp"
#include "segcast/session/RecordingOptions.hpp"
#include "segcast/session/SessionContext.hpp"
#include "segcast/upload/IChunkUploader.hpp"
#include "segcast/util/WorkerPool.hpp"

namespace segcast::segments {

struct SegmentWatcherConfig {
  StreamKind kind = StreamKind::kAudio;
  std::string chunk_dir;  // Holds segment_list.txt and the segment files.
  std::chrono::milliseconds poll_interval{500};
  std::chrono::milliseconds drain_gate_timeout{5000};
};

// SegmentWatcher runs Running -> Draining -> Done on its own thread.
//
// Running:  every poll_interval, one pass: read the manifest, and for each
//           name not yet seen mark it seen and (if the file exists) submit
//           one upload to the pool. Names are marked seen whether or not the
//           file exists or the upload succeeds, so no name is dispatched twice.
// Draining: entered when the session's shutdown flag is set. Waits (bounded)
//           until the encoders have been stopped, runs exactly one more pass,
//           then waits for every upload this watcher dispatched.
// Done:     marks the stream drained in the SessionContext; thread exits.
//
// Uploads from different passes may overlap; the pool bounds concurrency.
class SegmentWatcher {
 public:
  enum class State { kIdle, kRunning, kDraining, kDone };

  // `context`, `uploader` and `pool` must outlive the watcher.
  SegmentWatcher(SegmentWatcherConfig config, SessionContext& context,
                 upload::IChunkUploader& uploader, util::WorkerPool& pool,
                 std::optional<RecordingOptions> options);
  ~SegmentWatcher();

  SegmentWatcher(const SegmentWatcher&) = delete;
  SegmentWatcher& operator=(const SegmentWatcher&) = delete;

  void Start();

  // Joins the watcher thread. Returns once the watcher is Done; the session
  // shutdown flag must be set or this blocks.
  void Join();

  // One discovery pass. Returns the number of uploads dispatched.
  size_t RunPass();

  // Blocks until every upload dispatched by this watcher has returned.
  void WaitForUploads();

  State GetState() const { return state_.load(std::memory_order_acquire); }
  size_t SeenCount() const;
  uint64_t DispatchedCount() const { return dispatched_.load(std::memory_order_relaxed); }
  uint64_t UploadedCount() const { return uploaded_.load(std::memory_order_relaxed); }
  uint64_t FailedCount() const { return failed_.load(std::memory_order_relaxed); }

 private:
  void Run();
  void Dispatch(const std::string& path);

  const SegmentWatcherConfig config_;
  const std::string tag_;
  const std::string manifest_path_;
  SessionContext& context_;
  upload::IChunkUploader& uploader_;
  util::WorkerPool& pool_;
  const std::optional<RecordingOptions> options_;

  mutable std::mutex seen_mutex_;
  std::unordered_set<std::string> seen_;

  util::TaskGroup uploads_;
  std::atomic<State> state_{State::kIdle};
  std::atomic<uint64_t> dispatched_{0};
  std::atomic<uint64_t> uploaded_{0};
  std::atomic<uint64_t> failed_{0};

  std::thread thread_;
};

const char* WatcherStateName(SegmentWatcher::State state);

}  // namespace segcast::segments

#endif  // SEGCAST_SEGMENTS_SEGMENT_WATCHER_HPP_
