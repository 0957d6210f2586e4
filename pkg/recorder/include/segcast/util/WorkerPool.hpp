// Repository: Segcast-recorder
// Component: Worker Pool
// Purpose: Fixed set of worker threads for I/O-bound jobs (segment uploads, screenshot).
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_UTIL_WORKER_POOL_HPP_
#define SEGCAST_UTIL_WORKER_POOL_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace segcast::util {

// TaskGroup counts jobs that belong to one caller (e.g. one SegmentWatcher)
// so the caller can wait for exactly its own jobs while the pool is shared.
class TaskGroup {
 public:
  TaskGroup() = default;
  TaskGroup(const TaskGroup&) = delete;
  TaskGroup& operator=(const TaskGroup&) = delete;

  void Add();
  void Done();

  // Blocks until every Add() has been matched by a Done().
  void Wait();

  // Returns false on timeout.
  bool WaitFor(std::chrono::milliseconds timeout);

  size_t Pending() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  size_t pending_ = 0;
};

// WorkerPool runs submitted jobs on `worker_count` threads in FIFO order.
// Submit() is thread-safe and never blocks on job execution.
// The destructor drains the queue: every job submitted before destruction runs.
class WorkerPool {
 public:
  explicit WorkerPool(size_t worker_count, std::string name = "WorkerPool");
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Returns false if the pool is already shutting down (job not queued).
  bool Submit(std::function<void()> job);

  // Same as Submit, but the job is tracked by `group` (Add before queueing,
  // Done after the job returns or throws). `group` may be destroyed as soon
  // as its Wait() returns.
  bool Submit(TaskGroup& group, std::function<void()> job);

  // Blocks until the queue is empty and no job is running.
  void WaitIdle();

  size_t WorkerCount() const { return workers_.size(); }
  uint64_t CompletedCount() const { return completed_.load(std::memory_order_relaxed); }

 private:
  void WorkerLoop();

  std::string name_;
  std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<std::function<void()>> queue_;
  size_t running_ = 0;
  bool shutdown_ = false;
  std::atomic<uint64_t> completed_{0};
  std::vector<std::thread> workers_;
};

}  // namespace segcast::util

#endif  // SEGCAST_UTIL_WORKER_POOL_HPP_
