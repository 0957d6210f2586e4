// Repository: Segcast-recorder
// Component: Worker Pool
// Purpose: Fixed set of worker threads for I/O-bound jobs (segment uploads, screenshot).
// Copyright (c) 2025 Segcast

#include "segcast/util/WorkerPool.hpp"

#include <exception>
#include <stdexcept>

#include "segcast/util/Logger.hpp"

namespace segcast::util {

void TaskGroup::Add() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++pending_;
}

// Notifies under the lock: a waiter may destroy the group as soon as it
// observes pending_ == 0.
void TaskGroup::Done() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pending_ > 0) --pending_;
  cv_.notify_all();
}

void TaskGroup::Wait() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return pending_ == 0; });
}

bool TaskGroup::WaitFor(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return pending_ == 0; });
}

size_t TaskGroup::Pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_;
}

WorkerPool::WorkerPool(size_t worker_count, std::string name) : name_(std::move(name)) {
  if (worker_count == 0) {
    throw std::invalid_argument("WorkerPool: worker_count must be > 0");
  }
  workers_.reserve(worker_count);
  for (size_t i = 0; i < worker_count; ++i) {
    workers_.emplace_back(&WorkerPool::WorkerLoop, this);
  }
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
  }
  work_cv_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
}

bool WorkerPool::Submit(std::function<void()> job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) return false;
    queue_.push_back(std::move(job));
  }
  work_cv_.notify_one();
  return true;
}

bool WorkerPool::Submit(TaskGroup& group, std::function<void()> job) {
  group.Add();
  bool queued = Submit([this, &group, job = std::move(job)] {
    try {
      job();
    } catch (const std::exception& e) {
      Logger::Error("[" + name_ + "] job threw: " + e.what());
    } catch (...) {
      Logger::Error("[" + name_ + "] job threw a non-standard exception");
    }
    group.Done();
  });
  if (!queued) group.Done();
  return queued;
}

void WorkerPool::WaitIdle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
}

void WorkerPool::WorkerLoop() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
      // Drain before exit: jobs queued ahead of shutdown still run.
      if (queue_.empty()) break;
      job = std::move(queue_.front());
      queue_.pop_front();
      ++running_;
    }

    try {
      job();
    } catch (const std::exception& e) {
      Logger::Error("[" + name_ + "] job threw: " + e.what());
    } catch (...) {
      Logger::Error("[" + name_ + "] job threw a non-standard exception");
    }

    completed_.fetch_add(1, std::memory_order_relaxed);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      --running_;
    }
    idle_cv_.notify_all();
  }
}

}  // namespace segcast::util
