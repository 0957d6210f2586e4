// Repository: Segcast-recorder
// Component: Worker pool unit tests
// Purpose: FIFO execution, task groups, drain-on-destruction, throwing jobs.
// Copyright (c) 2025 Segcast

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

#include "segcast/util/Logger.hpp"
#include "segcast/util/WorkerPool.hpp"

namespace segcast::util {
namespace {

TEST(WorkerPoolTest, RejectsZeroWorkers) {
  EXPECT_THROW(WorkerPool(0), std::invalid_argument);
}

TEST(WorkerPoolTest, RunsEverySubmittedJob) {
  WorkerPool pool(3, "test");
  std::atomic<int> ran{0};
  for (int i = 0; i < 50; ++i) {
    ASSERT_TRUE(pool.Submit([&ran] { ran.fetch_add(1); }));
  }
  pool.WaitIdle();
  EXPECT_EQ(ran.load(), 50);
  EXPECT_EQ(pool.CompletedCount(), 50u);
  EXPECT_EQ(pool.WorkerCount(), 3u);
}

// -----------------------------------------------------------------------------
// A TaskGroup waits only for its own jobs, not for other work in the pool
// -----------------------------------------------------------------------------
TEST(WorkerPoolTest, TaskGroupWaitsForItsOwnJobsOnly) {
  WorkerPool pool(2, "test");
  std::atomic<bool> release_other{false};
  pool.Submit([&release_other] {
    while (!release_other.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
  });

  TaskGroup group;
  std::atomic<int> mine{0};
  for (int i = 0; i < 5; ++i) {
    pool.Submit(group, [&mine] { mine.fetch_add(1); });
  }
  EXPECT_TRUE(group.WaitFor(std::chrono::seconds(5)));
  EXPECT_EQ(mine.load(), 5);
  EXPECT_EQ(group.Pending(), 0u);

  release_other.store(true);
  pool.WaitIdle();
}

TEST(WorkerPoolTest, ThrowingJobStillCompletesItsGroup) {
  WorkerPool pool(1, "test");
  TaskGroup group;
  pool.Submit(group, [] { throw std::runtime_error("boom"); });
  std::atomic<bool> after{false};
  pool.Submit(group, [&after] { after.store(true); });
  EXPECT_TRUE(group.WaitFor(std::chrono::seconds(5)));
  EXPECT_TRUE(after.load());
}

TEST(WorkerPoolTest, NonStandardThrowIsLoggedAndCompletesItsGroup) {
  std::atomic<int> errors{0};
  Logger::SetErrorSink([&errors](const std::string&) { errors.fetch_add(1); });
  {
    WorkerPool pool(1, "test");
    TaskGroup group;
    pool.Submit(group, [] { throw 42; });
    pool.Submit([] { throw 7; });
    std::atomic<bool> after{false};
    pool.Submit(group, [&after] { after.store(true); });
    EXPECT_TRUE(group.WaitFor(std::chrono::seconds(5)));
    pool.WaitIdle();
    EXPECT_TRUE(after.load());
    EXPECT_EQ(pool.CompletedCount(), 3u);
  }
  Logger::SetErrorSink(nullptr);
  EXPECT_EQ(errors.load(), 2);
}

// -----------------------------------------------------------------------------
// A group may be destroyed as soon as Wait() returns, while the worker that
// completed its last job is still running
// -----------------------------------------------------------------------------
TEST(WorkerPoolTest, GroupCanBeDestroyedRightAfterWait) {
  WorkerPool pool(4, "test");
  std::atomic<int> ran{0};
  for (int i = 0; i < 2000; ++i) {
    auto group = std::make_unique<TaskGroup>();
    ASSERT_TRUE(pool.Submit(*group, [&ran] { ran.fetch_add(1); }));
    group->Wait();
    group.reset();
  }
  pool.WaitIdle();
  EXPECT_EQ(ran.load(), 2000);
}

TEST(WorkerPoolTest, DestructorDrainsQueuedJobs) {
  std::atomic<int> ran{0};
  {
    WorkerPool pool(1, "test");
    for (int i = 0; i < 10; ++i) {
      pool.Submit([&ran] {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        ran.fetch_add(1);
      });
    }
  }
  EXPECT_EQ(ran.load(), 10);
}

}  // namespace
}  // namespace segcast::util
