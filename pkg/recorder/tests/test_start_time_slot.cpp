// Repository: Segcast-recorder
// Component: Start time slot unit tests
// Purpose: Write-once first-sample timestamp shared between capture and sync.
// Copyright (c) 2025 Segcast

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "segcast/sync/StartTimeSlot.hpp"

namespace segcast::sync {
namespace {

TEST(StartTimeSlotTest, EmptyUntilMarked) {
  StartTimeSlot slot;
  EXPECT_FALSE(slot.IsSet());
  EXPECT_FALSE(slot.Get().has_value());
}

TEST(StartTimeSlotTest, FirstMarkWins) {
  StartTimeSlot slot;
  const auto t0 = Clock::time_point(std::chrono::milliseconds(100));
  const auto t1 = Clock::time_point(std::chrono::milliseconds(900));
  EXPECT_TRUE(slot.TryMark(t0));
  EXPECT_FALSE(slot.TryMark(t1));
  EXPECT_FALSE(slot.TryMark());
  ASSERT_TRUE(slot.IsSet());
  EXPECT_EQ(*slot.Get(), t0);
}

TEST(StartTimeSlotTest, ConcurrentMarkersSetExactlyOnce) {
  StartTimeSlot slot;
  std::atomic<int> winners{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&slot, &winners] {
      for (int j = 0; j < 1000; ++j) {
        if (slot.TryMark()) winners.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(winners.load(), 1);
  EXPECT_TRUE(slot.IsSet());
}

}  // namespace
}  // namespace segcast::sync
