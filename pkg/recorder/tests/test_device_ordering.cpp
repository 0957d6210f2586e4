// Repository: Segcast-recorder
// Component: Device enumeration unit tests
// Purpose: Default-first input device ordering and requested-device selection.
// Copyright (c) 2025 Segcast

#include <gtest/gtest.h>

#include "segcast/capture/DeviceEnumerator.hpp"

namespace segcast::capture {
namespace {

TEST(DeviceOrderingTest, DefaultComesFirstWithoutDuplicates) {
  auto ordered = OrderInputDevices({"USB Mic", "Built-in Microphone", "", "Webcam Mic", "USB Mic"},
                                   "Built-in Microphone");
  ASSERT_EQ(ordered.size(), 3u);
  EXPECT_EQ(ordered[0], "Built-in Microphone");
  EXPECT_EQ(ordered[1], "USB Mic");
  EXPECT_EQ(ordered[2], "Webcam Mic");
}

TEST(DeviceOrderingTest, DefaultMissingFromListIsStillFirst) {
  auto ordered = OrderInputDevices({"hw:1,0"}, "default");
  ASSERT_EQ(ordered.size(), 2u);
  EXPECT_EQ(ordered[0], "default");
  EXPECT_EQ(ordered[1], "hw:1,0");
}

TEST(DeviceOrderingTest, NoDefaultKeepsEnumerationOrder) {
  auto ordered = OrderInputDevices({"b", "a"}, "");
  ASSERT_EQ(ordered.size(), 2u);
  EXPECT_EQ(ordered[0], "b");
}

TEST(DeviceOrderingTest, RequestedDeviceIsUsedWhenPresent) {
  const std::vector<std::string> names = {"USB Mic", "Built-in Microphone"};
  EXPECT_EQ(SelectInputDevice(names, "Built-in Microphone", "USB Mic"), "USB Mic");
}

TEST(DeviceOrderingTest, UnknownOrEmptyRequestFallsBackToDefault) {
  const std::vector<std::string> names = {"USB Mic", "Built-in Microphone"};
  EXPECT_EQ(SelectInputDevice(names, "Built-in Microphone", "Headset"), "Built-in Microphone");
  EXPECT_EQ(SelectInputDevice(names, "Built-in Microphone", ""), "Built-in Microphone");
}

}  // namespace
}  // namespace segcast::capture
