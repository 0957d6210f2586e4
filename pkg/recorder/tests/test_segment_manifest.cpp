// Repository: Segcast-recorder
// Component: Segment manifest unit tests
// Purpose: Chunk directory preparation and segment_list.txt parsing.
// Copyright (c) 2025 Segcast

#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>

#include "segcast/segments/SegmentManifest.hpp"

namespace segcast::segments {
namespace {

namespace fs = std::filesystem;

std::string TempDir(const std::string& name) {
  return "/tmp/segcast_manifest_" + name + "_" + std::to_string(getpid());
}

void WriteText(const std::string& path, const std::string& text) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << text;
}

TEST(SegmentManifestTest, PrepareWipesStaleContentAndCreatesEmptyManifest) {
  const std::string dir = TempDir("prepare");
  fs::create_directories(dir);
  WriteText(dir + "/audio_recording_000.aac", "stale");
  WriteText(dir + "/segment_list.txt", "audio_recording_000.aac\n");

  std::string error;
  ASSERT_TRUE(PrepareChunkDirectory(dir, &error)) << error;
  EXPECT_FALSE(fs::exists(dir + "/audio_recording_000.aac"));
  ASSERT_TRUE(fs::exists(dir + "/segment_list.txt"));
  EXPECT_EQ(fs::file_size(dir + "/segment_list.txt"), 0u);

  auto entries = LoadManifest(dir + "/segment_list.txt", &error);
  ASSERT_TRUE(entries.has_value()) << error;
  EXPECT_TRUE(entries->empty());
  fs::remove_all(dir);
}

TEST(SegmentManifestTest, EnsureKeepsExistingManifest) {
  const std::string dir = TempDir("ensure");
  fs::create_directories(dir);
  WriteText(dir + "/segment_list.txt", "a_000.ts\n");
  std::string error;
  ASSERT_TRUE(EnsureManifestExists(dir, &error)) << error;
  auto entries = LoadManifest(dir + "/segment_list.txt", &error);
  ASSERT_TRUE(entries.has_value());
  EXPECT_EQ(entries->size(), 1u);
  fs::remove_all(dir);
}

TEST(SegmentManifestTest, MissingManifestReadsAsEmpty) {
  std::string error;
  auto entries = LoadManifest(TempDir("absent") + "/segment_list.txt", &error);
  ASSERT_TRUE(entries.has_value()) << error;
  EXPECT_TRUE(entries->empty());
}

TEST(SegmentManifestTest, LinesAreTrimmedDedupedAndOrdered) {
  const std::string dir = TempDir("parse");
  fs::create_directories(dir);
  WriteText(dir + "/segment_list.txt",
            "a_000.ts\r\n\na_001.ts  \na_000.ts\n   \na_002.ts");
  std::string error;
  auto entries = LoadManifest(dir + "/segment_list.txt", &error);
  ASSERT_TRUE(entries.has_value()) << error;
  ASSERT_EQ(entries->size(), 3u);
  EXPECT_EQ((*entries)[0], "a_000.ts");
  EXPECT_EQ((*entries)[1], "a_001.ts");
  EXPECT_EQ((*entries)[2], "a_002.ts");
  fs::remove_all(dir);
}

}  // namespace
}  // namespace segcast::segments
