// Repository: Segcast-recorder
// Component: Segment Manifest
// Purpose: Chunk directory preparation and reading of the encoder's segment list.
// Copyright (c) 2025 Segcast

#include "segcast/segments/SegmentManifest.hpp"

#include <filesystem>
#include <fstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace segcast::segments {

bool PrepareChunkDirectory(const std::string& dir, std::string* error) {
  std::error_code ec;
  fs::remove_all(dir, ec);
  if (ec) {
    if (error) *error = "remove " + dir + ": " + ec.message();
    return false;
  }
  fs::create_directories(dir, ec);
  if (ec) {
    if (error) *error = "create " + dir + ": " + ec.message();
    return false;
  }
  return EnsureManifestExists(dir, error);
}

bool EnsureManifestExists(const std::string& dir, std::string* error) {
  const fs::path path = fs::path(dir) / kManifestFileName;
  std::error_code ec;
  if (fs::exists(path, ec)) {
    return true;
  }
  std::ofstream out(path, std::ios::app);
  if (!out) {
    if (error) *error = "create " + path.string() + " failed";
    return false;
  }
  return true;
}

std::optional<std::vector<std::string>> LoadManifest(const std::string& manifest_path,
                                                     std::string* error) {
  std::error_code ec;
  if (!fs::exists(manifest_path, ec)) {
    if (ec) {
      if (error) *error = "stat " + manifest_path + ": " + ec.message();
      return std::nullopt;
    }
    return std::vector<std::string>{};
  }

  std::ifstream in(manifest_path);
  if (!in) {
    if (error) *error = "open " + manifest_path + " failed";
    return std::nullopt;
  }

  std::vector<std::string> entries;
  std::unordered_set<std::string> seen;
  std::string line;
  while (std::getline(in, line)) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
      line.pop_back();
    }
    if (line.empty()) continue;
    if (seen.insert(line).second) {
      entries.push_back(line);
    }
  }
  if (in.bad()) {
    if (error) *error = "read " + manifest_path + " failed";
    return std::nullopt;
  }
  return entries;
}

}  // namespace segcast::segments
