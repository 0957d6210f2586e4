// Repository: Segcast-recorder
// Component: Segment Manifest
// Purpose: Chunk directory preparation and reading of the encoder's segment list.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_SEGMENTS_SEGMENT_MANIFEST_HPP_
#define SEGCAST_SEGMENTS_SEGMENT_MANIFEST_HPP_

#include <optional>
#include <string>
#include <vector>

namespace segcast::segments {

inline constexpr const char* kManifestFileName = "segment_list.txt";

// Removes `dir` (if present), recreates it, and creates an empty manifest.
bool PrepareChunkDirectory(const std::string& dir, std::string* error);

// Creates an empty manifest in `dir` if none exists. Never truncates.
bool EnsureManifestExists(const std::string& dir, std::string* error);

// Reads the manifest at `manifest_path`. Entries are returned in file order
// with blank lines and trailing '\r' removed and duplicates collapsed.
// A missing file yields an empty list. Read errors yield nullopt.
std::optional<std::vector<std::string>> LoadManifest(const std::string& manifest_path,
                                                     std::string* error);

}  // namespace segcast::segments

#endif  // SEGCAST_SEGMENTS_SEGMENT_MANIFEST_HPP_
