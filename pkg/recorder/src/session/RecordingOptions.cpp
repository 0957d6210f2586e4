// Repository: Segcast-recorder
// Component: Recording Options
// Purpose: Per-start recording options and process-level recorder configuration.
// Copyright (c) 2025 Segcast

#include "segcast/session/RecordingOptions.hpp"

#include <cstdlib>

namespace segcast {

namespace {

bool ParsePositiveInt(const std::string& text, int* out) {
  if (text.empty() || text.size() > 6) return false;
  int value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
    value = value * 10 + (c - '0');
  }
  if (value <= 0) return false;
  *out = value;
  return true;
}

const char* NonEmptyEnv(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || value[0] == '\0') return nullptr;
  return value;
}

}  // namespace

bool ParseResolution(const std::string& text, int* width, int* height) {
  auto x = text.find('x');
  if (x == std::string::npos) return false;
  int w = 0;
  int h = 0;
  if (!ParsePositiveInt(text.substr(0, x), &w)) return false;
  if (!ParsePositiveInt(text.substr(x + 1), &h)) return false;
  if (width) *width = w;
  if (height) *height = h;
  return true;
}

RecorderConfig RecorderConfig::FromEnvironment() {
  RecorderConfig config;
  if (const char* ffmpeg = NonEmptyEnv("SEGCAST_FFMPEG_PATH")) {
    config.encoder_binary = ffmpeg;
  }
  if (const char* dir = NonEmptyEnv("SEGCAST_DATA_DIR")) {
    config.data_dir = std::string(dir);
  }
  if (const char* target = NonEmptyEnv("SEGCAST_UPLOAD_TARGET")) {
    config.upload_target = target;
  }
  return config;
}

}  // namespace segcast
