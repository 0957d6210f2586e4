// Repository: Segcast-recorder
// Component: Recording Options
// Purpose: Per-start recording options and process-level recorder configuration.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_SESSION_RECORDING_OPTIONS_HPP_
#define SEGCAST_SESSION_RECORDING_OPTIONS_HPP_

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace segcast {

// Options supplied with each start command. Identifies the recording and
// where its chunks are stored remotely.
struct RecordingOptions {
  std::string user_id;
  std::string video_id;
  std::string screen_index;
  std::string audio_name;
  std::string region;
  std::string bucket;
  int framerate = 30;
  std::string resolution;  // "WxH" or empty for native size.
};

// Parses "WxH" into positive width/height. Returns false on any other form.
bool ParseResolution(const std::string& text, int* width, int* height);

// Process-level settings. Immutable once handed to the coordinator.
struct RecorderConfig {
  std::optional<std::string> data_dir;
  std::string encoder_binary = "ffmpeg";

  std::string upload_target = "localhost:50061";
  std::chrono::milliseconds upload_timeout{30000};
  size_t upload_chunk_bytes = 64 * 1024;
  size_t upload_workers = 4;

  size_t relay_capacity = 2048;

  std::chrono::milliseconds sync_poll_interval{50};
  std::chrono::milliseconds sync_timeout{10000};

  std::chrono::milliseconds manifest_poll_interval{500};
  int segment_seconds = 3;

  std::chrono::milliseconds pump_flush_timeout{1000};
  std::chrono::milliseconds encoder_exit_grace{2000};
  std::chrono::milliseconds drain_gate_timeout{5000};

  std::chrono::milliseconds screenshot_delay{3000};

  // Defaults with environment overrides applied:
  //   SEGCAST_FFMPEG_PATH    -> encoder_binary
  //   SEGCAST_DATA_DIR       -> data_dir
  //   SEGCAST_UPLOAD_TARGET  -> upload_target
  static RecorderConfig FromEnvironment();
};

}  // namespace segcast

#endif  // SEGCAST_SESSION_RECORDING_OPTIONS_HPP_
