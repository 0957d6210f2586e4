// Repository: Segcast-recorder
// Component: Capture Formats
// Purpose: Raw sample/frame layouts delivered by capture drivers to the encoders.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_CAPTURE_CAPTURE_FORMATS_HPP_
#define SEGCAST_CAPTURE_CAPTURE_FORMATS_HPP_

#include <string>

namespace segcast::capture {

// Interleaved PCM as delivered by the audio driver.
struct AudioFormat {
  std::string sample_format = "s16le";  // Encoder raw format name: s16le, f32le, s32le, s8.
  int sample_rate = 48000;
  int channels = 2;
  std::string device_name;
};

// Tightly-packed frames. Height is always even.
struct VideoFormat {
  std::string pixel_format = "bgra";
  int width = 0;
  int height = 0;
  int framerate = 30;
};

}  // namespace segcast::capture

#endif  // SEGCAST_CAPTURE_CAPTURE_FORMATS_HPP_
