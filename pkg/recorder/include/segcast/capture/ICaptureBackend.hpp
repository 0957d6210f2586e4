// Repository: Segcast-recorder
// Component: Capture Backend
// Purpose: Screen/microphone capture seam consumed by the recording coordinator.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_CAPTURE_ICAPTURE_BACKEND_HPP_
#define SEGCAST_CAPTURE_ICAPTURE_BACKEND_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "segcast/capture/CaptureFormats.hpp"

namespace segcast::capture {

// Delivery callback. Runs on the driver's own thread and must not block.
using DataCallback = std::function<void(const uint8_t* data, size_t len)>;

class IAudioCapture {
 public:
  virtual ~IAudioCapture() = default;

  virtual AudioFormat Format() const = 0;

  // Begins delivering interleaved PCM in Format() layout.
  virtual bool Start(DataCallback callback, std::string* error) = 0;

  // Halts delivery; no callback runs after Stop() returns. Idempotent.
  virtual void Stop() = 0;
};

class IVideoCapture {
 public:
  virtual ~IVideoCapture() = default;

  virtual VideoFormat Format() const = 0;

  // Spawns the frame-polling thread, which paces frames at Format().framerate
  // and delivers tightly-packed frames of width*height*4 bytes.
  virtual bool Start(DataCallback callback, std::string* error) = 0;

  // Stops and joins the polling thread. Idempotent.
  virtual void Stop() = 0;
};

class ICaptureBackend {
 public:
  virtual ~ICaptureBackend() = default;

  // False (with *detail) when this OS has no capture backend.
  virtual bool IsPlatformSupported(std::string* detail) const = 0;

  // Opens `device_name`, or the system default when it is empty or not
  // present. nullptr (with *error) when no usable device exists.
  virtual std::unique_ptr<IAudioCapture> OpenAudio(const std::string& device_name,
                                                   std::string* error) = 0;

  virtual std::unique_ptr<IVideoCapture> OpenVideo(const std::string& screen_index,
                                                   int framerate, std::string* error) = 0;

  // Grabs one frame of the screen and writes it as JPEG to `output_path`.
  virtual bool CaptureScreenshot(const std::string& screen_index, const std::string& output_path,
                                 std::string* error) = 0;

  // Default input device first, never repeated.
  virtual std::vector<std::string> ListAudioInputDevices() = 0;
};

}  // namespace segcast::capture

#endif  // SEGCAST_CAPTURE_ICAPTURE_BACKEND_HPP_
