// Repository: Segcast-recorder
// Component: FFmpeg Capture Backend
// Purpose: libavdevice screen grabber, microphone reader and JPEG screenshot.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_CAPTURE_FFMPEG_CAPTURE_BACKEND_HPP_
#define SEGCAST_CAPTURE_FFMPEG_CAPTURE_BACKEND_HPP_

#include <memory>
#include <string>
#include <vector>

#include "segcast/capture/ICaptureBackend.hpp"

namespace segcast::capture {

// Input devices per platform:
//   Linux    x11grab (screen), pulse then alsa (microphone)
//   macOS    avfoundation for both
//   Windows  gdigrab (screen), dshow (microphone)
// Any other platform reports IsPlatformSupported() == false.
//
// Linux screen selection: a screen_index containing ':' is used as the X
// display name; otherwise $DISPLAY, else ":0.0".
class FFmpegCaptureBackend : public ICaptureBackend {
 public:
  FFmpegCaptureBackend();

  bool IsPlatformSupported(std::string* detail) const override;

  std::unique_ptr<IAudioCapture> OpenAudio(const std::string& device_name,
                                           std::string* error) override;

  std::unique_ptr<IVideoCapture> OpenVideo(const std::string& screen_index, int framerate,
                                           std::string* error) override;

  bool CaptureScreenshot(const std::string& screen_index, const std::string& output_path,
                         std::string* error) override;

  std::vector<std::string> ListAudioInputDevices() override;
};

}  // namespace segcast::capture

#endif  // SEGCAST_CAPTURE_FFMPEG_CAPTURE_BACKEND_HPP_
