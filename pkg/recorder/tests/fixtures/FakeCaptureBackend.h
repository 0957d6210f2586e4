// Repository: Segcast-recorder
// Component: Test fixtures
// Purpose: Scriptable capture backend: synthetic audio/video drivers, device list, screenshot.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_TESTS_FIXTURES_FAKE_CAPTURE_BACKEND_H_
#define SEGCAST_TESTS_FIXTURES_FAKE_CAPTURE_BACKEND_H_

#include <atomic>
#include <chrono>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "segcast/capture/DeviceEnumerator.hpp"
#include "segcast/capture/ICaptureBackend.hpp"

namespace segcast::tests::fixtures {

// Delivers `buffer_size` bytes every `period` from its own thread, after an
// optional initial delay. A silent driver starts but never delivers.
class SyntheticDriver {
 public:
  SyntheticDriver(size_t buffer_size, std::chrono::milliseconds period,
                  std::chrono::milliseconds first_delay, bool silent)
      : buffer_size_(buffer_size), period_(period), first_delay_(first_delay), silent_(silent) {}

  ~SyntheticDriver() { Stop(); }

  bool Start(capture::DataCallback callback) {
    if (thread_.joinable()) return false;
    callback_ = std::move(callback);
    thread_ = std::thread([this] {
      auto wake = std::chrono::steady_clock::now() + first_delay_;
      std::vector<uint8_t> buffer(buffer_size_, 0x5a);
      while (!stop_.load()) {
        if (std::chrono::steady_clock::now() >= wake) {
          if (!silent_) {
            callback_(buffer.data(), buffer.size());
            delivered_.fetch_add(1);
          }
          wake += period_;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }
    });
    return true;
  }

  void Stop() {
    stop_.store(true);
    if (thread_.joinable()) thread_.join();
  }

  size_t Delivered() const { return delivered_.load(); }

 private:
  const size_t buffer_size_;
  const std::chrono::milliseconds period_;
  const std::chrono::milliseconds first_delay_;
  const bool silent_;
  capture::DataCallback callback_;
  std::atomic<bool> stop_{false};
  std::atomic<size_t> delivered_{0};
  std::thread thread_;
};

class FakeAudioCapture : public capture::IAudioCapture {
 public:
  FakeAudioCapture(capture::AudioFormat format, std::chrono::milliseconds first_delay, bool silent)
      : format_(std::move(format)),
        driver_(256, std::chrono::milliseconds(5), first_delay, silent) {}

  capture::AudioFormat Format() const override { return format_; }
  bool Start(capture::DataCallback callback, std::string*) override {
    return driver_.Start(std::move(callback));
  }
  void Stop() override { driver_.Stop(); }

 private:
  capture::AudioFormat format_;
  SyntheticDriver driver_;
};

class FakeVideoCapture : public capture::IVideoCapture {
 public:
  FakeVideoCapture(capture::VideoFormat format, std::chrono::milliseconds first_delay, bool silent)
      : format_(std::move(format)),
        driver_(static_cast<size_t>(format_.width) * format_.height * 4,
                std::chrono::milliseconds(1000 / format_.framerate), first_delay, silent) {}

  capture::VideoFormat Format() const override { return format_; }
  bool Start(capture::DataCallback callback, std::string*) override {
    return driver_.Start(std::move(callback));
  }
  void Stop() override { driver_.Stop(); }

 private:
  capture::VideoFormat format_;
  SyntheticDriver driver_;
};

class FakeCaptureBackend : public capture::ICaptureBackend {
 public:
  bool platform_supported = true;
  bool audio_available = true;
  bool video_available = true;
  bool audio_silent = false;
  bool video_silent = false;
  std::chrono::milliseconds audio_first_delay{0};
  std::chrono::milliseconds video_first_delay{0};
  std::vector<std::string> devices = {"USB Mic", "Built-in Microphone"};
  std::string default_device = "Built-in Microphone";
  std::atomic<int> screenshots{0};
  std::atomic<int> video_opens{0};
  std::string last_opened_audio;

  bool IsPlatformSupported(std::string* detail) const override {
    if (!platform_supported && detail) *detail = "Unsupported OS";
    return platform_supported;
  }

  std::unique_ptr<capture::IAudioCapture> OpenAudio(const std::string& device_name,
                                                    std::string* error) override {
    if (!audio_available) {
      if (error) *error = "no usable audio input device";
      return nullptr;
    }
    capture::AudioFormat format;
    format.sample_format = "f32le";
    format.sample_rate = 48000;
    format.channels = 2;
    format.device_name = capture::SelectInputDevice(devices, default_device, device_name);
    last_opened_audio = format.device_name;
    return std::make_unique<FakeAudioCapture>(format, audio_first_delay, audio_silent);
  }

  std::unique_ptr<capture::IVideoCapture> OpenVideo(const std::string&, int framerate,
                                                    std::string* error) override {
    if (!video_available) {
      if (error) *error = "cannot open display :0.0";
      return nullptr;
    }
    capture::VideoFormat format;
    format.width = 16;
    format.height = 8;
    format.framerate = framerate > 0 ? framerate : 30;
    video_opens.fetch_add(1);
    return std::make_unique<FakeVideoCapture>(format, video_first_delay, video_silent);
  }

  bool CaptureScreenshot(const std::string&, const std::string& output_path,
                         std::string* error) override {
    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    out << "\xff\xd8\xff\xd9";
    if (!out) {
      if (error) *error = "write failed";
      return false;
    }
    screenshots.fetch_add(1);
    return true;
  }

  std::vector<std::string> ListAudioInputDevices() override {
    return capture::OrderInputDevices(devices, default_device);
  }
};

}  // namespace segcast::tests::fixtures

#endif  // SEGCAST_TESTS_FIXTURES_FAKE_CAPTURE_BACKEND_H_
