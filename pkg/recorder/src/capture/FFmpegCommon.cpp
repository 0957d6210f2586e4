// Repository: Segcast-recorder
// Component: FFmpeg Capture Backend
// Purpose: Private libav helpers shared by the capture drivers and the screenshot path.
// Copyright (c) 2025 Segcast

#include "capture/FFmpegCommon.hpp"

#include <cstdlib>
#include <mutex>

namespace segcast::capture::ffmpeg {

std::string AvError(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return std::string(errbuf) + " (" + std::to_string(ret) + ")";
}

void EnsureDevicesRegistered() {
  static std::once_flag once;
  std::call_once(once, [] { avdevice_register_all(); });
}

const char* ScreenInputFormat() {
#if defined(__linux__)
  return "x11grab";
#elif defined(__APPLE__)
  return "avfoundation";
#elif defined(_WIN32)
  return "gdigrab";
#else
  return nullptr;
#endif
}

const char* AudioInputFormat() {
#if defined(__linux__)
  return "pulse";
#elif defined(__APPLE__)
  return "avfoundation";
#elif defined(_WIN32)
  return "dshow";
#else
  return nullptr;
#endif
}

const char* AudioFallbackInputFormat() {
#if defined(__linux__)
  return "alsa";
#else
  return nullptr;
#endif
}

std::string ScreenUrl(const std::string& screen_index) {
#if defined(__linux__)
  if (screen_index.find(':') != std::string::npos) {
    return screen_index;
  }
  const char* display = std::getenv("DISPLAY");
  if (display != nullptr && display[0] != '\0') {
    return display;
  }
  return ":0.0";
#elif defined(__APPLE__)
  return (screen_index.empty() ? std::string("1") : screen_index) + ":none";
#elif defined(_WIN32)
  (void)screen_index;
  return "desktop";
#else
  return screen_index;
#endif
}

std::string AudioUrl(const std::string& device_name) {
#if defined(__APPLE__)
  return ":" + (device_name.empty() ? std::string("default") : device_name);
#elif defined(_WIN32)
  return "audio=" + device_name;
#else
  return device_name.empty() ? std::string("default") : device_name;
#endif
}

FormatContextPtr OpenDeviceInput(const char* format_name, const std::string& url, int framerate,
                                 std::string* error) {
  EnsureDevicesRegistered();
  const AVInputFormat* input_format = av_find_input_format(format_name);
  if (input_format == nullptr) {
    if (error) *error = std::string("input device '") + format_name + "' not available";
    return nullptr;
  }

  AVDictionary* options = nullptr;
  if (framerate > 0) {
    av_dict_set(&options, "framerate", std::to_string(framerate).c_str(), 0);
  }
#if defined(__APPLE__)
  av_dict_set(&options, "pixel_format", "bgr0", 0);
#endif

  AVFormatContext* raw = nullptr;
  int ret = avformat_open_input(&raw, url.c_str(), input_format, &options);
  av_dict_free(&options);
  if (ret < 0) {
    if (error) *error = std::string(format_name) + " open '" + url + "' failed: " + AvError(ret);
    return nullptr;
  }
  FormatContextPtr ctx(raw);

  ret = avformat_find_stream_info(ctx.get(), nullptr);
  if (ret < 0) {
    if (error) *error = std::string(format_name) + " stream info failed: " + AvError(ret);
    return nullptr;
  }
  return ctx;
}

CodecContextPtr OpenVideoDecoder(AVFormatContext* fmt, int* stream_index, std::string* error) {
  int index = av_find_best_stream(fmt, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (index < 0) {
    if (error) *error = "no video stream: " + AvError(index);
    return nullptr;
  }
  AVCodecParameters* codecpar = fmt->streams[index]->codecpar;
  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (codec == nullptr) {
    if (error) *error = "no decoder for screen stream";
    return nullptr;
  }
  CodecContextPtr ctx(avcodec_alloc_context3(codec));
  if (!ctx) {
    if (error) *error = "decoder alloc failed";
    return nullptr;
  }
  int ret = avcodec_parameters_to_context(ctx.get(), codecpar);
  if (ret >= 0) ret = avcodec_open2(ctx.get(), codec, nullptr);
  if (ret < 0) {
    if (error) *error = "decoder open failed: " + AvError(ret);
    return nullptr;
  }
  if (stream_index) *stream_index = index;
  return ctx;
}

}  // namespace segcast::capture::ffmpeg
