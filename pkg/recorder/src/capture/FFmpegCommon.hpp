// Repository: Segcast-recorder
// Component: FFmpeg Capture Backend
// Purpose: Private libav helpers shared by the capture drivers and the screenshot path.
// Copyright (c) 2025 Segcast

#pragma once

#include <memory>
#include <string>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavdevice/avdevice.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

namespace segcast::capture::ffmpeg {

std::string AvError(int ret);

struct FormatContextDeleter {
  void operator()(AVFormatContext* ctx) const {
    if (ctx) avformat_close_input(&ctx);
  }
};
struct CodecContextDeleter {
  void operator()(AVCodecContext* ctx) const {
    if (ctx) avcodec_free_context(&ctx);
  }
};
struct FrameDeleter {
  void operator()(AVFrame* frame) const {
    if (frame) av_frame_free(&frame);
  }
};
struct PacketDeleter {
  void operator()(AVPacket* pkt) const {
    if (pkt) av_packet_free(&pkt);
  }
};
struct SwsDeleter {
  void operator()(SwsContext* ctx) const {
    if (ctx) sws_freeContext(ctx);
  }
};

using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextDeleter>;
using CodecContextPtr = std::unique_ptr<AVCodecContext, CodecContextDeleter>;
using FramePtr = std::unique_ptr<AVFrame, FrameDeleter>;
using PacketPtr = std::unique_ptr<AVPacket, PacketDeleter>;
using SwsPtr = std::unique_ptr<SwsContext, SwsDeleter>;

// Registers libavdevice once per process.
void EnsureDevicesRegistered();

// Device input names for this platform; nullptr when unsupported.
const char* ScreenInputFormat();
const char* AudioInputFormat();
const char* AudioFallbackInputFormat();

// URL passed to avformat_open_input for the screen device.
std::string ScreenUrl(const std::string& screen_index);

// URL for a named microphone device.
std::string AudioUrl(const std::string& device_name);

// Opens a device input. `framerate` <= 0 leaves the device default.
FormatContextPtr OpenDeviceInput(const char* format_name, const std::string& url, int framerate,
                                 std::string* error);

// Opens a decoder for the first video stream of `fmt`.
CodecContextPtr OpenVideoDecoder(AVFormatContext* fmt, int* stream_index, std::string* error);

}  // namespace segcast::capture::ffmpeg
