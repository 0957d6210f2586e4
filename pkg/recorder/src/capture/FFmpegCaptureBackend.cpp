// Repository: Segcast-recorder
// Component: FFmpeg Capture Backend
// Purpose: libavdevice screen grabber, microphone reader and JPEG screenshot.
// Copyright (c) 2025 Segcast

#include "segcast/capture/FFmpegCaptureBackend.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <thread>
#include <vector>

#include "capture/FFmpegCommon.hpp"
#include "segcast/capture/DeviceEnumerator.hpp"
#include "segcast/util/Logger.hpp"

namespace segcast::capture {

using namespace ffmpeg;

namespace {

// Aborts a blocking av_read_frame when the owning driver stops.
int InterruptCallback(void* opaque) {
  auto* stop = static_cast<std::atomic<bool>*>(opaque);
  return (stop != nullptr && stop->load(std::memory_order_acquire)) ? 1 : 0;
}

std::string SampleFormatName(AVCodecID codec_id) {
  switch (codec_id) {
    case AV_CODEC_ID_PCM_S16LE:
      return "s16le";
    case AV_CODEC_ID_PCM_S16BE:
      return "s16be";
    case AV_CODEC_ID_PCM_F32LE:
      return "f32le";
    case AV_CODEC_ID_PCM_S32LE:
      return "s32le";
    case AV_CODEC_ID_PCM_S8:
      return "s8";
    case AV_CODEC_ID_PCM_U8:
      return "u8";
    default:
      return "";
  }
}

bool QueryAudioDevices(const char* format_name, std::vector<std::string>* names,
                       std::string* default_name) {
  const AVInputFormat* input_format = av_find_input_format(format_name);
  if (input_format == nullptr) return false;

  AVDeviceInfoList* list = nullptr;
  int ret = avdevice_list_input_sources(input_format, nullptr, nullptr, &list);
  if (ret < 0 || list == nullptr) {
    util::Logger::Debug(std::string("[Capture] ") + format_name +
                        " device listing failed: " + AvError(ret));
    if (list) avdevice_free_list_devices(&list);
    return false;
  }
  for (int i = 0; i < list->nb_devices; ++i) {
    const AVDeviceInfo* info = list->devices[i];
    if (info == nullptr || info->device_name == nullptr) continue;
    // Only sources with audio; an empty media type list means "unknown".
    bool has_audio = info->nb_media_types == 0;
    for (int m = 0; m < info->nb_media_types; ++m) {
      if (info->media_types[m] == AVMEDIA_TYPE_AUDIO) has_audio = true;
    }
    if (!has_audio) continue;
    names->push_back(info->device_name);
    if (i == list->default_device) *default_name = info->device_name;
  }
  avdevice_free_list_devices(&list);
  return true;
}

class FFmpegAudioCapture : public IAudioCapture {
 public:
  FFmpegAudioCapture(FormatContextPtr fmt, int stream_index, AudioFormat format)
      : fmt_(std::move(fmt)), stream_index_(stream_index), format_(std::move(format)) {
    fmt_->interrupt_callback.callback = InterruptCallback;
    fmt_->interrupt_callback.opaque = &stop_;
  }

  ~FFmpegAudioCapture() override { Stop(); }

  AudioFormat Format() const override { return format_; }

  bool Start(DataCallback callback, std::string* error) override {
    if (thread_.joinable()) {
      if (error) *error = "audio capture already started";
      return false;
    }
    callback_ = std::move(callback);
    thread_ = std::thread(&FFmpegAudioCapture::ReadLoop, this);
    return true;
  }

  void Stop() override {
    stop_.store(true, std::memory_order_release);
    if (thread_.joinable()) thread_.join();
  }

 private:
  void ReadLoop() {
    PacketPtr pkt(av_packet_alloc());
    if (!pkt) {
      util::Logger::Error("[Capture] audio packet alloc failed");
      return;
    }
    while (!stop_.load(std::memory_order_acquire)) {
      int ret = av_read_frame(fmt_.get(), pkt.get());
      if (ret == AVERROR(EAGAIN)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        continue;
      }
      if (ret < 0) {
        if (!stop_.load(std::memory_order_acquire)) {
          util::Logger::Error("[Capture] audio read failed device=" + format_.device_name +
                              ": " + AvError(ret));
        }
        break;
      }
      if (pkt->stream_index == stream_index_ && pkt->size > 0) {
        callback_(pkt->data, static_cast<size_t>(pkt->size));
      }
      av_packet_unref(pkt.get());
    }
  }

  FormatContextPtr fmt_;
  const int stream_index_;
  const AudioFormat format_;
  DataCallback callback_;
  std::atomic<bool> stop_{false};
  std::thread thread_;
};

class FFmpegVideoCapture : public IVideoCapture {
 public:
  FFmpegVideoCapture(FormatContextPtr fmt, CodecContextPtr decoder, int stream_index,
                     VideoFormat format)
      : fmt_(std::move(fmt)),
        decoder_(std::move(decoder)),
        stream_index_(stream_index),
        format_(std::move(format)) {
    fmt_->interrupt_callback.callback = InterruptCallback;
    fmt_->interrupt_callback.opaque = &stop_;
  }

  ~FFmpegVideoCapture() override { Stop(); }

  VideoFormat Format() const override { return format_; }

  bool Start(DataCallback callback, std::string* error) override {
    if (thread_.joinable()) {
      if (error) *error = "video capture already started";
      return false;
    }
    callback_ = std::move(callback);
    thread_ = std::thread(&FFmpegVideoCapture::PollLoop, this);
    return true;
  }

  void Stop() override {
    stop_.store(true, std::memory_order_release);
    if (thread_.joinable()) thread_.join();
  }

 private:
  bool Convert(const AVFrame* frame, std::vector<uint8_t>& out) {
    if (!sws_) {
      sws_.reset(sws_getContext(format_.width, format_.height,
                                static_cast<AVPixelFormat>(frame->format), format_.width,
                                format_.height, AV_PIX_FMT_BGRA, SWS_POINT, nullptr, nullptr,
                                nullptr));
      if (!sws_) {
        util::Logger::Error("[Capture] sws_getContext failed");
        return false;
      }
    }
    // Tightly packed: stride == width * 4. The odd last row (if any) is cropped.
    uint8_t* dst_data[4] = {out.data(), nullptr, nullptr, nullptr};
    int dst_linesize[4] = {format_.width * 4, 0, 0, 0};
    sws_scale(sws_.get(), frame->data, frame->linesize, 0, format_.height, dst_data,
              dst_linesize);
    return true;
  }

  void PollLoop() {
    using Clock = std::chrono::steady_clock;
    const auto period = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(1.0 / std::max(1, format_.framerate)));

    PacketPtr pkt(av_packet_alloc());
    FramePtr frame(av_frame_alloc());
    if (!pkt || !frame) {
      util::Logger::Error("[Capture] video frame alloc failed");
      return;
    }
    std::vector<uint8_t> packed(static_cast<size_t>(format_.width) * format_.height * 4);

    const auto started = Clock::now();
    auto next = started;
    uint64_t frames = 0;

    while (!stop_.load(std::memory_order_acquire)) {
      int ret = av_read_frame(fmt_.get(), pkt.get());
      if (ret == AVERROR(EAGAIN)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        continue;
      }
      if (ret < 0) {
        if (!stop_.load(std::memory_order_acquire)) {
          util::Logger::Error("[Capture] screen read failed: " + AvError(ret));
        }
        break;
      }
      if (pkt->stream_index == stream_index_ && avcodec_send_packet(decoder_.get(), pkt.get()) >= 0) {
        while (avcodec_receive_frame(decoder_.get(), frame.get()) >= 0) {
          if (Convert(frame.get(), packed)) {
            callback_(packed.data(), packed.size());
            ++frames;
          }
          av_frame_unref(frame.get());
        }
      }
      av_packet_unref(pkt.get());

      next += period;
      auto now = Clock::now();
      if (next > now) {
        std::this_thread::sleep_until(next);
      } else {
        next = now;
      }
    }

    const double elapsed = std::chrono::duration<double>(Clock::now() - started).count();
    const double fps = elapsed > 0.0 ? static_cast<double>(frames) / elapsed : 0.0;
    util::Logger::Info("[Capture] video stopped frames=" + std::to_string(frames) +
                       " achieved_fps=" + std::to_string(fps) +
                       " target_fps=" + std::to_string(format_.framerate));
  }

  FormatContextPtr fmt_;
  CodecContextPtr decoder_;
  SwsPtr sws_;
  const int stream_index_;
  const VideoFormat format_;
  DataCallback callback_;
  std::atomic<bool> stop_{false};
  std::thread thread_;
};

// Reads until one decoded frame is available. Returns nullptr on failure.
FramePtr GrabOneFrame(AVFormatContext* fmt, AVCodecContext* decoder, int stream_index,
                      std::string* error) {
  PacketPtr pkt(av_packet_alloc());
  FramePtr frame(av_frame_alloc());
  if (!pkt || !frame) {
    if (error) *error = "frame alloc failed";
    return nullptr;
  }
  for (int attempt = 0; attempt < 500; ++attempt) {
    int ret = av_read_frame(fmt, pkt.get());
    if (ret == AVERROR(EAGAIN)) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      continue;
    }
    if (ret < 0) {
      if (error) *error = "screen read failed: " + AvError(ret);
      return nullptr;
    }
    bool got = false;
    if (pkt->stream_index == stream_index && avcodec_send_packet(decoder, pkt.get()) >= 0) {
      got = avcodec_receive_frame(decoder, frame.get()) >= 0;
    }
    av_packet_unref(pkt.get());
    if (got) return frame;
  }
  if (error) *error = "no screen frame decoded";
  return nullptr;
}

}  // namespace

FFmpegCaptureBackend::FFmpegCaptureBackend() { EnsureDevicesRegistered(); }

bool FFmpegCaptureBackend::IsPlatformSupported(std::string* detail) const {
  if (ScreenInputFormat() == nullptr || AudioInputFormat() == nullptr) {
    if (detail) *detail = "Unsupported OS: no screen/microphone capture backend";
    return false;
  }
  return true;
}

std::vector<std::string> FFmpegCaptureBackend::ListAudioInputDevices() {
  for (const char* format_name : {AudioInputFormat(), AudioFallbackInputFormat()}) {
    if (format_name == nullptr) continue;
    std::vector<std::string> names;
    std::string default_name;
    if (QueryAudioDevices(format_name, &names, &default_name)) {
      return OrderInputDevices(names, default_name);
    }
  }
  return {};
}

std::unique_ptr<IAudioCapture> FFmpegCaptureBackend::OpenAudio(const std::string& device_name,
                                                               std::string* error) {
  std::string last_error = "no audio input backend";
  for (const char* format_name : {AudioInputFormat(), AudioFallbackInputFormat()}) {
    if (format_name == nullptr) continue;

    std::vector<std::string> names;
    std::string default_name;
    std::string selected = device_name;
    if (QueryAudioDevices(format_name, &names, &default_name)) {
      selected = SelectInputDevice(names, default_name, device_name);
      if (selected.empty()) {
        selected = "default";
      }
      if (!device_name.empty() && selected != device_name) {
        util::Logger::Warn("[Capture] audio device '" + device_name +
                           "' not found, using default '" + selected + "'");
      }
    }

    FormatContextPtr fmt = OpenDeviceInput(format_name, AudioUrl(selected), 0, &last_error);
    if (!fmt) {
      util::Logger::Warn("[Capture] " + last_error);
      continue;
    }
    int index = av_find_best_stream(fmt.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (index < 0) {
      last_error = std::string(format_name) + " has no audio stream";
      continue;
    }
    const AVCodecParameters* par = fmt->streams[index]->codecpar;
    AudioFormat format;
    format.sample_format = SampleFormatName(par->codec_id);
    format.sample_rate = par->sample_rate;
    format.channels = par->ch_layout.nb_channels;
    format.device_name = selected.empty() ? "default" : selected;
    if (format.sample_format.empty() || format.sample_rate <= 0 || format.channels <= 0) {
      last_error = std::string(format_name) + " delivers an unsupported sample layout";
      continue;
    }
    util::Logger::Info("[Capture] audio opened backend=" + std::string(format_name) +
                       " device=" + format.device_name + " fmt=" + format.sample_format +
                       " rate=" + std::to_string(format.sample_rate) +
                       " channels=" + std::to_string(format.channels));
    return std::make_unique<FFmpegAudioCapture>(std::move(fmt), index, std::move(format));
  }
  if (error) *error = "no usable audio input device: " + last_error;
  return nullptr;
}

std::unique_ptr<IVideoCapture> FFmpegCaptureBackend::OpenVideo(const std::string& screen_index,
                                                               int framerate,
                                                               std::string* error) {
  const char* format_name = ScreenInputFormat();
  if (format_name == nullptr) {
    if (error) *error = "Unsupported OS";
    return nullptr;
  }
  FormatContextPtr fmt = OpenDeviceInput(format_name, ScreenUrl(screen_index), framerate, error);
  if (!fmt) return nullptr;

  int index = -1;
  CodecContextPtr decoder = OpenVideoDecoder(fmt.get(), &index, error);
  if (!decoder) return nullptr;

  VideoFormat format;
  format.width = decoder->width;
  format.height = decoder->height & ~1;
  format.framerate = framerate > 0 ? framerate : 30;
  if (format.width <= 0 || format.height <= 0) {
    if (error) *error = "screen reports no usable size";
    return nullptr;
  }
  util::Logger::Info("[Capture] screen opened backend=" + std::string(format_name) +
                     " url=" + ScreenUrl(screen_index) + " size=" +
                     std::to_string(format.width) + "x" + std::to_string(format.height) +
                     " fps=" + std::to_string(format.framerate));
  return std::make_unique<FFmpegVideoCapture>(std::move(fmt), std::move(decoder), index,
                                              std::move(format));
}

bool FFmpegCaptureBackend::CaptureScreenshot(const std::string& screen_index,
                                             const std::string& output_path,
                                             std::string* error) {
  const char* format_name = ScreenInputFormat();
  if (format_name == nullptr) {
    if (error) *error = "Unsupported OS";
    return false;
  }
  FormatContextPtr fmt = OpenDeviceInput(format_name, ScreenUrl(screen_index), 0, error);
  if (!fmt) return false;
  int index = -1;
  CodecContextPtr decoder = OpenVideoDecoder(fmt.get(), &index, error);
  if (!decoder) return false;

  FramePtr src = GrabOneFrame(fmt.get(), decoder.get(), index, error);
  if (!src) return false;

  const AVCodec* jpeg = avcodec_find_encoder(AV_CODEC_ID_MJPEG);
  if (jpeg == nullptr) {
    if (error) *error = "MJPEG encoder not available";
    return false;
  }
  CodecContextPtr enc(avcodec_alloc_context3(jpeg));
  if (!enc) {
    if (error) *error = "MJPEG context alloc failed";
    return false;
  }
  enc->width = src->width;
  enc->height = src->height & ~1;
  enc->pix_fmt = AV_PIX_FMT_YUVJ420P;
  enc->time_base = AVRational{1, 25};
  int ret = avcodec_open2(enc.get(), jpeg, nullptr);
  if (ret < 0) {
    if (error) *error = "MJPEG open failed: " + AvError(ret);
    return false;
  }

  FramePtr dst(av_frame_alloc());
  if (!dst) {
    if (error) *error = "frame alloc failed";
    return false;
  }
  dst->format = enc->pix_fmt;
  dst->width = enc->width;
  dst->height = enc->height;
  ret = av_frame_get_buffer(dst.get(), 0);
  if (ret < 0) {
    if (error) *error = "frame buffer alloc failed: " + AvError(ret);
    return false;
  }
  SwsPtr sws(sws_getContext(src->width, enc->height, static_cast<AVPixelFormat>(src->format),
                            enc->width, enc->height, enc->pix_fmt, SWS_BILINEAR, nullptr,
                            nullptr, nullptr));
  if (!sws) {
    if (error) *error = "sws_getContext failed";
    return false;
  }
  sws_scale(sws.get(), src->data, src->linesize, 0, enc->height, dst->data, dst->linesize);
  dst->pts = 0;

  PacketPtr pkt(av_packet_alloc());
  if (!pkt) {
    if (error) *error = "packet alloc failed";
    return false;
  }
  ret = avcodec_send_frame(enc.get(), dst.get());
  if (ret >= 0) ret = avcodec_send_frame(enc.get(), nullptr);
  if (ret >= 0) ret = avcodec_receive_packet(enc.get(), pkt.get());
  if (ret < 0) {
    if (error) *error = "JPEG encode failed: " + AvError(ret);
    return false;
  }

  std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char*>(pkt->data), pkt->size);
  if (!out) {
    if (error) *error = "write " + output_path + " failed";
    return false;
  }
  return true;
}

}  // namespace segcast::capture
