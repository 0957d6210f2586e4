// Repository: Segcast-recorder
// Component: Recorder CLI
// Purpose: Command-line front end: record until SIGINT/SIGTERM, or list audio input devices.
// Copyright (c) 2025 Segcast
//
// Usage:
//   segcast_record --data-dir DIR --user-id U --video-id V [options]
//   segcast_record --list-audio-devices

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

#include "segcast/capture/FFmpegCaptureBackend.hpp"
#include "segcast/encoder/EncoderProcess.hpp"
#include "segcast/session/RecordingCoordinator.hpp"
#include "segcast/session/RecordingOptions.hpp"
#include "segcast/upload/GrpcChunkUploader.hpp"
#include "segcast/util/Logger.hpp"

namespace {

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  segcast::RecordingOptions options;
  std::string data_dir;
  std::string upload_target;
  std::string encoder_binary;
  bool list_audio_devices = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Recording:\n"
            << "  --data-dir DIR         Session directory (chunks/, screen-capture.jpg)\n"
            << "  --user-id ID           Owner of the recording\n"
            << "  --video-id ID          Recording identifier\n"
            << "  --bucket NAME          Storage bucket\n"
            << "  --region NAME          Storage region\n"
            << "  --audio-device NAME    Microphone (default device if absent/unknown)\n"
            << "  --screen INDEX         Screen / X display (e.g. :0.0)\n"
            << "  --framerate N          Capture frame rate (default: 30)\n"
            << "  --resolution WxH       Output scale (default: native)\n"
            << "\n"
            << "Services:\n"
            << "  --upload-target H:P    Chunk ingest gRPC endpoint (default: localhost:50061)\n"
            << "  --encoder PATH         Encoder binary (default: $SEGCAST_FFMPEG_PATH or ffmpeg)\n"
            << "\n"
            << "Other:\n"
            << "  --list-audio-devices   Print input devices, default first, and exit\n"
            << "  --help                 Show this help message\n"
            << "\n"
            << "Environment: SEGCAST_DATA_DIR, SEGCAST_UPLOAD_TARGET, SEGCAST_FFMPEG_PATH,\n"
            << "             SEGCAST_DEBUG (encoder stderr and per-pass detail)\n";
}

bool ParseInt(const std::string& text, int* out) {
  try {
    size_t used = 0;
    int value = std::stoi(text, &used);
    if (used != text.size()) return false;
    *out = value;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--list-audio-devices") {
      args.list_audio_devices = true;
    } else if (arg == "--data-dir" && i + 1 < argc) {
      args.data_dir = argv[++i];
    } else if (arg == "--user-id" && i + 1 < argc) {
      args.options.user_id = argv[++i];
    } else if (arg == "--video-id" && i + 1 < argc) {
      args.options.video_id = argv[++i];
    } else if (arg == "--bucket" && i + 1 < argc) {
      args.options.bucket = argv[++i];
    } else if (arg == "--region" && i + 1 < argc) {
      args.options.region = argv[++i];
    } else if (arg == "--audio-device" && i + 1 < argc) {
      args.options.audio_name = argv[++i];
    } else if (arg == "--screen" && i + 1 < argc) {
      args.options.screen_index = argv[++i];
    } else if (arg == "--framerate" && i + 1 < argc) {
      if (!ParseInt(argv[++i], &args.options.framerate) || args.options.framerate <= 0) {
        args.error = "--framerate requires a positive integer";
        return args;
      }
    } else if (arg == "--resolution" && i + 1 < argc) {
      args.options.resolution = argv[++i];
      if (!segcast::ParseResolution(args.options.resolution, nullptr, nullptr)) {
        args.error = "--resolution must look like 1280x720";
        return args;
      }
    } else if (arg == "--upload-target" && i + 1 < argc) {
      args.upload_target = argv[++i];
    } else if (arg == "--encoder" && i + 1 < argc) {
      args.encoder_binary = argv[++i];
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (!args.list_audio_devices && args.options.video_id.empty()) {
    args.error = "--video-id is required to record";
    return args;
  }

  args.valid = true;
  return args;
}

int ListAudioDevices() {
  segcast::capture::FFmpegCaptureBackend backend;
  auto devices = backend.ListAudioInputDevices();
  if (devices.empty()) {
    std::cerr << "No audio input devices found\n";
    return 1;
  }
  for (size_t i = 0; i < devices.size(); ++i) {
    std::cout << devices[i] << (i == 0 ? "  (default)" : "") << "\n";
  }
  return 0;
}

int Record(const CliArgs& args) {
  segcast::RecorderConfig config = segcast::RecorderConfig::FromEnvironment();
  if (!args.data_dir.empty()) config.data_dir = args.data_dir;
  if (!args.upload_target.empty()) config.upload_target = args.upload_target;
  if (!args.encoder_binary.empty()) config.encoder_binary = args.encoder_binary;

  segcast::capture::FFmpegCaptureBackend backend;
  segcast::encoder::PosixEncoderLauncher launcher;
  segcast::upload::GrpcChunkUploader uploader(config.upload_target, config.upload_timeout,
                                              config.upload_chunk_bytes);
  segcast::RecordingCoordinator coordinator(config, backend, launcher, uploader);

  segcast::SessionResult started = coordinator.Start(args.options);
  if (!started.success) {
    segcast::util::Logger::Error(std::string("[RecorderMain] start failed: ") +
                                 segcast::ErrorCodeName(started.code) + ": " + started.message);
    return 2;
  }
  segcast::util::Logger::Info("[RecorderMain] recording; press Ctrl-C to stop");

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  segcast::util::Logger::Info("[RecorderMain] termination requested, stopping");
  segcast::SessionResult stopped = coordinator.Stop();
  if (!stopped.success) {
    segcast::util::Logger::Error(std::string("[RecorderMain] stop finished with ") +
                                 segcast::ErrorCodeName(stopped.code) + ": " + stopped.message);
    return 3;
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  if (args.list_audio_devices) {
    return ListAudioDevices();
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  return Record(args);
}
