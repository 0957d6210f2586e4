// Repository: Segcast-recorder
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by capture, pump, watcher and upload threads.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_UTIL_LOGGER_HPP_
#define SEGCAST_UTIL_LOGGER_HPP_

#include <functional>
#include <string>
#include <utility>

namespace segcast::util {

// Logger provides thread-safe log emission behind one process-wide mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from the capture thread, the stream pumps, the segment
// watchers and the upload workers never interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when SEGCAST_DEBUG env is set (encoder stderr, per-pass detail)
// Warn  → stderr (degraded but recoverable conditions: drops, missing segments)
// Error → stderr (pipe breaks, failed uploads, capture faults)
//
// Test-only: the Set*Sink hooks install a callback invoked for every line of
// that level (in addition to the stream). Call with nullptr to clear.
class Logger {
 public:
  enum class Level { kDebug, kInfo, kWarn, kError };

  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line) { Emit(Level::kInfo, line); }
  static void Debug(const std::string& line);
  static void Warn(const std::string& line) { Emit(Level::kWarn, line); }
  static void Error(const std::string& line) { Emit(Level::kError, line); }

  static bool DebugEnabled();

  static void SetInfoSink(Sink sink) { SetSink(Level::kInfo, std::move(sink)); }
  static void SetWarnSink(Sink sink) { SetSink(Level::kWarn, std::move(sink)); }
  static void SetErrorSink(Sink sink) { SetSink(Level::kError, std::move(sink)); }

 private:
  static void Emit(Level level, const std::string& line);
  static void SetSink(Level level, Sink sink);
};

}  // namespace segcast::util

#endif  // SEGCAST_UTIL_LOGGER_HPP_
