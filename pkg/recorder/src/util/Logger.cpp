// Repository: Segcast-recorder
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by capture, pump, watcher and upload threads.
// Copyright (c) 2025 Segcast

#include "segcast/util/Logger.hpp"

#include <array>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace segcast::util {

namespace {

std::mutex& LogMutex() {
  static std::mutex mutex;
  return mutex;
}

// One optional test sink per level, indexed by Logger::Level.
std::array<Logger::Sink, 4>& Sinks() {
  static std::array<Logger::Sink, 4> sinks;
  return sinks;
}

std::ostream& StreamFor(Logger::Level level) {
  return (level == Logger::Level::kWarn || level == Logger::Level::kError) ? std::cerr
                                                                            : std::cout;
}

}  // namespace

bool Logger::DebugEnabled() {
  static const bool enabled = std::getenv("SEGCAST_DEBUG") != nullptr;
  return enabled;
}

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  Emit(Level::kDebug, line);
}

void Logger::SetSink(Level level, Sink sink) {
  std::lock_guard<std::mutex> lock(LogMutex());
  Sinks()[static_cast<size_t>(level)] = std::move(sink);
}

void Logger::Emit(Level level, const std::string& line) {
  std::lock_guard<std::mutex> lock(LogMutex());
  const Sink& sink = Sinks()[static_cast<size_t>(level)];
  if (sink) {
    sink(line);
  }
  std::ostream& out = StreamFor(level);
  out << line << '\n';
  out.flush();
}

}  // namespace segcast::util
