// Repository: Toolshed
// Component: Thread-Safe Logger
// Purpose: One mutex per line of output, shared by every thread.
// Copyright (c) 2025 Toolshed

#include "toolshed/util/Logger.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace toolshed::util {

std::mutex Logger::mutex_;
bool Logger::quiet_ = false;
Logger::SinkFn Logger::sink_;

namespace {

bool DebugEnabled() {
  return std::getenv("TOOLSHED_DEBUG") != nullptr;
}

}  // namespace

const char* Logger::LevelName(Level level) {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

void Logger::SetQuiet(bool quiet) {
  std::lock_guard<std::mutex> lock(mutex_);
  quiet_ = quiet;
}

void Logger::SetSink(SinkFn sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = std::move(sink);
}

void Logger::Info(const std::string& line) { Emit(Level::kInfo, line); }
void Logger::Debug(const std::string& line) { Emit(Level::kDebug, line); }
void Logger::Warn(const std::string& line) { Emit(Level::kWarn, line); }
void Logger::Error(const std::string& line) { Emit(Level::kError, line); }

void Logger::Emit(Level level, const std::string& line) {
  const bool debug_enabled = DebugEnabled();
  std::lock_guard<std::mutex> lock(mutex_);
  if (sink_) {
    sink_(level, line);
  }

  switch (level) {
    case Level::kDebug:
      if (quiet_ || !debug_enabled) return;
      std::cout << line << '\n';
      std::cout.flush();
      break;
    case Level::kInfo:
      if (quiet_) return;
      std::cout << line << '\n';
      std::cout.flush();
      break;
    case Level::kWarn:
    case Level::kError:
      std::cerr << line << '\n';
      std::cerr.flush();
      break;
  }
}

}  // namespace toolshed::util
