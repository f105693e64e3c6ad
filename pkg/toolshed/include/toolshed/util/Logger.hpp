// Repository: Toolshed
// Component: Thread-Safe Logger
// Purpose: One mutex per line of output, shared by every thread.
// Copyright (c) 2025 Toolshed

#ifndef TOOLSHED_UTIL_LOGGER_HPP_
#define TOOLSHED_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace toolshed::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from the interactive thread, the execution worker and
// gRPC handlers never interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when TOOLSHED_DEBUG env is set
// Warn  → stderr (degraded but recoverable conditions)
// Error → stderr (failures the caller could not recover from)
//
// Quiet mode keeps Info and Debug off stdout. The interactive front-end
// uses it so log lines do not interleave with its own output. Warn and
// Error are always written.
class Logger {
 public:
  enum class Level { kDebug, kInfo, kWarn, kError };

  using SinkFn = std::function<void(Level, const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetQuiet(bool quiet);

  // Test-only: receives every emitted line, including those quiet mode or
  // a missing TOOLSHED_DEBUG suppress. Call with nullptr to clear.
  static void SetSink(SinkFn sink);

  static const char* LevelName(Level level);

 private:
  static void Emit(Level level, const std::string& line);

  static std::mutex mutex_;
  static bool quiet_;
  static SinkFn sink_;
};

}  // namespace toolshed::util

#endif  // TOOLSHED_UTIL_LOGGER_HPP_
