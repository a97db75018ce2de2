// Repository: ReelForge
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the engine, service and tools.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_UTIL_LOGGER_HPP_
#define REELFORGE_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace reelforge::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from concurrent RPC handlers never interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when REELFORGE_DEBUG env is set (per-frame scores)
// Warn  → stderr (skipped frames, fallback paths, bounded drift)
// Error → stderr (unreadable sources, store failures)
//
// Test-only: SetWarnSink / SetErrorSink install a callback invoked for every
// Warn() / Error() line (in addition to stderr). Tests use them to assert that
// recoverable failures were reported.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // True when REELFORGE_DEBUG is set; lets callers skip formatting work.
  static bool DebugEnabled();

  // Call with nullptr to clear.
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace reelforge::util

#endif  // REELFORGE_UTIL_LOGGER_HPP_
