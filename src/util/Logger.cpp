// Repository: ReelForge
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the engine, service and tools.
// Copyright (c) 2025 ReelForge

#include "reelforge/util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace reelforge::util {

std::mutex Logger::mutex_;
std::function<void(const std::string&)> Logger::warn_sink_;
std::function<void(const std::string&)> Logger::error_sink_;

void Logger::SetWarnSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

bool Logger::DebugEnabled() {
  return std::getenv("REELFORGE_DEBUG") != nullptr;
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (warn_sink_) {
    warn_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
}

}  // namespace reelforge::util
