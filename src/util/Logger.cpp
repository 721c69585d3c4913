// Repository: Montage-preview
// Component: Thread-Safe Logger
// Purpose: Implementation of Logger.
// Copyright (c) 2025 Montage

#include "montage/util/Logger.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace montage::util {

std::mutex Logger::mutex_;
Logger::Sink Logger::info_sink_;
Logger::Sink Logger::warn_sink_;
Logger::Sink Logger::error_sink_;

bool Logger::DebugEnabled() {
  const char* value = std::getenv("MONTAGE_DEBUG");
  return value != nullptr && std::strcmp(value, "0") != 0;
}

void Logger::SetInfoSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::SetWarnSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetErrorSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::Emit(std::ostream& stream, const Sink& sink, const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (sink) sink(line);
  stream << line << '\n';
  stream.flush();
}

void Logger::Info(const std::string& line) { Emit(std::cout, info_sink_, line); }

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  Emit(std::cout, nullptr, line);
}

void Logger::Warn(const std::string& line) { Emit(std::cerr, warn_sink_, line); }

void Logger::Error(const std::string& line) { Emit(std::cerr, error_sink_, line); }

}  // namespace montage::util
