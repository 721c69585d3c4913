// Repository: Montage-preview
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the scheduler, the player
//          decode threads and the merge worker.
// Copyright (c) 2025 Montage

#ifndef MONTAGE_UTIL_LOGGER_HPP_
#define MONTAGE_UTIL_LOGGER_HPP_

#include <functional>
#include <iosfwd>
#include <mutex>
#include <string>

namespace montage::util {

// Logger writes whole lines under one static mutex, so output from the owner
// loop, player decode threads and the merge worker never interleaves.
//
// Info  → stdout
// Debug → stdout, only when MONTAGE_DEBUG is set to anything but "0"
// Warn  → stderr (stalls, merge failures, ignored configuration)
// Error → stderr (load failures, rejected segment lists, FFmpeg errors)
//
// Lines carry their component tag, e.g. "[PlaybackScheduler] Stopped".
//
// Test-only: a sink per level receives each Info/Warn/Error line before it is
// written.  Sinks are called with the logger mutex held and must not log.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static bool DebugEnabled();

  // Test-only. Call with nullptr to clear.
  static void SetInfoSink(Sink sink);
  static void SetWarnSink(Sink sink);
  static void SetErrorSink(Sink sink);

 private:
  static void Emit(std::ostream& stream, const Sink& sink, const std::string& line);

  static std::mutex mutex_;
  static Sink info_sink_;
  static Sink warn_sink_;
  static Sink error_sink_;
};

}  // namespace montage::util

#endif  // MONTAGE_UTIL_LOGGER_HPP_
