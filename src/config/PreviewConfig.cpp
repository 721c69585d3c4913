// Repository: Montage-preview
// Component: Preview Configuration
// Purpose: Environment overlay and validation for PreviewConfig.
// Copyright (c) 2025 Montage

#include "montage/config/PreviewConfig.h"

#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <string>

#include "montage/util/Logger.hpp"

namespace montage::config {

using montage::util::Logger;

namespace {

bool ParseInt64(const char* text, int64_t& out) {
  if (text == nullptr || *text == '\0') return false;
  char* end = nullptr;
  errno = 0;
  const long long value = std::strtoll(text, &end, 10);
  if (errno == ERANGE) return false;
  if (end == nullptr || *end != '\0') return false;
  out = static_cast<int64_t>(value);
  return true;
}

bool ParseBool(const char* text, bool& out) {
  if (text == nullptr) return false;
  const std::string value(text);
  if (value == "1" || value == "true" || value == "yes") {
    out = true;
    return true;
  }
  if (value == "0" || value == "false" || value == "no") {
    out = false;
    return true;
  }
  return false;
}

void OverlayInt64(const char* name, int64_t& field) {
  const char* raw = std::getenv(name);
  if (raw == nullptr) return;
  int64_t value = 0;
  if (!ParseInt64(raw, value) || value < 0 || value > kMaxConfigIntervalMs) {
    Logger::Warn(std::string("[PreviewConfig] Ignoring ") + name + "=" + raw +
                 " (expected an integer in [0, " + std::to_string(kMaxConfigIntervalMs) +
                 "])");
    return;
  }
  field = value;
}

}  // namespace

PreviewConfig PreviewConfig::FromEnvironment() {
  PreviewConfig config;

  OverlayInt64("MONTAGE_STOP_MOTION_FRAME_MS", config.stop_motion_frame_interval_ms);
  OverlayInt64("MONTAGE_STALL_WATCHDOG_MS", config.stall_watchdog_ms);

  if (const char* raw = std::getenv("MONTAGE_PHOTO_AS_VIDEO")) {
    if (!ParseBool(raw, config.export_stop_motion_photo_as_video)) {
      Logger::Warn(std::string("[PreviewConfig] Ignoring MONTAGE_PHOTO_AS_VIDEO=") +
                   raw + " (expected 0/1/true/false)");
    }
  }

  if (const char* raw = std::getenv("MONTAGE_EXPORT_DIR")) {
    if (*raw != '\0') config.export_directory = raw;
  }

  return config;
}

bool PreviewConfig::IsValid(std::string* error) const {
  std::ostringstream why;
  if (stop_motion_frame_interval_ms <= 0 ||
      stop_motion_frame_interval_ms > kMaxConfigIntervalMs) {
    why << "stop_motion_frame_interval_ms must be in (0, " << kMaxConfigIntervalMs
        << "] (got " << stop_motion_frame_interval_ms << ")";
  } else if (stall_watchdog_ms < 0 || stall_watchdog_ms > kMaxConfigIntervalMs) {
    why << "stall_watchdog_ms must be in [0, " << kMaxConfigIntervalMs << "] (got "
        << stall_watchdog_ms << ")";
  } else if (output_width < 0 || output_height < 0) {
    why << "output size must be >= 0 (got " << output_width << "x"
        << output_height << ")";
  } else if (export_directory.empty()) {
    why << "export_directory is empty";
  } else {
    return true;
  }

  if (error) *error = why.str();
  return false;
}

}  // namespace montage::config
