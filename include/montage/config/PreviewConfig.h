// Repository: Montage-preview
// Component: Preview Configuration
// Purpose: Timing and export settings shared by the capture pipeline and the
//          preview loop.
// Copyright (c) 2025 Montage

#ifndef MONTAGE_CONFIG_PREVIEW_CONFIG_H_
#define MONTAGE_CONFIG_PREVIEW_CONFIG_H_

#include <cstdint>
#include <string>

namespace montage::config {

// Per-frame interval of stop-motion capture.  The preview shows each still
// for exactly this long so capture rate and preview rate agree.
inline constexpr int64_t kStopMotionFrameTimeIntervalMs = 500;

// Largest accepted image interval or watchdog timeout (24 h).
inline constexpr int64_t kMaxConfigIntervalMs = 24LL * 60 * 60 * 1000;

struct PreviewConfig {
  // Display duration of an image segment.
  int64_t stop_motion_frame_interval_ms = kStopMotionFrameTimeIntervalMs;

  // Single-photo export hands over the photo's video representation (when
  // it has one) instead of the still.
  bool export_stop_motion_photo_as_video = false;

  // Decoder stall watchdog.  A clip that has not reported end-of-item within
  // this many milliseconds is treated as finished.  0 disables it.
  int64_t stall_watchdog_ms = 0;

  // Where FFmpegConcatMergeService writes merged output.
  std::string export_directory = "/tmp";

  // Output size hint for FFmpegMediaPlayer (0 = native size).
  int output_width = 0;
  int output_height = 0;

  // Defaults overlaid with MONTAGE_STOP_MOTION_FRAME_MS,
  // MONTAGE_PHOTO_AS_VIDEO, MONTAGE_STALL_WATCHDOG_MS and MONTAGE_EXPORT_DIR.
  // Malformed or out-of-range values are ignored with a warning.
  static PreviewConfig FromEnvironment();

  // True if every field is usable.  `error` receives a description otherwise.
  bool IsValid(std::string* error = nullptr) const;
};

}  // namespace montage::config

#endif  // MONTAGE_CONFIG_PREVIEW_CONFIG_H_
