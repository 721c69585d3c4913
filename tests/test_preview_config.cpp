// Repository: Montage-preview
// Component: Preview Configuration Tests
// Purpose: Verify defaults, environment overlay and validation.
// Copyright (c) 2025 Montage

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "montage/config/PreviewConfig.h"

namespace montage::config::testing {
namespace {

class PreviewConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearEnv(); }
  void TearDown() override { ClearEnv(); }

  static void ClearEnv() {
    unsetenv("MONTAGE_STOP_MOTION_FRAME_MS");
    unsetenv("MONTAGE_PHOTO_AS_VIDEO");
    unsetenv("MONTAGE_STALL_WATCHDOG_MS");
    unsetenv("MONTAGE_EXPORT_DIR");
  }
};

TEST_F(PreviewConfigTest, DefaultsMatchCaptureInterval) {
  const PreviewConfig config;
  EXPECT_EQ(config.stop_motion_frame_interval_ms, kStopMotionFrameTimeIntervalMs);
  EXPECT_FALSE(config.export_stop_motion_photo_as_video);
  EXPECT_EQ(config.stall_watchdog_ms, 0);
  EXPECT_TRUE(config.IsValid());
}

TEST_F(PreviewConfigTest, EnvironmentOverlaysDefaults) {
  setenv("MONTAGE_STOP_MOTION_FRAME_MS", "250", 1);
  setenv("MONTAGE_PHOTO_AS_VIDEO", "true", 1);
  setenv("MONTAGE_STALL_WATCHDOG_MS", "8000", 1);
  setenv("MONTAGE_EXPORT_DIR", "/var/tmp/montage", 1);

  const PreviewConfig config = PreviewConfig::FromEnvironment();
  EXPECT_EQ(config.stop_motion_frame_interval_ms, 250);
  EXPECT_TRUE(config.export_stop_motion_photo_as_video);
  EXPECT_EQ(config.stall_watchdog_ms, 8000);
  EXPECT_EQ(config.export_directory, "/var/tmp/montage");
}

TEST_F(PreviewConfigTest, MalformedEnvironmentIgnored) {
  setenv("MONTAGE_STOP_MOTION_FRAME_MS", "fast", 1);
  setenv("MONTAGE_PHOTO_AS_VIDEO", "maybe", 1);
  setenv("MONTAGE_STALL_WATCHDOG_MS", "-5", 1);

  const PreviewConfig config = PreviewConfig::FromEnvironment();
  EXPECT_EQ(config.stop_motion_frame_interval_ms, kStopMotionFrameTimeIntervalMs);
  EXPECT_FALSE(config.export_stop_motion_photo_as_video);
  EXPECT_EQ(config.stall_watchdog_ms, 0);
}

TEST_F(PreviewConfigTest, OutOfRangeEnvironmentIgnored) {
  setenv("MONTAGE_STOP_MOTION_FRAME_MS", "99999999999999999999999", 1);
  setenv("MONTAGE_STALL_WATCHDOG_MS", "10000000000000", 1);

  const PreviewConfig config = PreviewConfig::FromEnvironment();
  EXPECT_EQ(config.stop_motion_frame_interval_ms, kStopMotionFrameTimeIntervalMs);
  EXPECT_EQ(config.stall_watchdog_ms, 0);
  EXPECT_TRUE(config.IsValid());
}

TEST_F(PreviewConfigTest, UpperBoundEnforced) {
  PreviewConfig config;
  config.stop_motion_frame_interval_ms = kMaxConfigIntervalMs;
  config.stall_watchdog_ms = kMaxConfigIntervalMs;
  EXPECT_TRUE(config.IsValid());

  std::string error;
  config.stall_watchdog_ms = kMaxConfigIntervalMs + 1;
  EXPECT_FALSE(config.IsValid(&error));
  EXPECT_NE(error.find("stall_watchdog_ms"), std::string::npos);

  config = PreviewConfig();
  config.stop_motion_frame_interval_ms = kMaxConfigIntervalMs + 1;
  EXPECT_FALSE(config.IsValid(&error));
  EXPECT_NE(error.find("stop_motion_frame_interval_ms"), std::string::npos);
}

TEST_F(PreviewConfigTest, ValidationReportsReason) {
  PreviewConfig config;
  std::string error;

  config.stop_motion_frame_interval_ms = 0;
  EXPECT_FALSE(config.IsValid(&error));
  EXPECT_NE(error.find("stop_motion_frame_interval_ms"), std::string::npos);

  config = PreviewConfig();
  config.stall_watchdog_ms = -1;
  EXPECT_FALSE(config.IsValid(&error));
  EXPECT_NE(error.find("stall_watchdog_ms"), std::string::npos);

  config = PreviewConfig();
  config.export_directory.clear();
  EXPECT_FALSE(config.IsValid(&error));
  EXPECT_NE(error.find("export_directory"), std::string::npos);
}

}  // namespace
}  // namespace montage::config::testing
