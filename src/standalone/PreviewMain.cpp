// Repository: Montage-preview
// Component: Standalone Preview Harness
// Purpose: Runs the preview loop over files on disk, then confirms or
//          dismisses, for diagnostics.
// Copyright (c) 2025 Montage
//
// This binary is for testing and diagnostics only.  It plays the loop with
// FFmpeg-backed players, logs every visited segment instead of drawing, and
// exports through FFmpegConcatMergeService.
//
// EXAMPLE:
//   montage_preview --video a.mp4 --image b.jpg --video-rep b.mp4 --video c.mp4 \
//                   --run-ms 5000 --export-dir /tmp

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "montage/config/PreviewConfig.h"
#include "montage/exporting/FFmpegConcatMergeService.h"
#include "montage/exporting/IExportDelegate.h"
#include "montage/model/Segment.h"
#include "montage/player/FFmpegMediaPlayer.h"
#include "montage/runtime/EventLoop.h"
#include "montage/runtime/IPreviewSurface.h"
#include "montage/runtime/PlaybackScheduler.h"
#include "montage/util/Logger.hpp"

namespace {

using montage::util::Logger;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliSegment {
  bool is_image = false;
  std::string ref;
  std::optional<std::string> video_rep;
};

struct CliArgs {
  std::vector<CliSegment> segments;
  std::optional<int64_t> frame_ms;
  int64_t run_ms = 3000;
  std::optional<std::string> export_dir;
  bool photo_as_video = false;
  uint32_t retries = 1;
  bool dismiss = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Loops captured segments the way the camera preview does, then exports.\n"
            << "\n"
            << "SEGMENTS (order preserved, at least one):\n"
            << "  --image PATH         Still image segment\n"
            << "  --video-rep PATH     Video representation of the preceding --image\n"
            << "  --video PATH         Video segment\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --frame-ms N         Image display time (default: "
            << montage::config::kStopMotionFrameTimeIntervalMs << ")\n"
            << "  --run-ms N           Preview duration before confirming (default: 3000)\n"
            << "  --export-dir DIR     Merge output directory (default: /tmp)\n"
            << "  --photo-as-video     Export a single photo as its video representation\n"
            << "  --retries N          Merge retries before cancelling (default: 1)\n"
            << "  --dismiss            Close instead of confirming\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "ENVIRONMENT:\n"
            << "  MONTAGE_STOP_MOTION_FRAME_MS, MONTAGE_PHOTO_AS_VIDEO,\n"
            << "  MONTAGE_STALL_WATCHDOG_MS, MONTAGE_EXPORT_DIR, MONTAGE_DEBUG\n"
            << "\n";
}

bool ParseInt(const std::string& text, int64_t* out) {
  try {
    std::size_t consumed = 0;
    const long long value = std::stoll(text, &consumed);
    if (consumed != text.size()) return false;
    *out = static_cast<int64_t>(value);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    int64_t number = 0;

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--image" && i + 1 < argc) {
      args.segments.push_back(CliSegment{true, argv[++i], std::nullopt});
    } else if (arg == "--video-rep" && i + 1 < argc) {
      if (args.segments.empty() || !args.segments.back().is_image) {
        args.error = "--video-rep must follow --image";
        return args;
      }
      args.segments.back().video_rep = argv[++i];
    } else if (arg == "--video" && i + 1 < argc) {
      args.segments.push_back(CliSegment{false, argv[++i], std::nullopt});
    } else if (arg == "--frame-ms" && i + 1 < argc) {
      if (!ParseInt(argv[++i], &number)) {
        args.error = "--frame-ms expects an integer";
        return args;
      }
      args.frame_ms = number;
    } else if (arg == "--run-ms" && i + 1 < argc) {
      if (!ParseInt(argv[++i], &number) || number < 0) {
        args.error = "--run-ms expects a non-negative integer";
        return args;
      }
      args.run_ms = number;
    } else if (arg == "--export-dir" && i + 1 < argc) {
      args.export_dir = argv[++i];
    } else if (arg == "--photo-as-video") {
      args.photo_as_video = true;
    } else if (arg == "--retries" && i + 1 < argc) {
      if (!ParseInt(argv[++i], &number) || number < 0) {
        args.error = "--retries expects a non-negative integer";
        return args;
      }
      args.retries = static_cast<uint32_t>(number);
    } else if (arg == "--dismiss") {
      args.dismiss = true;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.segments.empty()) {
    args.error = "At least one --image or --video is required";
    return args;
  }

  args.valid = true;
  return args;
}

montage::model::SegmentList BuildSegments(const std::vector<CliSegment>& cli) {
  montage::model::SegmentList segments;
  segments.reserve(cli.size());
  for (const auto& s : cli) {
    if (s.is_image) {
      segments.push_back(montage::model::Segment::Image(s.ref, s.video_rep));
    } else {
      segments.push_back(montage::model::Segment::Video(s.ref));
    }
  }
  return segments;
}

// Runs fn on the loop thread and waits for it.
template <typename Fn>
auto RunOnLoop(montage::runtime::EventLoop& loop, Fn fn) -> decltype(fn()) {
  using Result = decltype(fn());
  auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
  std::future<Result> done = task->get_future();
  loop.Post([task]() { (*task)(); });
  return done.get();
}

// =============================================================================
// Harness collaborators
// =============================================================================

class LoggingSurface : public montage::runtime::IPreviewSurface {
 public:
  void ShowImage(const std::string& image_ref) override {
    Logger::Info("[HARNESS] Showing image " + image_ref);
  }
  void ShowPlayer(montage::runtime::SlotId slot) override {
    Logger::Info(std::string("[HARNESS] Showing player ") + montage::runtime::SlotName(slot));
  }
};

// Records the outcome and wakes the main thread.
class HarnessDelegate : public montage::exporting::IExportDelegate {
 public:
  void OnVideoExported(const std::optional<std::string>& video_ref) override {
    Finish("video", video_ref);
  }
  void OnImageExported(const std::optional<std::string>& image_ref) override {
    Finish("image", image_ref);
  }
  void OnDismissed() override { Finish("dismissed", std::nullopt); }

  // Returns false on timeout or termination request.
  bool WaitForOutcome(std::chrono::milliseconds poll) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!done_) {
      if (g_termination_requested.load(std::memory_order_acquire)) return false;
      cv_.wait_for(lock, poll);
    }
    return true;
  }

  bool succeeded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return done_ && (kind_ == "dismissed" || ref_.has_value());
  }

 private:
  void Finish(const std::string& kind, const std::optional<std::string>& ref) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      done_ = true;
      kind_ = kind;
      ref_ = ref;
    }
    Logger::Info("[HARNESS] Outcome: " + kind + " " + (ref ? *ref : std::string("<none>")));
    cv_.notify_all();
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool done_ = false;
  std::string kind_;
  std::optional<std::string> ref_;
};

// Answers the retry/cancel prompt: retry up to `retries` times, then cancel.
class RetryPolicy : public montage::exporting::IExportProgressObserver {
 public:
  RetryPolicy(montage::runtime::EventLoop& loop, uint32_t retries)
      : loop_(loop), retries_(retries) {}

  void Attach(montage::runtime::PlaybackScheduler* scheduler) { scheduler_ = scheduler; }

  void OnLoadingChanged(bool visible) override {
    Logger::Info(std::string("[HARNESS] Loading ") + (visible ? "shown" : "hidden"));
  }

  void OnRetryableFailure(uint32_t attempt) override {
    const bool retry = attempt <= retries_;
    Logger::Warn("[HARNESS] Merge attempt " + std::to_string(attempt) + " failed; " +
                 (retry ? "retrying" : "cancelling"));
    montage::runtime::PlaybackScheduler* scheduler = scheduler_;
    loop_.Post([scheduler, retry]() {
      if (!scheduler) return;
      if (retry) {
        scheduler->export_trigger().Retry();
      } else {
        scheduler->export_trigger().Cancel();
      }
    });
  }

 private:
  montage::runtime::EventLoop& loop_;
  uint32_t retries_;
  montage::runtime::PlaybackScheduler* scheduler_ = nullptr;
};

// =============================================================================
// Run
// =============================================================================

int Run(const CliArgs& args) {
  montage::config::PreviewConfig config = montage::config::PreviewConfig::FromEnvironment();
  if (args.frame_ms) config.stop_motion_frame_interval_ms = *args.frame_ms;
  if (args.export_dir) config.export_directory = *args.export_dir;
  if (args.photo_as_video) config.export_stop_motion_photo_as_video = true;

  std::string config_error;
  if (!config.IsValid(&config_error)) {
    std::cerr << "Error: " << config_error << "\n";
    return 1;
  }

  const montage::model::SegmentList segments = BuildSegments(args.segments);

  montage::runtime::EventLoop loop;
  montage::exporting::FFmpegConcatMergeService merge_service(config.export_directory);
  LoggingSurface surface;
  HarnessDelegate delegate;
  RetryPolicy retry_policy(loop, args.retries);

  auto player_factory = [&config](montage::runtime::SlotId) {
    return std::make_unique<montage::player::FFmpegMediaPlayer>(config.output_width,
                                                                config.output_height);
  };

  std::unique_ptr<montage::runtime::PlaybackScheduler> scheduler;
  const montage::runtime::SchedulerResult started = RunOnLoop(loop, [&]() {
    scheduler = std::make_unique<montage::runtime::PlaybackScheduler>(
        segments, config, loop, player_factory, merge_service, &delegate, &surface);
    scheduler->export_trigger().SetProgressObserver(&retry_policy);
    retry_policy.Attach(scheduler.get());
    return scheduler->Start();
  });

  if (!started.success) {
    std::cerr << "Error: " << montage::runtime::SchedulerErrorToString(started.error) << ": "
              << started.message << "\n";
    RunOnLoop(loop, [&]() {
      scheduler.reset();
      return 0;
    });
    return 1;
  }

  // Let the loop run.
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(args.run_ms);
  while (std::chrono::steady_clock::now() < deadline &&
         !g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  bool completed = false;
  if (!g_termination_requested.load(std::memory_order_acquire)) {
    RunOnLoop(loop, [&]() {
      if (args.dismiss) {
        scheduler->Dismiss();
      } else {
        scheduler->Confirm();
      }
      return 0;
    });
    completed = delegate.WaitForOutcome(std::chrono::milliseconds(50));
  } else {
    Logger::Info("[HARNESS] Termination requested");
  }

  RunOnLoop(loop, [&]() {
    retry_policy.Attach(nullptr);
    scheduler.reset();
    return 0;
  });
  loop.Shutdown();

  return completed && delegate.succeeded() ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  return Run(args);
}
