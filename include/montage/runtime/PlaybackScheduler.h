// Repository: Montage-preview
// Component: Playback Scheduler
// Purpose: Loops an ordered list of image and video segments back-to-back
//          on two player slots, then hands the list over to export.
// Copyright (c) 2025 Montage

#ifndef MONTAGE_RUNTIME_PLAYBACK_SCHEDULER_H_
#define MONTAGE_RUNTIME_PLAYBACK_SCHEDULER_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "montage/config/PreviewConfig.h"
#include "montage/exporting/ExportTrigger.h"
#include "montage/model/Segment.h"
#include "montage/runtime/DualPlayerPool.h"
#include "montage/runtime/IExecutor.h"
#include "montage/runtime/SlotId.h"

namespace montage::player {
  class IMediaPlayer;
}

namespace montage::runtime {

class IPreviewSurface;

enum class SchedulerError {
  kNone = 0,
  kInvalidSegments,
  kInvalidConfig,
  kPlayerUnavailable,
  kExportInFlight,
  kDisposed,
};

const char* SchedulerErrorToString(SchedulerError error);

struct SchedulerResult {
  bool success;
  SchedulerError error;
  std::string message;

  static SchedulerResult Ok() { return {true, SchedulerError::kNone, ""}; }
  static SchedulerResult Fail(SchedulerError err, const std::string& msg) {
    return {false, err, msg};
  }
};

// PlaybackScheduler is the preview loop.
//
//   Stopped ──Start──► PlayingVideo(slot, i) | PlayingImage(i)
//   Playing* ──segment finished──► Playing* at (i + 1) mod N
//   any ──Stop/Dismiss──► Stopped
//   any ──Confirm──► Exporting
//
// Entering a segment immediately preloads segment (i + 1) mod N into the
// standby slot when it is a video.  Advancing to a video reuses whichever
// slot already holds its reference, so a preloaded clip is never loaded twice.
// Images are shown for config.stop_motion_frame_interval_ms on a one-shot
// owner-executor timer.
//
// The loop has no end; it runs until Stop(), Confirm(), Dismiss() or Dispose().
//
// Invariant while running: a timer is pending iff the current segment is an
// image.  Otherwise the active slot is playing, except after a clip failed to
// load (logged; the loop then waits for the stall watchdog, if enabled).
//
// Threading: every method must be called on the owner executor.  Player
// end-of-item events and merge completions are re-posted there.
class PlaybackScheduler {
 public:
  enum class State {
    kStopped = 0,
    kPlayingVideo = 1,
    kPlayingImage = 2,
    kExporting = 3,
  };

  // Builds the player behind one slot.  Called twice per Start().
  using PlayerFactory = std::function<std::unique_ptr<player::IMediaPlayer>(SlotId slot)>;

  // `segments` is borrowed and must outlive the scheduler.  `delegate` and
  // `surface` may be null.
  PlaybackScheduler(const model::SegmentList& segments,
                    const config::PreviewConfig& config,
                    IExecutor& owner,
                    PlayerFactory player_factory,
                    exporting::IAssetMergeService& merge_service,
                    exporting::IExportDelegate* delegate,
                    IPreviewSurface* surface = nullptr);
  ~PlaybackScheduler();

  PlaybackScheduler(const PlaybackScheduler&) = delete;
  PlaybackScheduler& operator=(const PlaybackScheduler&) = delete;

  // Validates the list, builds a fresh pool and starts at index 0.
  // Restarts from index 0 if already running.
  SchedulerResult Start();

  // Completion of the current segment.  Ignored unless playing.
  void OnSegmentFinished();

  // Cancels the image timer and pauses the active player.  Idempotent.
  void Stop();

  // Stops and hands the list to the export trigger.  Ignored while an export
  // is in flight.
  void Confirm();

  // Stops, abandons any export and reports OnDismissed().
  void Dismiss();

  // Stops and tears both players down.  Idempotent; called by the destructor.
  void Dispose();

  // Retry / cancel path after a merge failure.
  exporting::ExportTrigger& export_trigger() { return export_trigger_; }

  State state() const { return state_; }
  bool running() const { return running_; }
  std::size_t current_index() const { return current_index_; }
  SlotId active_slot() const;
  bool has_pending_timer() const { return image_timer_.has_value(); }

  // Null before Start() and after Dispose().
  const DualPlayerPool* pool() const { return pool_.get(); }

 private:
  void EnterSegment(std::size_t index, bool advancing);
  void EnterImage(std::size_t index);
  void EnterVideo(std::size_t index, bool advancing);
  void PreloadNext(std::size_t index);

  void ArmImageTimer();
  void CancelImageTimer();
  void ArmStallWatchdog();
  void CancelStallWatchdog();

  void OnImageTimerFired(uint64_t generation);
  void OnStallWatchdogFired(uint64_t generation);
  void OnReachedEnd(SlotId slot);

  const model::SegmentList& segments_;
  config::PreviewConfig config_;
  IExecutor& owner_;
  PlayerFactory player_factory_;
  exporting::IExportDelegate* delegate_;
  IPreviewSurface* surface_;
  exporting::ExportTrigger export_trigger_;

  std::unique_ptr<DualPlayerPool> pool_;

  State state_ = State::kStopped;
  bool running_ = false;
  bool disposed_ = false;
  std::size_t current_index_ = 0;
  std::optional<IExecutor::TimerId> image_timer_;
  std::optional<IExecutor::TimerId> stall_watchdog_;

  // Bumped on every segment entry and on Stop(); timer callbacks carrying an
  // older value are stale.
  uint64_t generation_ = 0;

  std::shared_ptr<bool> alive_;
};

const char* SchedulerStateName(PlaybackScheduler::State state);

}  // namespace montage::runtime

#endif  // MONTAGE_RUNTIME_PLAYBACK_SCHEDULER_H_
