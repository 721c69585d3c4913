// Repository: Montage-preview
// Component: Playback Scheduler
// Purpose: Implementation of PlaybackScheduler.
// Copyright (c) 2025 Montage

#include "montage/runtime/PlaybackScheduler.h"

#include <sstream>
#include <utility>

#include "montage/model/SegmentValidator.h"
#include "montage/player/IMediaPlayer.h"
#include "montage/runtime/IPreviewSurface.h"
#include "montage/util/Logger.hpp"

namespace montage::runtime {

using montage::util::Logger;

const char* SchedulerErrorToString(SchedulerError error) {
  switch (error) {
    case SchedulerError::kNone: return "NONE";
    case SchedulerError::kInvalidSegments: return "INVALID_SEGMENTS";
    case SchedulerError::kInvalidConfig: return "INVALID_CONFIG";
    case SchedulerError::kPlayerUnavailable: return "PLAYER_UNAVAILABLE";
    case SchedulerError::kExportInFlight: return "EXPORT_IN_FLIGHT";
    case SchedulerError::kDisposed: return "DISPOSED";
  }
  return "UNKNOWN_ERROR";
}

const char* SchedulerStateName(PlaybackScheduler::State state) {
  switch (state) {
    case PlaybackScheduler::State::kStopped: return "STOPPED";
    case PlaybackScheduler::State::kPlayingVideo: return "PLAYING_VIDEO";
    case PlaybackScheduler::State::kPlayingImage: return "PLAYING_IMAGE";
    case PlaybackScheduler::State::kExporting: return "EXPORTING";
  }
  return "UNKNOWN";
}

PlaybackScheduler::PlaybackScheduler(const model::SegmentList& segments,
                                     const config::PreviewConfig& config,
                                     IExecutor& owner,
                                     PlayerFactory player_factory,
                                     exporting::IAssetMergeService& merge_service,
                                     exporting::IExportDelegate* delegate,
                                     IPreviewSurface* surface)
    : segments_(segments),
      config_(config),
      owner_(owner),
      player_factory_(std::move(player_factory)),
      delegate_(delegate),
      surface_(surface),
      export_trigger_(owner, merge_service, delegate,
                      config.export_stop_motion_photo_as_video),
      alive_(std::make_shared<bool>(true)) {}

PlaybackScheduler::~PlaybackScheduler() {
  Dispose();
  alive_.reset();
}

SlotId PlaybackScheduler::active_slot() const {
  return pool_ ? pool_->Active() : SlotId::kA;
}

SchedulerResult PlaybackScheduler::Start() {
  if (disposed_) {
    return SchedulerResult::Fail(SchedulerError::kDisposed, "scheduler disposed");
  }

  const auto validation = model::SegmentValidator::Validate(segments_);
  if (!validation.valid) {
    Logger::Error(std::string("[PlaybackScheduler] Rejected segment list: ") +
                  model::SegmentErrorToString(validation.error) + " " + validation.detail);
    return SchedulerResult::Fail(SchedulerError::kInvalidSegments, validation.detail);
  }

  std::string config_error;
  if (!config_.IsValid(&config_error)) {
    Logger::Error("[PlaybackScheduler] Rejected config: " + config_error);
    return SchedulerResult::Fail(SchedulerError::kInvalidConfig, config_error);
  }

  if (export_trigger_.IsBusy()) {
    return SchedulerResult::Fail(SchedulerError::kExportInFlight,
                                 "export in flight");
  }

  Stop();
  if (pool_) {
    pool_->Shutdown();
    pool_.reset();
  }

  std::unique_ptr<player::IMediaPlayer> player_a;
  std::unique_ptr<player::IMediaPlayer> player_b;
  if (player_factory_) {
    player_a = player_factory_(SlotId::kA);
    player_b = player_factory_(SlotId::kB);
  }
  if (!player_a || !player_b) {
    Logger::Error("[PlaybackScheduler] Player factory returned no player");
    return SchedulerResult::Fail(SchedulerError::kPlayerUnavailable,
                                 "player factory returned no player");
  }

  pool_ = std::make_unique<DualPlayerPool>(std::move(player_a), std::move(player_b), owner_);
  pool_->SetReachedEndHandler([this](SlotId slot) { OnReachedEnd(slot); });

  Logger::Info("[PlaybackScheduler] Start: " + std::to_string(segments_.size()) +
               " segments, image interval " +
               std::to_string(config_.stop_motion_frame_interval_ms) + "ms");

  current_index_ = 0;
  running_ = true;
  EnterSegment(0, /*advancing=*/false);
  return SchedulerResult::Ok();
}

void PlaybackScheduler::OnSegmentFinished() {
  if (!running_ ||
      (state_ != State::kPlayingVideo && state_ != State::kPlayingImage)) {
    Logger::Debug(std::string("[PlaybackScheduler] Segment finished ignored: state=") +
                  SchedulerStateName(state_));
    return;
  }

  if (state_ == State::kPlayingVideo) {
    CancelStallWatchdog();
    const SlotId finished = pool_->Active();
    pool_->Pause(finished);
    pool_->SeekToStart(finished);
  } else {
    CancelImageTimer();
  }

  current_index_ = (current_index_ + 1) % segments_.size();
  EnterSegment(current_index_, /*advancing=*/true);
}

void PlaybackScheduler::Stop() {
  CancelImageTimer();
  CancelStallWatchdog();
  ++generation_;

  if (running_ && pool_) {
    pool_->Pause(pool_->Active());
  }
  if (running_) {
    Logger::Info("[PlaybackScheduler] Stopped at segment " + std::to_string(current_index_));
  }
  running_ = false;
  state_ = export_trigger_.IsBusy() ? State::kExporting : State::kStopped;
}

void PlaybackScheduler::Confirm() {
  if (disposed_) return;
  if (export_trigger_.IsBusy()) {
    Logger::Debug("[PlaybackScheduler] Confirm ignored: export in flight");
    return;
  }

  Stop();
  state_ = State::kExporting;
  if (!export_trigger_.Confirm(segments_)) {
    state_ = State::kStopped;
  }
}

void PlaybackScheduler::Dismiss() {
  if (disposed_) return;
  Stop();
  export_trigger_.Abandon();
  Logger::Info("[PlaybackScheduler] Dismissed");
  if (delegate_) delegate_->OnDismissed();
}

void PlaybackScheduler::Dispose() {
  if (disposed_) return;
  Stop();
  export_trigger_.Abandon();
  if (pool_) {
    pool_->Shutdown();
    pool_.reset();
  }
  disposed_ = true;
}

void PlaybackScheduler::EnterSegment(std::size_t index, bool advancing) {
  ++generation_;
  const model::Segment& segment = segments_[index];

  Logger::Debug("[PlaybackScheduler] Enter segment " + std::to_string(index) + " (" +
                model::SegmentKindName(segment.kind()) + ") " + segment.PlayableRef());

  if (segment.IsImage()) {
    EnterImage(index);
  } else {
    EnterVideo(index, advancing);
  }
  PreloadNext(index);
}

void PlaybackScheduler::EnterImage(std::size_t index) {
  state_ = State::kPlayingImage;
  if (surface_) surface_->ShowImage(segments_[index].PlayableRef());
  ArmImageTimer();
}

void PlaybackScheduler::EnterVideo(std::size_t index, bool advancing) {
  const std::string& ref = segments_[index].PlayableRef();

  // Prefer whichever slot already holds the clip; otherwise swap to standby.
  SlotId target = pool_->Active();
  if (advancing) {
    const std::optional<SlotId> holder = pool_->FindSlotWithRef(ref);
    target = holder ? *holder : pool_->Standby();
  }
  pool_->SetActive(target);
  state_ = State::kPlayingVideo;

  if (!pool_->Load(target, ref, index)) {
    Logger::Error("[PlaybackScheduler] Segment " + std::to_string(index) +
                  " could not be loaded: " + ref);
    ArmStallWatchdog();
    return;
  }

  if (surface_) surface_->ShowPlayer(target);

  if (!pool_->Play(target)) {
    Logger::Error("[PlaybackScheduler] Segment " + std::to_string(index) +
                  " could not be played: " + ref);
  }
  ArmStallWatchdog();
}

void PlaybackScheduler::PreloadNext(std::size_t index) {
  const std::size_t next = (index + 1) % segments_.size();
  const model::Segment& segment = segments_[next];
  if (!segment.IsVideo()) return;

  const std::string& ref = segment.PlayableRef();
  const SlotId standby = pool_->Standby();
  if (pool_->HasLoaded(standby, ref)) return;

  // The clip parked at frame zero in the active slot will be reused.
  if (state_ == State::kPlayingImage && pool_->HasLoaded(pool_->Active(), ref)) return;

  if (!pool_->Load(standby, ref, next)) {
    Logger::Warn("[PlaybackScheduler] Preload of segment " + std::to_string(next) +
                 " failed; it will be loaded when reached");
  }
}

void PlaybackScheduler::ArmImageTimer() {
  CancelImageTimer();
  const uint64_t generation = generation_;
  std::weak_ptr<bool> alive = alive_;
  image_timer_ = owner_.PostDelayed(config_.stop_motion_frame_interval_ms,
                                    [this, alive, generation]() {
                                      if (alive.expired()) return;
                                      OnImageTimerFired(generation);
                                    });
}

void PlaybackScheduler::CancelImageTimer() {
  if (!image_timer_) return;
  owner_.Cancel(*image_timer_);
  image_timer_.reset();
}

void PlaybackScheduler::ArmStallWatchdog() {
  CancelStallWatchdog();
  if (config_.stall_watchdog_ms <= 0) return;
  const uint64_t generation = generation_;
  std::weak_ptr<bool> alive = alive_;
  stall_watchdog_ = owner_.PostDelayed(config_.stall_watchdog_ms,
                                       [this, alive, generation]() {
                                         if (alive.expired()) return;
                                         OnStallWatchdogFired(generation);
                                       });
}

void PlaybackScheduler::CancelStallWatchdog() {
  if (!stall_watchdog_) return;
  owner_.Cancel(*stall_watchdog_);
  stall_watchdog_.reset();
}

void PlaybackScheduler::OnImageTimerFired(uint64_t generation) {
  if (generation != generation_ || state_ != State::kPlayingImage) {
    Logger::Debug("[PlaybackScheduler] Dropped stale image timer");
    return;
  }
  image_timer_.reset();
  OnSegmentFinished();
}

void PlaybackScheduler::OnStallWatchdogFired(uint64_t generation) {
  if (generation != generation_ || state_ != State::kPlayingVideo) {
    return;
  }
  stall_watchdog_.reset();
  Logger::Warn("[PlaybackScheduler] DECODER_STALL segment=" + std::to_string(current_index_) +
               " no end-of-item within " + std::to_string(config_.stall_watchdog_ms) +
               "ms; advancing");
  OnSegmentFinished();
}

void PlaybackScheduler::OnReachedEnd(SlotId slot) {
  if (!running_ || state_ != State::kPlayingVideo || !pool_ || !pool_->IsActive(slot)) {
    Logger::Debug(std::string("[PlaybackScheduler] Ignored end-of-item from slot ") +
                  SlotName(slot));
    return;
  }
  OnSegmentFinished();
}

}  // namespace montage::runtime
