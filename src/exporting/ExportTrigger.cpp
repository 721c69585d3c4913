// Repository: Montage-preview
// Component: Export Trigger
// Purpose: Implementation of ExportTrigger.
// Copyright (c) 2025 Montage

#include "montage/exporting/ExportTrigger.h"

#include <utility>

#include "montage/util/Logger.hpp"

namespace montage::exporting {

using montage::util::Logger;

const char* ExportPhaseName(ExportTrigger::Phase phase) {
  switch (phase) {
    case ExportTrigger::Phase::kIdle: return "IDLE";
    case ExportTrigger::Phase::kMerging: return "MERGING";
    case ExportTrigger::Phase::kAwaitingDecision: return "AWAITING_DECISION";
    case ExportTrigger::Phase::kDelivered: return "DELIVERED";
  }
  return "UNKNOWN";
}

ExportTrigger::ExportTrigger(runtime::IExecutor& owner,
                             IAssetMergeService& merge_service,
                             IExportDelegate* delegate,
                             bool export_photo_as_video)
    : owner_(owner),
      merge_service_(merge_service),
      delegate_(delegate),
      export_photo_as_video_(export_photo_as_video),
      alive_(std::make_shared<bool>(true)) {}

ExportTrigger::~ExportTrigger() {
  alive_.reset();
}

bool ExportTrigger::Confirm(const model::SegmentList& segments) {
  if (IsBusy()) {
    Logger::Debug(std::string("[ExportTrigger] Confirm ignored: phase=") +
                  ExportPhaseName(phase_));
    return false;
  }
  if (segments.empty()) {
    Logger::Warn("[ExportTrigger] Confirm ignored: no segments");
    return false;
  }

  segments_ = segments;
  merge_attempts_ = 0;
  SetLoading(true);

  if (segments_.size() == 1 && segments_.front().IsImage()) {
    const model::Segment& photo = segments_.front();
    phase_ = Phase::kDelivered;
    const std::optional<std::string> video = photo.ExportableVideoRef();
    if (export_photo_as_video_ && video) {
      Logger::Info("[ExportTrigger] Single photo exported as video: " + *video);
      if (delegate_) delegate_->OnVideoExported(video);
    } else {
      Logger::Info("[ExportTrigger] Single photo exported: " + photo.PlayableRef());
      if (delegate_) delegate_->OnImageExported(photo.image_ref());
    }
    SetLoading(false);
    return true;
  }

  StartMerge();
  return true;
}

bool ExportTrigger::Retry() {
  if (phase_ != Phase::kAwaitingDecision) {
    Logger::Debug(std::string("[ExportTrigger] Retry ignored: phase=") +
                  ExportPhaseName(phase_));
    return false;
  }
  Logger::Info("[ExportTrigger] Retrying merge (attempt " +
               std::to_string(merge_attempts_ + 1) + ")");
  StartMerge();
  return true;
}

bool ExportTrigger::Cancel() {
  if (phase_ != Phase::kAwaitingDecision) {
    Logger::Debug(std::string("[ExportTrigger] Cancel ignored: phase=") +
                  ExportPhaseName(phase_));
    return false;
  }
  Logger::Info("[ExportTrigger] Export cancelled after " +
               std::to_string(merge_attempts_) + " failed attempt(s)");
  phase_ = Phase::kDelivered;
  SetLoading(false);
  if (delegate_) delegate_->OnVideoExported(std::nullopt);
  return true;
}

void ExportTrigger::Abandon() {
  ++attempt_id_;
  if (IsBusy()) {
    Logger::Info(std::string("[ExportTrigger] Abandoned export in phase ") +
                 ExportPhaseName(phase_));
    phase_ = Phase::kIdle;
  }
  SetLoading(false);
}

void ExportTrigger::StartMerge() {
  phase_ = Phase::kMerging;
  ++merge_attempts_;
  const uint64_t attempt_id = ++attempt_id_;

  Logger::Info("[ExportTrigger] Merging " + std::to_string(segments_.size()) +
               " segments (attempt " + std::to_string(merge_attempts_) + ")");

  std::weak_ptr<bool> alive = alive_;
  runtime::IExecutor* owner = &owner_;
  merge_service_.Merge(
      segments_,
      [this, owner, alive, attempt_id](std::optional<std::string> merged_ref) {
        owner->Post([this, alive, attempt_id, merged_ref = std::move(merged_ref)]() mutable {
          if (alive.expired()) return;
          OnMergeCompleted(attempt_id, std::move(merged_ref));
        });
      });
}

void ExportTrigger::OnMergeCompleted(uint64_t attempt_id,
                                     std::optional<std::string> merged_ref) {
  if (attempt_id != attempt_id_ || phase_ != Phase::kMerging) {
    Logger::Debug("[ExportTrigger] Dropped stale merge completion");
    return;
  }

  if (merged_ref && !merged_ref->empty()) {
    Logger::Info("[ExportTrigger] Merge complete: " + *merged_ref);
    phase_ = Phase::kDelivered;
    SetLoading(false);
    if (delegate_) delegate_->OnVideoExported(merged_ref);
    return;
  }

  Logger::Warn("[ExportTrigger] MERGE_FAILED attempt=" + std::to_string(merge_attempts_) +
               " awaiting retry/cancel");
  phase_ = Phase::kAwaitingDecision;
  if (observer_) observer_->OnRetryableFailure(merge_attempts_);
}

void ExportTrigger::SetLoading(bool visible) {
  if (loading_ == visible) return;
  loading_ = visible;
  if (observer_) observer_->OnLoadingChanged(visible);
}

}  // namespace montage::exporting
