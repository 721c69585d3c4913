// Repository: Montage-preview
// Component: Export Trigger
// Purpose: Confirm / retry / cancel flow around the Asset Merge Service.
// Copyright (c) 2025 Montage

#ifndef MONTAGE_EXPORTING_EXPORT_TRIGGER_H_
#define MONTAGE_EXPORTING_EXPORT_TRIGGER_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "montage/exporting/IAssetMergeService.h"
#include "montage/exporting/IExportDelegate.h"
#include "montage/model/Segment.h"
#include "montage/runtime/IExecutor.h"

namespace montage::exporting {

// ExportTrigger turns a confirmed segment list into exactly one delegate
// result per completed attempt.
//
//   kIdle ──Confirm──► kMerging ──ok──► kDelivered
//                        │  ▲
//                      fail Retry
//                        ▼  │
//                  kAwaitingDecision ──Cancel──► kDelivered (nullopt)
//
// A single-image list never reaches kMerging: the still (or its video
// representation) is delivered directly.
//
// Confirm() is ignored while kMerging or kAwaitingDecision.  Merge
// completions are re-posted to the owner executor; a completion that belongs
// to an abandoned attempt is dropped.
//
// Threading: every method must be called on the owner executor.
class ExportTrigger {
 public:
  enum class Phase {
    kIdle = 0,
    kMerging = 1,
    kAwaitingDecision = 2,
    kDelivered = 3,
  };

  ExportTrigger(runtime::IExecutor& owner,
                IAssetMergeService& merge_service,
                IExportDelegate* delegate,
                bool export_photo_as_video);
  ~ExportTrigger();

  ExportTrigger(const ExportTrigger&) = delete;
  ExportTrigger& operator=(const ExportTrigger&) = delete;

  // Returns false if the call was ignored.
  bool Confirm(const model::SegmentList& segments);

  // Re-invokes the merge service with the list of the failed attempt.
  // Returns false unless a failure is awaiting a decision.
  bool Retry();

  // Delivers OnVideoExported(nullopt).  Returns false unless a failure is
  // awaiting a decision.
  bool Cancel();

  // Drops any in-flight or pending attempt without notifying the delegate.
  void Abandon();

  void SetProgressObserver(IExportProgressObserver* observer) { observer_ = observer; }

  Phase phase() const { return phase_; }
  bool IsBusy() const {
    return phase_ == Phase::kMerging || phase_ == Phase::kAwaitingDecision;
  }
  uint32_t merge_attempts() const { return merge_attempts_; }

 private:
  void StartMerge();
  void OnMergeCompleted(uint64_t attempt_id, std::optional<std::string> merged_ref);
  void SetLoading(bool visible);

  runtime::IExecutor& owner_;
  IAssetMergeService& merge_service_;
  IExportDelegate* delegate_;
  IExportProgressObserver* observer_ = nullptr;
  bool export_photo_as_video_;

  model::SegmentList segments_;
  Phase phase_ = Phase::kIdle;
  uint64_t attempt_id_ = 0;
  uint32_t merge_attempts_ = 0;
  bool loading_ = false;

  std::shared_ptr<bool> alive_;
};

const char* ExportPhaseName(ExportTrigger::Phase phase);

}  // namespace montage::exporting

#endif  // MONTAGE_EXPORTING_EXPORT_TRIGGER_H_
