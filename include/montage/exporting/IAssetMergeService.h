// Repository: Montage-preview
// Component: Asset Merge Service Interface
// Purpose: Collaborator that combines an ordered segment list into a single
//          exported media reference.
// Copyright (c) 2025 Montage

#ifndef MONTAGE_EXPORTING_IASSET_MERGE_SERVICE_H_
#define MONTAGE_EXPORTING_IASSET_MERGE_SERVICE_H_

#include <functional>
#include <optional>
#include <string>

#include "montage/model/Segment.h"

namespace montage::exporting {

// Merge() is asynchronous.  The completion receives the merged reference, or
// std::nullopt on failure, and may be invoked on any thread.  Implementations
// must tolerate overlapping calls; ExportTrigger never issues them itself.
class IAssetMergeService {
 public:
  using MergeCompletion = std::function<void(std::optional<std::string> merged_ref)>;

  virtual ~IAssetMergeService() = default;

  virtual void Merge(const model::SegmentList& segments, MergeCompletion completion) = 0;
};

}  // namespace montage::exporting

#endif  // MONTAGE_EXPORTING_IASSET_MERGE_SERVICE_H_
