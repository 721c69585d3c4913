// Repository: Montage-preview
// Component: FFmpeg Concat Merge Service
// Purpose: IAssetMergeService that remuxes the segment clips into one MP4 by
//          stream copy on a persistent worker thread.
// Copyright (c) 2025 Montage

#ifndef MONTAGE_EXPORTING_FFMPEG_CONCAT_MERGE_SERVICE_H_
#define MONTAGE_EXPORTING_FFMPEG_CONCAT_MERGE_SERVICE_H_

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "montage/exporting/IAssetMergeService.h"
#include "montage/model/Segment.h"

namespace montage::exporting {

// FFmpegConcatMergeService concatenates the clip behind every segment:
// a video segment's own clip, or an image segment's video representation.
// Packets are copied, not re-encoded, so every clip must share the codec of
// the first one.  An image without a video representation, an unreadable clip
// or a codec mismatch fails the merge (completion receives std::nullopt).
//
// Requests are processed one at a time in submission order; overlapping
// Merge() calls are queued.  Completions run on the worker thread.
class FFmpegConcatMergeService : public IAssetMergeService {
 public:
  explicit FFmpegConcatMergeService(std::string export_directory);
  ~FFmpegConcatMergeService() override;

  FFmpegConcatMergeService(const FFmpegConcatMergeService&) = delete;
  FFmpegConcatMergeService& operator=(const FFmpegConcatMergeService&) = delete;

  void Merge(const model::SegmentList& segments, MergeCompletion completion) override;

  // Synchronous remux into output_path.  Returns output_path on success.
  static std::optional<std::string> MergeToFile(const model::SegmentList& segments,
                                                const std::string& output_path);

  // Number of requests queued or running.
  std::size_t PendingCount() const;

 private:
  struct Request {
    uint64_t id;
    model::SegmentList segments;
    MergeCompletion completion;
  };

  void WorkerLoop();
  std::string OutputPathFor(uint64_t request_id) const;

  std::string export_directory_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::deque<Request> queue_;
  uint64_t next_request_id_ = 1;
  bool worker_active_ = false;  // Guarded by mutex_
  bool shutdown_ = false;       // Guarded by mutex_
  std::thread worker_thread_;
};

}  // namespace montage::exporting

#endif  // MONTAGE_EXPORTING_FFMPEG_CONCAT_MERGE_SERVICE_H_
