// Repository: Montage-preview
// Component: Segment Model
// Purpose: Immutable description of one captured unit (still image or clip)
//          played by the preview loop.
// Copyright (c) 2025 Montage

#ifndef MONTAGE_MODEL_SEGMENT_H_
#define MONTAGE_MODEL_SEGMENT_H_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace montage::model {

enum class SegmentKind {
  kImage = 0,
  kVideo = 1,
};

inline const char* SegmentKindName(SegmentKind kind) {
  switch (kind) {
    case SegmentKind::kImage: return "IMAGE";
    case SegmentKind::kVideo: return "VIDEO";
  }
  return "UNKNOWN";
}

// Segment is a value type.  The only way to build one is through Image() or
// Video(), so a segment carrying both a playable image and a playable clip
// cannot be expressed.  An empty reference counts as missing and is rejected
// by SegmentValidator before playback starts.
//
// An image segment may carry a video representation: the stop-motion capture
// path records a short clip of the same photo.  The preview loop never plays
// it; it is only consulted at export time.
class Segment {
 public:
  static Segment Image(std::string image_ref,
                       std::optional<std::string> video_representation = std::nullopt);
  static Segment Video(std::string video_ref);

  SegmentKind kind() const { return kind_; }
  bool IsImage() const { return kind_ == SegmentKind::kImage; }
  bool IsVideo() const { return kind_ == SegmentKind::kVideo; }

  // The reference the preview loop presents: image_ref for images,
  // video_ref for clips.
  const std::string& PlayableRef() const { return ref_; }

  std::optional<std::string> image_ref() const;
  std::optional<std::string> video_ref() const;

  const std::optional<std::string>& video_representation() const {
    return video_representation_;
  }

  // Clip to use when this segment has to become video (merge, photo-as-video
  // export): the clip itself, or an image's video representation.
  std::optional<std::string> ExportableVideoRef() const;

  bool operator==(const Segment& other) const;
  bool operator!=(const Segment& other) const { return !(*this == other); }

 private:
  Segment(SegmentKind kind, std::string ref,
          std::optional<std::string> video_representation);

  SegmentKind kind_;
  std::string ref_;
  std::optional<std::string> video_representation_;
};

using SegmentList = std::vector<Segment>;

}  // namespace montage::model

#endif  // MONTAGE_MODEL_SEGMENT_H_
