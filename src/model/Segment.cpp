// Repository: Montage-preview
// Component: Segment Model
// Purpose: Implementation of Segment.
// Copyright (c) 2025 Montage

#include "montage/model/Segment.h"

#include <utility>

namespace montage::model {

Segment::Segment(SegmentKind kind, std::string ref,
                 std::optional<std::string> video_representation)
    : kind_(kind),
      ref_(std::move(ref)),
      video_representation_(std::move(video_representation)) {}

Segment Segment::Image(std::string image_ref,
                       std::optional<std::string> video_representation) {
  return Segment(SegmentKind::kImage, std::move(image_ref),
                 std::move(video_representation));
}

Segment Segment::Video(std::string video_ref) {
  return Segment(SegmentKind::kVideo, std::move(video_ref), std::nullopt);
}

std::optional<std::string> Segment::image_ref() const {
  if (kind_ != SegmentKind::kImage) return std::nullopt;
  return ref_;
}

std::optional<std::string> Segment::video_ref() const {
  if (kind_ != SegmentKind::kVideo) return std::nullopt;
  return ref_;
}

std::optional<std::string> Segment::ExportableVideoRef() const {
  if (kind_ == SegmentKind::kVideo) return ref_;
  if (video_representation_ && !video_representation_->empty()) {
    return video_representation_;
  }
  return std::nullopt;
}

bool Segment::operator==(const Segment& other) const {
  return kind_ == other.kind_ && ref_ == other.ref_ &&
         video_representation_ == other.video_representation_;
}

}  // namespace montage::model
