// Repository: Montage-preview
// Component: Segment Validator
// Purpose: Implementation of SegmentValidator.
// Copyright (c) 2025 Montage

#include "montage/model/SegmentValidator.h"

namespace montage::model {

const char* SegmentErrorToString(SegmentError error) {
  switch (error) {
    case SegmentError::kNone:
      return "NONE";
    case SegmentError::kEmptySegmentList:
      return "EMPTY_SEGMENT_LIST";
    case SegmentError::kMissingSegmentReference:
      return "MISSING_SEGMENT_REFERENCE";
  }
  return "UNKNOWN_ERROR";
}

SegmentValidator::ValidationResult SegmentValidator::Validate(
    const SegmentList& segments) {
  if (segments.empty()) {
    return ValidationResult::Failure(SegmentError::kEmptySegmentList, 0,
                                     "segment list is empty");
  }

  for (std::size_t i = 0; i < segments.size(); ++i) {
    const Segment& segment = segments[i];
    if (segment.PlayableRef().empty()) {
      return ValidationResult::Failure(
          SegmentError::kMissingSegmentReference, i,
          std::string("segment ") + std::to_string(i) + " (" +
              SegmentKindName(segment.kind()) + ") has no reference");
    }
  }

  return ValidationResult::Success();
}

}  // namespace montage::model
