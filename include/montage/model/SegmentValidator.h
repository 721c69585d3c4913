// Repository: Montage-preview
// Component: Segment Validator
// Purpose: Rejects segment lists that cannot be played before the preview
//          loop starts.
// Copyright (c) 2025 Montage

#ifndef MONTAGE_MODEL_SEGMENT_VALIDATOR_H_
#define MONTAGE_MODEL_SEGMENT_VALIDATOR_H_

#include <cstddef>
#include <string>

#include "montage/model/Segment.h"

namespace montage::model {

enum class SegmentError {
  kNone = 0,

  // The list holds no segments; there is nothing to loop over.
  kEmptySegmentList,

  // A segment's playable reference is empty.
  kMissingSegmentReference,
};

const char* SegmentErrorToString(SegmentError error);

// Validation runs once, fail fast on the first bad segment.  Bad segments are
// never skipped at playback time.
class SegmentValidator {
 public:
  struct ValidationResult {
    bool valid;
    SegmentError error;
    // Index of the offending segment (0 for kEmptySegmentList).
    std::size_t index;
    std::string detail;

    static ValidationResult Success() {
      return {true, SegmentError::kNone, 0, ""};
    }

    static ValidationResult Failure(SegmentError err, std::size_t index,
                                    const std::string& detail = "") {
      return {false, err, index, detail};
    }
  };

  static ValidationResult Validate(const SegmentList& segments);
};

}  // namespace montage::model

#endif  // MONTAGE_MODEL_SEGMENT_VALIDATOR_H_
