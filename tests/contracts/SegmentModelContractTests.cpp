// Repository: Montage-preview
// Component: Segment Model Contract Tests
// Purpose: Verify segment construction, exportable references and list
//          validation.
// Copyright (c) 2025 Montage

#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "montage/model/Segment.h"
#include "montage/model/SegmentValidator.h"

namespace montage::model::testing {
namespace {

// =============================================================================
// A. SEGMENT
// =============================================================================

TEST(SegmentContractTest, ImageExposesOnlyImageReference) {
  const Segment s = Segment::Image("img://a");
  EXPECT_TRUE(s.IsImage());
  EXPECT_FALSE(s.IsVideo());
  EXPECT_EQ(s.kind(), SegmentKind::kImage);
  EXPECT_EQ(s.PlayableRef(), "img://a");
  EXPECT_EQ(s.image_ref(), std::optional<std::string>("img://a"));
  EXPECT_EQ(s.video_ref(), std::nullopt);
  EXPECT_EQ(s.video_representation(), std::nullopt);
}

TEST(SegmentContractTest, VideoExposesOnlyVideoReference) {
  const Segment s = Segment::Video("clip://a");
  EXPECT_TRUE(s.IsVideo());
  EXPECT_EQ(s.PlayableRef(), "clip://a");
  EXPECT_EQ(s.video_ref(), std::optional<std::string>("clip://a"));
  EXPECT_EQ(s.image_ref(), std::nullopt);
}

// -----------------------------------------------------------------------------
// TEST-SEG-003: Exportable clip is the clip itself or the image's rendition
// -----------------------------------------------------------------------------
TEST(SegmentContractTest, ExportableVideoRef) {
  EXPECT_EQ(Segment::Video("clip://a").ExportableVideoRef(),
            std::optional<std::string>("clip://a"));
  EXPECT_EQ(Segment::Image("img://b", "clip://b-rep").ExportableVideoRef(),
            std::optional<std::string>("clip://b-rep"));
  EXPECT_EQ(Segment::Image("img://c").ExportableVideoRef(), std::nullopt);
  EXPECT_EQ(Segment::Image("img://d", std::string()).ExportableVideoRef(), std::nullopt);
}

TEST(SegmentContractTest, EqualityComparesAllFields) {
  EXPECT_EQ(Segment::Image("img://a", "clip://r"), Segment::Image("img://a", "clip://r"));
  EXPECT_NE(Segment::Image("img://a", "clip://r"), Segment::Image("img://a"));
  EXPECT_NE(Segment::Image("x"), Segment::Video("x"));
}

TEST(SegmentContractTest, KindNames) {
  EXPECT_STREQ(SegmentKindName(SegmentKind::kImage), "IMAGE");
  EXPECT_STREQ(SegmentKindName(SegmentKind::kVideo), "VIDEO");
}

// =============================================================================
// B. VALIDATOR
// =============================================================================

TEST(SegmentValidatorContractTest, EmptyListRejected) {
  const auto result = SegmentValidator::Validate({});
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, SegmentError::kEmptySegmentList);
}

// -----------------------------------------------------------------------------
// TEST-SEG-011: First segment with an empty reference is reported by index
// -----------------------------------------------------------------------------
TEST(SegmentValidatorContractTest, MissingReferenceReportedByIndex) {
  const SegmentList list = {Segment::Video("clip://a"), Segment::Image("img://b"),
                            Segment::Video(""), Segment::Image("")};
  const auto result = SegmentValidator::Validate(list);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, SegmentError::kMissingSegmentReference);
  EXPECT_EQ(result.index, 2u);
  EXPECT_FALSE(result.detail.empty());
}

TEST(SegmentValidatorContractTest, MixedListAccepted) {
  const SegmentList list = {Segment::Image("img://a"), Segment::Video("clip://b"),
                            Segment::Image("img://c", "clip://c-rep")};
  const auto result = SegmentValidator::Validate(list);
  EXPECT_TRUE(result.valid);
  EXPECT_EQ(result.error, SegmentError::kNone);
}

TEST(SegmentValidatorContractTest, ErrorNames) {
  EXPECT_STREQ(SegmentErrorToString(SegmentError::kNone), "NONE");
  EXPECT_STREQ(SegmentErrorToString(SegmentError::kEmptySegmentList), "EMPTY_SEGMENT_LIST");
  EXPECT_STREQ(SegmentErrorToString(SegmentError::kMissingSegmentReference),
               "MISSING_SEGMENT_REFERENCE");
}

}  // namespace
}  // namespace montage::model::testing
