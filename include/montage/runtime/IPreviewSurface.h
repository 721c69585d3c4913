// Repository: Montage-preview
// Component: Preview Surface Interface
// Purpose: Presentation target for the preview loop (still image or one of
//          the two player outputs).
// Copyright (c) 2025 Montage

#ifndef MONTAGE_RUNTIME_IPREVIEW_SURFACE_H_
#define MONTAGE_RUNTIME_IPREVIEW_SURFACE_H_

#include <string>

#include "montage/runtime/SlotId.h"

namespace montage::runtime {

// Called on the owner context only.
class IPreviewSurface {
 public:
  virtual ~IPreviewSurface() = default;

  // Present a still.
  virtual void ShowImage(const std::string& image_ref) = 0;

  // Present the output of a player slot.
  virtual void ShowPlayer(SlotId slot) = 0;
};

}  // namespace montage::runtime

#endif  // MONTAGE_RUNTIME_IPREVIEW_SURFACE_H_
