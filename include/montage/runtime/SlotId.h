// Repository: Montage-preview
// Component: Slot Identifier
// Purpose: Index of one of the two player slots.
// Copyright (c) 2025 Montage

#ifndef MONTAGE_RUNTIME_SLOT_ID_H_
#define MONTAGE_RUNTIME_SLOT_ID_H_

#include <cstddef>

namespace montage::runtime {

enum class SlotId {
  kA = 0,
  kB = 1,
};

inline constexpr std::size_t kSlotCount = 2;

inline constexpr std::size_t SlotIndex(SlotId slot) {
  return static_cast<std::size_t>(slot);
}

inline constexpr SlotId OtherSlot(SlotId slot) {
  return slot == SlotId::kA ? SlotId::kB : SlotId::kA;
}

inline const char* SlotName(SlotId slot) {
  return slot == SlotId::kA ? "A" : "B";
}

}  // namespace montage::runtime

#endif  // MONTAGE_RUNTIME_SLOT_ID_H_
