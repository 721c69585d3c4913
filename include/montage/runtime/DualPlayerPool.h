// Repository: Montage-preview
// Component: Dual Player Pool
// Purpose: Owns exactly two player slots (A and B); one is active (presented),
//          the other is standby (preloading the next clip or idle).
// Copyright (c) 2025 Montage

#ifndef MONTAGE_RUNTIME_DUAL_PLAYER_POOL_H_
#define MONTAGE_RUNTIME_DUAL_PLAYER_POOL_H_

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "montage/runtime/IExecutor.h"
#include "montage/runtime/SlotId.h"

namespace montage::player {
  class IMediaPlayer;
}

namespace montage::runtime {

enum class SlotState {
  kIdle = 0,
  kLoaded = 1,
  kPlaying = 2,
  kPaused = 3,
};

const char* SlotStateName(SlotState state);

// PlayerSlot is one addressable decoder of the pool.
//
// A play cycle runs from Play() to the next Pause(), Load() of another
// reference, or Shutdown().  `play_cycle` is bumped at both ends so an
// end-of-item raised for an old cycle can be recognised and dropped.
struct PlayerSlot {
  SlotId id = SlotId::kA;
  std::unique_ptr<player::IMediaPlayer> player;
  std::optional<std::size_t> loaded_segment_index;
  std::string loaded_ref;
  SlotState state = SlotState::kIdle;
  uint64_t play_cycle = 0;
  bool end_reported = false;

  // Stops and unloads the player, then releases it.
  void reset();
};

// DualPlayerPool abstracts "two interchangeable video decoders".
//
// - Load() of the reference a slot already holds is a no-op.  Keeping a clip
//   primed in the standby slot is what makes the handoff gapless.
// - SetActive() is bookkeeping only; it never touches a decoder.
// - The reached-end handler fires at most once per play cycle per slot and is
//   always invoked on the owner executor.
//
// Threading: every method must be called on the owner executor.
class DualPlayerPool {
 public:
  using ReachedEndFn = std::function<void(SlotId slot)>;

  DualPlayerPool(std::unique_ptr<player::IMediaPlayer> player_a,
                 std::unique_ptr<player::IMediaPlayer> player_b,
                 IExecutor& owner);
  ~DualPlayerPool();

  DualPlayerPool(const DualPlayerPool&) = delete;
  DualPlayerPool& operator=(const DualPlayerPool&) = delete;

  // Loads video_ref into the slot.  Returns true if the slot now holds it.
  bool Load(SlotId slot, const std::string& video_ref,
            std::optional<std::size_t> segment_index = std::nullopt);

  // Begins a play cycle.  Returns false if the slot holds nothing.
  bool Play(SlotId slot);

  // Ends the current play cycle.  No-op unless the slot is playing.
  void Pause(SlotId slot);

  void SeekToStart(SlotId slot);

  bool IsActive(SlotId slot) const { return active_ == slot; }
  SlotId Active() const { return active_; }
  SlotId Standby() const { return OtherSlot(active_); }
  void SetActive(SlotId slot);

  bool HasLoaded(SlotId slot, const std::string& video_ref) const;

  // Slot holding video_ref, standby first.  std::nullopt if neither does.
  std::optional<SlotId> FindSlotWithRef(const std::string& video_ref) const;

  const PlayerSlot& slot(SlotId slot) const { return slots_[SlotIndex(slot)]; }

  void SetReachedEndHandler(ReachedEndFn handler);

  // Stops both players and releases them.  Idempotent; every later call on
  // the pool is a no-op.
  void Shutdown();

  bool IsShutDown() const { return shut_down_; }

 private:
  PlayerSlot& mutable_slot(SlotId slot) { return slots_[SlotIndex(slot)]; }

  // Deregisters the end-of-item handler and invalidates the cycle.
  void EndCycle(PlayerSlot& slot);

  // Runs on the owner executor.
  void OnPlayerEndOfItem(SlotId slot, uint64_t cycle);

  IExecutor& owner_;
  std::array<PlayerSlot, kSlotCount> slots_;
  SlotId active_ = SlotId::kA;
  ReachedEndFn reached_end_handler_;
  bool shut_down_ = false;

  // Tasks re-posted from player threads hold a weak reference; once the pool
  // is destroyed they find it expired and do nothing.
  std::shared_ptr<bool> alive_;
};

}  // namespace montage::runtime

#endif  // MONTAGE_RUNTIME_DUAL_PLAYER_POOL_H_
