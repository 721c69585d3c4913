// Repository: Montage-preview
// Component: Dual Player Pool
// Purpose: Implementation of DualPlayerPool.
// Copyright (c) 2025 Montage

#include "montage/runtime/DualPlayerPool.h"

#include <sstream>
#include <utility>

#include "montage/player/IMediaPlayer.h"
#include "montage/util/Logger.hpp"

namespace montage::runtime {

using montage::util::Logger;

const char* SlotStateName(SlotState state) {
  switch (state) {
    case SlotState::kIdle: return "IDLE";
    case SlotState::kLoaded: return "LOADED";
    case SlotState::kPlaying: return "PLAYING";
    case SlotState::kPaused: return "PAUSED";
  }
  return "UNKNOWN";
}

void PlayerSlot::reset() {
  if (player) {
    player->SetEndOfItemHandler(nullptr);
    if (player->IsPlaying()) {
      player->Pause();
    }
    player->Unload();
    player.reset();
  }
  loaded_segment_index.reset();
  loaded_ref.clear();
  state = SlotState::kIdle;
  ++play_cycle;
  end_reported = false;
}

DualPlayerPool::DualPlayerPool(std::unique_ptr<player::IMediaPlayer> player_a,
                               std::unique_ptr<player::IMediaPlayer> player_b,
                               IExecutor& owner)
    : owner_(owner), alive_(std::make_shared<bool>(true)) {
  slots_[SlotIndex(SlotId::kA)].id = SlotId::kA;
  slots_[SlotIndex(SlotId::kA)].player = std::move(player_a);
  slots_[SlotIndex(SlotId::kB)].id = SlotId::kB;
  slots_[SlotIndex(SlotId::kB)].player = std::move(player_b);
}

DualPlayerPool::~DualPlayerPool() {
  Shutdown();
}

bool DualPlayerPool::Load(SlotId slot_id, const std::string& video_ref,
                          std::optional<std::size_t> segment_index) {
  if (shut_down_) return false;
  PlayerSlot& slot = mutable_slot(slot_id);
  if (!slot.player || video_ref.empty()) {
    return false;
  }

  if (slot.state != SlotState::kIdle && slot.loaded_ref == video_ref) {
    if (segment_index) slot.loaded_segment_index = segment_index;
    Logger::Debug("[DualPlayerPool] Load no-op: slot=" + std::string(SlotName(slot_id)) +
                  " already holds " + video_ref);
    return true;
  }

  if (slot.state == SlotState::kPlaying) {
    slot.player->Pause();
    EndCycle(slot);
  }

  if (!slot.player->Load(video_ref)) {
    Logger::Error("[DualPlayerPool] LOAD_FAILED slot=" + std::string(SlotName(slot_id)) +
                  " ref=" + video_ref);
    slot.loaded_ref.clear();
    slot.loaded_segment_index.reset();
    slot.state = SlotState::kIdle;
    return false;
  }

  slot.loaded_ref = video_ref;
  slot.loaded_segment_index = segment_index;
  slot.state = SlotState::kLoaded;

  std::ostringstream oss;
  oss << "[DualPlayerPool] Loaded slot=" << SlotName(slot_id) << " ref=" << video_ref;
  if (segment_index) oss << " segment=" << *segment_index;
  Logger::Debug(oss.str());
  return true;
}

bool DualPlayerPool::Play(SlotId slot_id) {
  if (shut_down_) return false;
  PlayerSlot& slot = mutable_slot(slot_id);
  if (!slot.player || slot.state == SlotState::kIdle) {
    Logger::Warn("[DualPlayerPool] Play on empty slot=" + std::string(SlotName(slot_id)));
    return false;
  }
  if (slot.state == SlotState::kPlaying) {
    return true;
  }

  ++slot.play_cycle;
  slot.end_reported = false;
  const uint64_t cycle = slot.play_cycle;

  // Scoped to this cycle: registered here, cleared in EndCycle().
  std::weak_ptr<bool> alive = alive_;
  IExecutor* owner = &owner_;
  slot.player->SetEndOfItemHandler([this, owner, alive, slot_id, cycle]() {
    owner->Post([this, alive, slot_id, cycle]() {
      if (alive.expired()) return;
      OnPlayerEndOfItem(slot_id, cycle);
    });
  });

  if (!slot.player->Play()) {
    Logger::Error("[DualPlayerPool] PLAY_FAILED slot=" + std::string(SlotName(slot_id)) +
                  " ref=" + slot.loaded_ref);
    EndCycle(slot);
    return false;
  }

  slot.state = SlotState::kPlaying;
  return true;
}

void DualPlayerPool::Pause(SlotId slot_id) {
  if (shut_down_) return;
  PlayerSlot& slot = mutable_slot(slot_id);
  if (slot.state != SlotState::kPlaying) return;

  slot.player->Pause();
  EndCycle(slot);
  slot.state = SlotState::kPaused;
}

void DualPlayerPool::SeekToStart(SlotId slot_id) {
  if (shut_down_) return;
  PlayerSlot& slot = mutable_slot(slot_id);
  if (!slot.player || slot.state == SlotState::kIdle) return;
  slot.player->SeekToStart();
}

void DualPlayerPool::SetActive(SlotId slot_id) {
  if (active_ == slot_id) return;
  Logger::Debug(std::string("[DualPlayerPool] Active slot ") + SlotName(active_) +
                " -> " + SlotName(slot_id));
  active_ = slot_id;
}

bool DualPlayerPool::HasLoaded(SlotId slot_id, const std::string& video_ref) const {
  const PlayerSlot& s = slot(slot_id);
  return s.state != SlotState::kIdle && s.loaded_ref == video_ref;
}

std::optional<SlotId> DualPlayerPool::FindSlotWithRef(const std::string& video_ref) const {
  if (HasLoaded(Standby(), video_ref)) return Standby();
  if (HasLoaded(active_, video_ref)) return active_;
  return std::nullopt;
}

void DualPlayerPool::SetReachedEndHandler(ReachedEndFn handler) {
  reached_end_handler_ = std::move(handler);
}

void DualPlayerPool::Shutdown() {
  if (shut_down_) return;
  shut_down_ = true;
  for (auto& slot : slots_) {
    slot.reset();
  }
  reached_end_handler_ = nullptr;
  alive_.reset();
  Logger::Debug("[DualPlayerPool] Shutdown complete");
}

void DualPlayerPool::EndCycle(PlayerSlot& slot) {
  if (slot.player) {
    slot.player->SetEndOfItemHandler(nullptr);
  }
  ++slot.play_cycle;
  slot.end_reported = false;
}

void DualPlayerPool::OnPlayerEndOfItem(SlotId slot_id, uint64_t cycle) {
  if (shut_down_) return;
  PlayerSlot& slot = mutable_slot(slot_id);
  if (cycle != slot.play_cycle || slot.state != SlotState::kPlaying || slot.end_reported) {
    Logger::Debug("[DualPlayerPool] Dropped stale end-of-item slot=" +
                  std::string(SlotName(slot_id)));
    return;
  }

  slot.end_reported = true;
  if (reached_end_handler_) {
    reached_end_handler_(slot_id);
  }
}

}  // namespace montage::runtime
