// Repository: Montage-preview
// Component: Media Player Interface
// Purpose: One decoder/render pipeline behind a slot of the dual player pool.
// Copyright (c) 2025 Montage

#ifndef MONTAGE_PLAYER_IMEDIA_PLAYER_H_
#define MONTAGE_PLAYER_IMEDIA_PLAYER_H_

#include <functional>
#include <string>

namespace montage::player {

// IMediaPlayer is the black box the preview loop drives.  Decoding happens on
// the player's own threads; the only thing it reports back is end-of-item.
//
// Threading: every method is called from the owner context.  The end-of-item
// handler may be invoked from any thread (usually the player's decode thread).
class IMediaPlayer {
 public:
  using EndOfItemFn = std::function<void()>;

  virtual ~IMediaPlayer() = default;

  // Replaces the current item with video_ref and primes it (container open,
  // first frame decoded) so that Play() starts without a visible gap.
  // Returns false if the clip cannot be opened; the player is then empty.
  virtual bool Load(const std::string& video_ref) = 0;

  // Drops the current item.  Stops playback first.
  virtual void Unload() = 0;

  // Starts or resumes playback of the current item.
  // Returns false if nothing is loaded.
  virtual bool Play() = 0;

  // Pauses at the current position.  Blocks until the decode thread is idle,
  // so no end-of-item is reported for this cycle once Pause() returns.
  virtual void Pause() = 0;

  // Rewinds the current item to its first frame.  Does not change play state.
  virtual void SeekToStart() = 0;

  virtual bool IsPlaying() const = 0;

  // Reference of the current item, empty if none.
  virtual const std::string& LoadedRef() const = 0;

  // Installs the end-of-item handler.  Pass nullptr to clear.
  virtual void SetEndOfItemHandler(EndOfItemFn handler) = 0;
};

}  // namespace montage::player

#endif  // MONTAGE_PLAYER_IMEDIA_PLAYER_H_
