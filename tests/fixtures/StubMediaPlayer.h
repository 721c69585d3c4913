// Stub media player for pool and scheduler contract tests.
// Records load/play/pause/seek calls; no decode, no threads.  End-of-item is
// raised by the test through TriggerEndOfItem().

#ifndef MONTAGE_TESTS_FIXTURES_STUB_MEDIA_PLAYER_H_
#define MONTAGE_TESTS_FIXTURES_STUB_MEDIA_PLAYER_H_

#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "montage/player/IMediaPlayer.h"

namespace montage::tests::fixtures {

// Call log shared between the test and the stub, so it survives the stub
// being destroyed by DualPlayerPool::Shutdown().
struct StubPlayerLog {
  std::vector<std::string> loads;  // Every underlying Load() reference, in order
  int play_count = 0;
  int pause_count = 0;
  int seek_count = 0;
  int unload_count = 0;
  bool destroyed = false;
  std::set<std::string> failing_refs;  // Load() of these returns false
};

class StubMediaPlayer : public montage::player::IMediaPlayer {
 public:
  explicit StubMediaPlayer(std::shared_ptr<StubPlayerLog> log)
      : log_(std::move(log)) {}

  ~StubMediaPlayer() override { log_->destroyed = true; }

  bool Load(const std::string& video_ref) override {
    log_->loads.push_back(video_ref);
    playing_ = false;
    if (log_->failing_refs.count(video_ref) > 0) {
      loaded_ref_.clear();
      return false;
    }
    loaded_ref_ = video_ref;
    return true;
  }

  void Unload() override {
    ++log_->unload_count;
    playing_ = false;
    loaded_ref_.clear();
  }

  bool Play() override {
    if (loaded_ref_.empty()) return false;
    ++log_->play_count;
    playing_ = true;
    return true;
  }

  void Pause() override {
    ++log_->pause_count;
    playing_ = false;
  }

  void SeekToStart() override { ++log_->seek_count; }

  bool IsPlaying() const override { return playing_; }

  const std::string& LoadedRef() const override { return loaded_ref_; }

  void SetEndOfItemHandler(EndOfItemFn handler) override { handler_ = std::move(handler); }

  // Simulates the decoder reaching the end of the clip.  Returns false if no
  // handler is registered (the pool has ended the cycle).
  bool TriggerEndOfItem() {
    if (!handler_) return false;
    EndOfItemFn handler = handler_;
    handler();
    return true;
  }

  bool HasEndHandler() const { return static_cast<bool>(handler_); }

 private:
  std::shared_ptr<StubPlayerLog> log_;
  std::string loaded_ref_;
  bool playing_ = false;
  EndOfItemFn handler_;
};

}  // namespace montage::tests::fixtures

#endif  // MONTAGE_TESTS_FIXTURES_STUB_MEDIA_PLAYER_H_
