// Repository: Montage-preview
// Component: FFmpeg Media Player
// Purpose: IMediaPlayer backed by libavformat/libavcodec; decodes a clip on
//          its own thread, paced by PTS.
// Copyright (c) 2025 Montage

#ifndef MONTAGE_PLAYER_FFMPEG_MEDIA_PLAYER_H_
#define MONTAGE_PLAYER_FFMPEG_MEDIA_PLAYER_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "montage/player/IMediaPlayer.h"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace montage::player {

// One decoded picture, YUV420P, tightly packed.
struct DecodedFrame {
  int width = 0;
  int height = 0;
  int64_t pts_ms = 0;
  std::vector<uint8_t> data;
};

// FFmpegMediaPlayer decodes a single video clip.
//
// Load() opens the container, initializes the codec and decodes the first
// frame, so that Play() presents frame zero immediately.  Play() starts a
// decode thread that hands frames to the FrameSink at their PTS; when the
// stream is exhausted the end-of-item handler is invoked once from that
// thread.  Play() on an exhausted clip reports end-of-item again right away;
// callers rewind with SeekToStart().
//
// Thread Safety:
// - Control methods are called from one thread (the owner executor).
// - The decoder is touched only by the decode thread while playing and only
//   by the control thread otherwise; Pause() joins the decode thread.
class FFmpegMediaPlayer : public IMediaPlayer {
 public:
  using FrameSink = std::function<void(const DecodedFrame& frame)>;

  // target_width/target_height of 0 keep the clip's native size.
  FFmpegMediaPlayer(int target_width, int target_height, FrameSink sink = nullptr);
  ~FFmpegMediaPlayer() override;

  FFmpegMediaPlayer(const FFmpegMediaPlayer&) = delete;
  FFmpegMediaPlayer& operator=(const FFmpegMediaPlayer&) = delete;

  bool Load(const std::string& video_ref) override;
  void Unload() override;
  bool Play() override;
  void Pause() override;
  void SeekToStart() override;
  bool IsPlaying() const override { return playing_.load(std::memory_order_acquire); }
  const std::string& LoadedRef() const override { return loaded_ref_; }
  void SetEndOfItemHandler(EndOfItemFn handler) override;

  bool IsOpen() const { return format_ctx_ != nullptr; }

  // Container duration, -1 if unknown or nothing is loaded.
  int64_t DurationMs() const { return duration_ms_; }

  uint64_t frames_presented() const {
    return frames_presented_.load(std::memory_order_relaxed);
  }

 private:
  bool Open(const std::string& video_ref);
  void Close();

  // Decodes frame zero into primed_frame_.
  bool Prime();

  // Returns false at end of stream or on a decode error.
  bool DecodeNextFrame(DecodedFrame& out);
  bool ConvertFrame(DecodedFrame& out);

  void PlaybackLoop();

  // Sleeps until `deadline` or until Pause() is requested.
  // Returns false if interrupted.
  bool WaitUntil(std::chrono::steady_clock::time_point deadline);

  int target_width_;
  int target_height_;
  FrameSink sink_;

  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;
  int video_stream_index_ = -1;
  double time_base_ms_ = 0.0;
  int64_t stream_start_pts_ = 0;
  int64_t duration_ms_ = -1;
  bool draining_ = false;
  bool eof_ = false;

  std::string loaded_ref_;
  std::optional<DecodedFrame> primed_frame_;

  std::thread decode_thread_;
  std::atomic<bool> playing_{false};
  std::atomic<bool> stop_requested_{false};
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;

  std::mutex handler_mutex_;
  EndOfItemFn end_handler_;  // Guarded by handler_mutex_

  std::atomic<uint64_t> frames_presented_{0};
};

}  // namespace montage::player

#endif  // MONTAGE_PLAYER_FFMPEG_MEDIA_PLAYER_H_
