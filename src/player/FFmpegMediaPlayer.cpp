// Repository: Montage-preview
// Component: FFmpeg Media Player
// Purpose: Clip decoding and PTS-paced presentation using libavformat and
//          libavcodec.
// Copyright (c) 2025 Montage

#include "montage/player/FFmpegMediaPlayer.h"

#include <sstream>
#include <utility>

#include "montage/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/imgutils.h>
#include <libavutil/log.h>
#include <libswscale/swscale.h>
}

namespace montage::player {

using montage::util::Logger;

namespace {

std::string AvError(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

}  // namespace

FFmpegMediaPlayer::FFmpegMediaPlayer(int target_width, int target_height, FrameSink sink)
    : target_width_(target_width),
      target_height_(target_height),
      sink_(std::move(sink)) {}

FFmpegMediaPlayer::~FFmpegMediaPlayer() {
  Unload();
}

bool FFmpegMediaPlayer::Load(const std::string& video_ref) {
  Unload();
  if (!Open(video_ref)) {
    Close();
    return false;
  }
  loaded_ref_ = video_ref;
  if (!Prime()) {
    Logger::Error("[FFmpegMediaPlayer] PRIME_FAILED uri=" + video_ref + " (no decodable frame)");
    Close();
    loaded_ref_.clear();
    return false;
  }
  return true;
}

void FFmpegMediaPlayer::Unload() {
  Pause();
  Close();
  loaded_ref_.clear();
}

bool FFmpegMediaPlayer::Play() {
  if (!IsOpen()) return false;
  if (IsPlaying()) return true;

  // A cycle that ran to end of stream leaves its thread joinable.
  if (decode_thread_.joinable()) {
    decode_thread_.join();
  }
  stop_requested_.store(false, std::memory_order_release);
  playing_.store(true, std::memory_order_release);
  decode_thread_ = std::thread(&FFmpegMediaPlayer::PlaybackLoop, this);
  return true;
}

void FFmpegMediaPlayer::Pause() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    stop_requested_.store(true, std::memory_order_release);
  }
  wait_cv_.notify_all();
  if (decode_thread_.joinable()) {
    decode_thread_.join();
  }
  playing_.store(false, std::memory_order_release);
  stop_requested_.store(false, std::memory_order_release);
}

void FFmpegMediaPlayer::SeekToStart() {
  if (!IsOpen()) return;
  const bool was_playing = IsPlaying();
  if (was_playing) Pause();

  int ret = av_seek_frame(format_ctx_, video_stream_index_, stream_start_pts_,
                          AVSEEK_FLAG_BACKWARD);
  if (ret < 0) {
    Logger::Warn("[FFmpegMediaPlayer] Seek to start failed uri=" + loaded_ref_ +
                 " err=" + AvError(ret));
  }
  avcodec_flush_buffers(codec_ctx_);
  draining_ = false;
  eof_ = false;
  primed_frame_.reset();
  if (!Prime()) {
    Logger::Warn("[FFmpegMediaPlayer] Re-prime after seek failed uri=" + loaded_ref_);
  }

  if (was_playing) Play();
}

void FFmpegMediaPlayer::SetEndOfItemHandler(EndOfItemFn handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  end_handler_ = std::move(handler);
}

bool FFmpegMediaPlayer::Open(const std::string& video_ref) {
  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);

  int ret = avformat_open_input(&format_ctx_, video_ref.c_str(), nullptr, nullptr);
  if (ret < 0) {
    Logger::Error("[FFmpegMediaPlayer] open_input FAILED uri=" + video_ref +
                  " err=" + AvError(ret));
    format_ctx_ = nullptr;
    return false;
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    Logger::Error("[FFmpegMediaPlayer] find_stream_info FAILED uri=" + video_ref +
                  " err=" + AvError(ret));
    return false;
  }

  const AVCodec* codec = nullptr;
  video_stream_index_ = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_VIDEO, -1, -1, &codec, 0);
  if (video_stream_index_ < 0 || codec == nullptr) {
    Logger::Error("[FFmpegMediaPlayer] No video stream uri=" + video_ref);
    video_stream_index_ = -1;
    return false;
  }

  AVStream* stream = format_ctx_->streams[video_stream_index_];
  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    Logger::Error("[FFmpegMediaPlayer] Failed to allocate codec context");
    return false;
  }
  ret = avcodec_parameters_to_context(codec_ctx_, stream->codecpar);
  if (ret < 0) {
    Logger::Error("[FFmpegMediaPlayer] parameters_to_context FAILED err=" + AvError(ret));
    return false;
  }
  ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    Logger::Error("[FFmpegMediaPlayer] avcodec_open2 FAILED uri=" + video_ref +
                  " err=" + AvError(ret));
    return false;
  }

  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) {
    Logger::Error("[FFmpegMediaPlayer] Failed to allocate frame/packet");
    return false;
  }

  time_base_ms_ = av_q2d(stream->time_base) * 1000.0;
  stream_start_pts_ = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;
  duration_ms_ = format_ctx_->duration != AV_NOPTS_VALUE
                     ? format_ctx_->duration / 1000  // AV_TIME_BASE is microseconds
                     : -1;
  draining_ = false;
  eof_ = false;

  std::ostringstream oss;
  oss << "[FFmpegMediaPlayer] Opened uri=" << video_ref << " " << codec_ctx_->width << "x"
      << codec_ctx_->height << " duration_ms=" << duration_ms_;
  Logger::Debug(oss.str());
  return true;
}

void FFmpegMediaPlayer::Close() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
  }
  primed_frame_.reset();
  video_stream_index_ = -1;
  duration_ms_ = -1;
  draining_ = false;
  eof_ = false;
}

bool FFmpegMediaPlayer::Prime() {
  DecodedFrame first;
  if (!DecodeNextFrame(first)) {
    return false;
  }
  primed_frame_ = std::move(first);
  return true;
}

bool FFmpegMediaPlayer::DecodeNextFrame(DecodedFrame& out) {
  if (!IsOpen() || eof_) return false;

  while (true) {
    int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == 0) {
      const bool ok = ConvertFrame(out);
      av_frame_unref(frame_);
      if (ok) return true;
      continue;
    }
    if (ret == AVERROR_EOF) {
      eof_ = true;
      return false;
    }
    if (ret != AVERROR(EAGAIN)) {
      Logger::Error("[FFmpegMediaPlayer] receive_frame FAILED uri=" + loaded_ref_ +
                    " err=" + AvError(ret));
      eof_ = true;
      return false;
    }

    if (draining_) {
      eof_ = true;
      return false;
    }

    ret = av_read_frame(format_ctx_, packet_);
    if (ret < 0) {
      // End of container: flush the decoder for its buffered frames.
      const int flush = avcodec_send_packet(codec_ctx_, nullptr);
      if (flush < 0 && flush != AVERROR_EOF) {
        Logger::Warn("[FFmpegMediaPlayer] flush error uri=" + loaded_ref_ +
                     " err=" + AvError(flush));
      }
      draining_ = true;
      continue;
    }

    if (packet_->stream_index == video_stream_index_) {
      ret = avcodec_send_packet(codec_ctx_, packet_);
      if (ret < 0 && ret != AVERROR(EAGAIN)) {
        Logger::Warn("[FFmpegMediaPlayer] send_packet error uri=" + loaded_ref_ +
                     " err=" + AvError(ret));
      }
    }
    av_packet_unref(packet_);
  }
}

bool FFmpegMediaPlayer::ConvertFrame(DecodedFrame& out) {
  const int out_width = target_width_ > 0 ? target_width_ : frame_->width;
  const int out_height = target_height_ > 0 ? target_height_ : frame_->height;

  sws_ctx_ = sws_getCachedContext(sws_ctx_, frame_->width, frame_->height,
                                  static_cast<AVPixelFormat>(frame_->format),
                                  out_width, out_height, AV_PIX_FMT_YUV420P,
                                  SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    Logger::Error("[FFmpegMediaPlayer] Failed to create scaler");
    return false;
  }

  const int size = av_image_get_buffer_size(AV_PIX_FMT_YUV420P, out_width, out_height, 1);
  if (size <= 0) return false;
  out.data.resize(static_cast<std::size_t>(size));

  uint8_t* dst_data[4] = {nullptr, nullptr, nullptr, nullptr};
  int dst_linesize[4] = {0, 0, 0, 0};
  av_image_fill_arrays(dst_data, dst_linesize, out.data.data(), AV_PIX_FMT_YUV420P,
                       out_width, out_height, 1);
  sws_scale(sws_ctx_, frame_->data, frame_->linesize, 0, frame_->height, dst_data,
            dst_linesize);

  int64_t pts = frame_->best_effort_timestamp;
  if (pts == AV_NOPTS_VALUE) pts = stream_start_pts_;
  out.width = out_width;
  out.height = out_height;
  out.pts_ms = static_cast<int64_t>((pts - stream_start_pts_) * time_base_ms_);
  return true;
}

bool FFmpegMediaPlayer::WaitUntil(std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(wait_mutex_);
  return !wait_cv_.wait_until(lock, deadline, [this] {
    return stop_requested_.load(std::memory_order_acquire);
  });
}

void FFmpegMediaPlayer::PlaybackLoop() {
  const auto wall_anchor = std::chrono::steady_clock::now();
  int64_t pts_anchor = -1;

  while (!stop_requested_.load(std::memory_order_acquire)) {
    DecodedFrame frame;
    if (primed_frame_) {
      frame = std::move(*primed_frame_);
      primed_frame_.reset();
    } else if (!DecodeNextFrame(frame)) {
      break;
    }

    if (pts_anchor < 0) pts_anchor = frame.pts_ms;
    const auto due = wall_anchor + std::chrono::milliseconds(frame.pts_ms - pts_anchor);
    if (!WaitUntil(due)) {
      // Paused before this frame was due: present it first on resume.
      primed_frame_ = std::move(frame);
      return;
    }

    if (sink_) sink_(frame);
    frames_presented_.fetch_add(1, std::memory_order_relaxed);
  }

  if (stop_requested_.load(std::memory_order_acquire)) {
    return;
  }
  // The thread is done; a later Play() joins it before starting a new cycle.
  playing_.store(false, std::memory_order_release);
  if (!eof_) {
    return;
  }

  Logger::Debug("[FFmpegMediaPlayer] End of item uri=" + loaded_ref_);
  EndOfItemFn handler;
  {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler = end_handler_;
  }
  if (handler) handler();
}

}  // namespace montage::player
