// Repository: Montage-preview
// Component: FFmpeg Concat Merge Service
// Purpose: Stream-copy concatenation of segment clips with libavformat.
// Copyright (c) 2025 Montage

#include "montage/exporting/FFmpegConcatMergeService.h"

#include <array>
#include <chrono>
#include <cstdio>
#include <memory>
#include <sstream>
#include <utility>
#include <vector>

#include "montage/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/mathematics.h>
}

namespace montage::exporting {

using montage::util::Logger;

namespace {

std::string AvError(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

struct InputCloser {
  void operator()(AVFormatContext* ctx) const {
    if (ctx) avformat_close_input(&ctx);
  }
};
using InputPtr = std::unique_ptr<AVFormatContext, InputCloser>;

struct OutputCloser {
  void operator()(AVFormatContext* ctx) const {
    if (!ctx) return;
    if (ctx->pb && !(ctx->oformat->flags & AVFMT_NOFILE)) {
      avio_closep(&ctx->pb);
    }
    avformat_free_context(ctx);
  }
};
using OutputPtr = std::unique_ptr<AVFormatContext, OutputCloser>;

struct PacketFree {
  void operator()(AVPacket* pkt) const { av_packet_free(&pkt); }
};
using PacketPtr = std::unique_ptr<AVPacket, PacketFree>;

// Output stream slots: 0 = video, 1 = audio.
constexpr int kVideoSlot = 0;
constexpr int kAudioSlot = 1;

InputPtr OpenInput(const std::string& uri) {
  AVFormatContext* raw = nullptr;
  int ret = avformat_open_input(&raw, uri.c_str(), nullptr, nullptr);
  if (ret < 0) {
    Logger::Error("[FFmpegConcatMergeService] open_input FAILED uri=" + uri +
                  " err=" + AvError(ret));
    return nullptr;
  }
  InputPtr input(raw);
  ret = avformat_find_stream_info(input.get(), nullptr);
  if (ret < 0) {
    Logger::Error("[FFmpegConcatMergeService] find_stream_info FAILED uri=" + uri +
                  " err=" + AvError(ret));
    return nullptr;
  }
  return input;
}

}  // namespace

FFmpegConcatMergeService::FFmpegConcatMergeService(std::string export_directory)
    : export_directory_(std::move(export_directory)) {
  worker_thread_ = std::thread(&FFmpegConcatMergeService::WorkerLoop, this);
}

FFmpegConcatMergeService::~FFmpegConcatMergeService() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
  }
  work_cv_.notify_all();
  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }
}

void FFmpegConcatMergeService::Merge(const model::SegmentList& segments,
                                     MergeCompletion completion) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(Request{next_request_id_++, segments, std::move(completion)});
  }
  work_cv_.notify_one();
}

std::size_t FFmpegConcatMergeService::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size() + (worker_active_ ? 1 : 0);
}

std::string FFmpegConcatMergeService::OutputPathFor(uint64_t request_id) const {
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  std::ostringstream oss;
  oss << export_directory_ << "/montage_" << now_ms << "_" << request_id << ".mp4";
  return oss.str();
}

void FFmpegConcatMergeService::WorkerLoop() {
  while (true) {
    Request request;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
      // Requests still queued at shutdown are failed, never dropped.
      if (shutdown_ && queue_.empty()) return;
      request = std::move(queue_.front());
      queue_.pop_front();
      worker_active_ = true;
    }

    std::optional<std::string> result;
    bool shutting_down = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      shutting_down = shutdown_;
    }
    if (!shutting_down) {
      result = MergeToFile(request.segments, OutputPathFor(request.id));
    }

    if (request.completion) request.completion(std::move(result));

    {
      std::lock_guard<std::mutex> lock(mutex_);
      worker_active_ = false;
    }
  }
}

std::optional<std::string> FFmpegConcatMergeService::MergeToFile(
    const model::SegmentList& segments, const std::string& output_path) {
  if (segments.empty()) {
    Logger::Error("[FFmpegConcatMergeService] Nothing to merge");
    return std::nullopt;
  }

  std::vector<std::string> clips;
  clips.reserve(segments.size());
  for (std::size_t i = 0; i < segments.size(); ++i) {
    auto clip = segments[i].ExportableVideoRef();
    if (!clip) {
      Logger::Error("[FFmpegConcatMergeService] Segment " + std::to_string(i) +
                    " has no video to merge: " + segments[i].PlayableRef());
      return std::nullopt;
    }
    clips.push_back(*clip);
  }

  // The first clip defines the output streams.
  InputPtr first = OpenInput(clips.front());
  if (!first) return std::nullopt;

  AVFormatContext* raw_out = nullptr;
  int ret = avformat_alloc_output_context2(&raw_out, nullptr, "mp4", output_path.c_str());
  if (ret < 0 || !raw_out) {
    Logger::Error("[FFmpegConcatMergeService] alloc_output FAILED path=" + output_path +
                  " err=" + AvError(ret));
    return std::nullopt;
  }
  OutputPtr output(raw_out);

  std::array<AVStream*, 2> out_streams = {nullptr, nullptr};
  const std::array<AVMediaType, 2> slot_types = {AVMEDIA_TYPE_VIDEO, AVMEDIA_TYPE_AUDIO};
  for (int slot = kVideoSlot; slot <= kAudioSlot; ++slot) {
    const int index = av_find_best_stream(first.get(), slot_types[slot], -1, -1, nullptr, 0);
    if (index < 0) continue;
    AVStream* out_stream = avformat_new_stream(output.get(), nullptr);
    if (!out_stream) {
      Logger::Error("[FFmpegConcatMergeService] new_stream FAILED");
      return std::nullopt;
    }
    ret = avcodec_parameters_copy(out_stream->codecpar, first->streams[index]->codecpar);
    if (ret < 0) {
      Logger::Error("[FFmpegConcatMergeService] parameters_copy FAILED err=" + AvError(ret));
      return std::nullopt;
    }
    out_stream->codecpar->codec_tag = 0;
    out_stream->time_base = first->streams[index]->time_base;
    out_streams[slot] = out_stream;
  }
  if (!out_streams[kVideoSlot]) {
    Logger::Error("[FFmpegConcatMergeService] First clip has no video: " + clips.front());
    return std::nullopt;
  }
  first.reset();

  if (!(output->oformat->flags & AVFMT_NOFILE)) {
    ret = avio_open(&output->pb, output_path.c_str(), AVIO_FLAG_WRITE);
    if (ret < 0) {
      Logger::Error("[FFmpegConcatMergeService] avio_open FAILED path=" + output_path +
                    " err=" + AvError(ret));
      return std::nullopt;
    }
  }

  // From here on the output file exists; a failed merge removes it.
  auto discard = [&output, &output_path]() -> std::optional<std::string> {
    output.reset();
    if (std::remove(output_path.c_str()) != 0) {
      Logger::Warn("[FFmpegConcatMergeService] Could not remove partial output " +
                   output_path);
    }
    return std::nullopt;
  };

  ret = avformat_write_header(output.get(), nullptr);
  if (ret < 0) {
    Logger::Error("[FFmpegConcatMergeService] write_header FAILED err=" + AvError(ret));
    return discard();
  }

  PacketPtr packet(av_packet_alloc());
  if (!packet) return discard();

  // Running offset of each clip in the output timeline, AV_TIME_BASE units.
  int64_t offset_us = 0;

  for (const std::string& clip : clips) {
    InputPtr input = OpenInput(clip);
    if (!input) return discard();

    std::array<int, 2> in_index = {-1, -1};
    for (int slot = kVideoSlot; slot <= kAudioSlot; ++slot) {
      if (!out_streams[slot]) continue;
      const int index = av_find_best_stream(input.get(), slot_types[slot], -1, -1, nullptr, 0);
      if (index < 0) {
        if (slot == kVideoSlot) {
          Logger::Error("[FFmpegConcatMergeService] Clip has no video: " + clip);
          return discard();
        }
        continue;
      }
      if (input->streams[index]->codecpar->codec_id != out_streams[slot]->codecpar->codec_id) {
        Logger::Error("[FFmpegConcatMergeService] Codec mismatch in " + clip +
                      "; stream copy needs one codec per track");
        return discard();
      }
      in_index[slot] = index;
    }

    std::array<int64_t, 2> first_ts = {AV_NOPTS_VALUE, AV_NOPTS_VALUE};
    int64_t clip_end_us = 0;

    while ((ret = av_read_frame(input.get(), packet.get())) >= 0) {
      int slot = -1;
      if (packet->stream_index == in_index[kVideoSlot]) slot = kVideoSlot;
      else if (packet->stream_index == in_index[kAudioSlot]) slot = kAudioSlot;
      if (slot < 0) {
        av_packet_unref(packet.get());
        continue;
      }

      AVStream* in_stream = input->streams[packet->stream_index];
      AVStream* out_stream = out_streams[slot];

      const int64_t ts = packet->dts != AV_NOPTS_VALUE ? packet->dts : packet->pts;
      if (first_ts[slot] == AV_NOPTS_VALUE && ts != AV_NOPTS_VALUE) first_ts[slot] = ts;
      const int64_t base = first_ts[slot] == AV_NOPTS_VALUE ? 0 : first_ts[slot];
      if (packet->pts != AV_NOPTS_VALUE) packet->pts -= base;
      if (packet->dts != AV_NOPTS_VALUE) packet->dts -= base;

      const int64_t end_in = (packet->pts != AV_NOPTS_VALUE ? packet->pts : 0) + packet->duration;
      const int64_t end_us = av_rescale_q(end_in, in_stream->time_base, AV_TIME_BASE_Q);
      if (end_us > clip_end_us) clip_end_us = end_us;

      av_packet_rescale_ts(packet.get(), in_stream->time_base, out_stream->time_base);
      const int64_t offset = av_rescale_q(offset_us, AV_TIME_BASE_Q, out_stream->time_base);
      if (packet->pts != AV_NOPTS_VALUE) packet->pts += offset;
      if (packet->dts != AV_NOPTS_VALUE) packet->dts += offset;
      packet->stream_index = out_stream->index;
      packet->pos = -1;

      ret = av_interleaved_write_frame(output.get(), packet.get());
      if (ret < 0) {
        Logger::Error("[FFmpegConcatMergeService] write_frame FAILED clip=" + clip +
                      " err=" + AvError(ret));
        return discard();
      }
    }
    if (ret != AVERROR_EOF) {
      Logger::Error("[FFmpegConcatMergeService] read_frame FAILED clip=" + clip +
                    " err=" + AvError(ret));
      return discard();
    }
    offset_us += clip_end_us;
  }

  ret = av_write_trailer(output.get());
  if (ret < 0) {
    Logger::Error("[FFmpegConcatMergeService] write_trailer FAILED err=" + AvError(ret));
    return discard();
  }

  Logger::Info("[FFmpegConcatMergeService] Merged " + std::to_string(clips.size()) +
               " clips into " + output_path + " (" + std::to_string(offset_us / 1000) + "ms)");
  return output_path;
}

}  // namespace montage::exporting
