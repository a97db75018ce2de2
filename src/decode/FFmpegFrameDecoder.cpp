// Repository: ReelForge
// Component: FFmpeg Frame Decoder
// Purpose: Seek-and-render IFrameDecoder on libavformat/libavcodec/libswscale.
// Copyright (c) 2025 ReelForge

#include "reelforge/decode/FFmpegFrameDecoder.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <sstream>

#include "reelforge/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>  // For av_log_set_level
#include <libswscale/swscale.h>
}

namespace {

// Deleters for per-call FFmpeg objects (the free functions take T**).
struct AVFrameDeleter {
  void operator()(AVFrame* f) const { av_frame_free(&f); }
};
struct AVPacketDeleter {
  void operator()(AVPacket* p) const { av_packet_free(&p); }
};
struct AVCodecContextDeleter {
  void operator()(AVCodecContext* c) const { avcodec_free_context(&c); }
};

using AVFramePtr = std::unique_ptr<AVFrame, AVFrameDeleter>;
using AVPacketPtr = std::unique_ptr<AVPacket, AVPacketDeleter>;
using AVCodecContextPtr = std::unique_ptr<AVCodecContext, AVCodecContextDeleter>;

std::string AvError(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

}  // namespace

namespace reelforge::decode {

using sampling::FrameStatus;
using util::Logger;

FFmpegFrameDecoder::FFmpegFrameDecoder(const DecoderConfig& config,
                                       const time::ITimeSource& clock)
    : config_(config),
      clock_(clock),
      format_ctx_(nullptr),
      codec_ctx_(nullptr),
      frame_(nullptr),
      last_frame_(nullptr),
      packet_(nullptr),
      rgb_sws_ctx_(nullptr),
      thumb_sws_ctx_(nullptr),
      video_stream_index_(-1),
      start_time_(0),
      time_base_(0.0) {
  interrupt_.clock = &clock_;
}

FFmpegFrameDecoder::~FFmpegFrameDecoder() {
  Close();
}

// FFmpeg interrupt callback: return non-zero to abort I/O.
int FFmpegFrameDecoder::InterruptCallback(void* opaque) {
  const auto* state = static_cast<const InterruptState*>(opaque);
  if (state->cancel && state->cancel->load(std::memory_order_acquire)) {
    return 1;
  }
  if (state->deadline_utc_ms > 0 && state->clock &&
      state->clock->NowUtcMs() >= state->deadline_utc_ms) {
    return 1;
  }
  return 0;
}

FrameStatus FFmpegFrameDecoder::CheckInterrupt() const {
  if (interrupt_.cancel && interrupt_.cancel->load(std::memory_order_acquire)) {
    return FrameStatus::kAborted;
  }
  if (interrupt_.deadline_utc_ms > 0 && clock_.NowUtcMs() >= interrupt_.deadline_utc_ms) {
    return FrameStatus::kSeekTimeout;
  }
  return FrameStatus::kOk;
}

bool FFmpegFrameDecoder::Open() {
  if (format_ctx_) {
    Close();
  }
  Logger::Info("[FFmpegFrameDecoder] Opening: " + config_.input_uri);

  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);

  format_ctx_ = avformat_alloc_context();
  if (!format_ctx_) {
    Logger::Error("[FFmpegFrameDecoder] Failed to allocate format context");
    return false;
  }

  // Interrupt callback is installed for the lifetime of the context; it only
  // trips while a RenderAt deadline or cancel flag is armed.
  format_ctx_->interrupt_callback.callback = &FFmpegFrameDecoder::InterruptCallback;
  format_ctx_->interrupt_callback.opaque = &interrupt_;

  // DECODER_STEP: open_input
  int ret = avformat_open_input(&format_ctx_, config_.input_uri.c_str(), nullptr, nullptr);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[FFmpegFrameDecoder] DECODER_STEP open_input FAILED uri=" << config_.input_uri
        << " ret=" << ret << " err=" << AvError(ret);
    Logger::Error(oss.str());
    // avformat_open_input frees the context on failure.
    format_ctx_ = nullptr;
    return false;
  }

  // DECODER_STEP: avformat_find_stream_info
  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[FFmpegFrameDecoder] DECODER_STEP avformat_find_stream_info FAILED uri="
        << config_.input_uri << " ret=" << ret << " err=" << AvError(ret);
    Logger::Error(oss.str());
    Close();
    return false;
  }

  // DECODER_STEP: find_video_stream
  if (!FindVideoStream()) {
    Logger::Error("[FFmpegFrameDecoder] DECODER_STEP find_video_stream FAILED uri=" +
                  config_.input_uri + " (no video stream)");
    Close();
    return false;
  }

  // DECODER_STEP: initialize_codec
  if (!InitializeCodec()) {
    Logger::Error("[FFmpegFrameDecoder] DECODER_STEP initialize_codec FAILED uri=" +
                  config_.input_uri);
    Close();
    return false;
  }

  packet_ = av_packet_alloc();
  if (!packet_) {
    Logger::Error("[FFmpegFrameDecoder] DECODER_STEP packet_alloc FAILED uri=" +
                  config_.input_uri);
    Close();
    return false;
  }

  std::ostringstream oss;
  oss << "[FFmpegFrameDecoder] DECODER_STEP open_input OK uri=" << config_.input_uri
      << " " << GetVideoWidth() << "x" << GetVideoHeight()
      << " duration_ms=" << DurationMs();
  Logger::Info(oss.str());
  return true;
}

void FFmpegFrameDecoder::Close() {
  if (rgb_sws_ctx_) {
    sws_freeContext(rgb_sws_ctx_);
    rgb_sws_ctx_ = nullptr;
  }
  if (thumb_sws_ctx_) {
    sws_freeContext(thumb_sws_ctx_);
    thumb_sws_ctx_ = nullptr;
  }
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (last_frame_) {
    av_frame_free(&last_frame_);
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

  video_stream_index_ = -1;
  start_time_ = 0;
  time_base_ = 0.0;
  interrupt_.deadline_utc_ms = 0;
  interrupt_.cancel = nullptr;
}

int64_t FFmpegFrameDecoder::DurationMs() const {
  if (!format_ctx_) return 0;

  if (format_ctx_->duration != AV_NOPTS_VALUE && format_ctx_->duration > 0) {
    return format_ctx_->duration / (AV_TIME_BASE / 1000);
  }
  if (video_stream_index_ >= 0) {
    const AVStream* stream = format_ctx_->streams[video_stream_index_];
    if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
      return static_cast<int64_t>(std::llround(
          static_cast<double>(stream->duration) * av_q2d(stream->time_base) * 1000.0));
    }
  }
  return 0;
}

int FFmpegFrameDecoder::GetVideoWidth() const {
  return codec_ctx_ ? codec_ctx_->width : 0;
}

int FFmpegFrameDecoder::GetVideoHeight() const {
  return codec_ctx_ ? codec_ctx_->height : 0;
}

void FFmpegFrameDecoder::ScaledDimensions(int src_width, int src_height, int max_edge,
                                          int* dst_width, int* dst_height) {
  int w = std::max(src_width, 2);
  int h = std::max(src_height, 2);
  const int longest = std::max(w, h);
  if (max_edge > 0 && longest > max_edge) {
    const double scale = static_cast<double>(max_edge) / static_cast<double>(longest);
    w = static_cast<int>(std::lround(w * scale));
    h = static_cast<int>(std::lround(h * scale));
  }
  *dst_width = std::max(2, w & ~1);
  *dst_height = std::max(2, h & ~1);
}

bool FFmpegFrameDecoder::FindVideoStream() {
  for (unsigned int i = 0; i < format_ctx_->nb_streams; i++) {
    if (format_ctx_->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_VIDEO) {
      video_stream_index_ = static_cast<int>(i);

      AVStream* stream = format_ctx_->streams[i];
      time_base_ = av_q2d(stream->time_base);
      start_time_ = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;
      return true;
    }
  }
  return false;
}

bool FFmpegFrameDecoder::InitializeCodec() {
  AVStream* stream = format_ctx_->streams[video_stream_index_];
  AVCodecParameters* codecpar = stream->codecpar;

  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    std::ostringstream oss;
    oss << "[FFmpegFrameDecoder] Codec not found: " << codecpar->codec_id;
    Logger::Error(oss.str());
    return false;
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    Logger::Error("[FFmpegFrameDecoder] Failed to allocate codec context");
    return false;
  }

  if (avcodec_parameters_to_context(codec_ctx_, codecpar) < 0) {
    Logger::Error("[FFmpegFrameDecoder] Failed to copy codec parameters");
    return false;
  }

  if (config_.max_decode_threads > 0) {
    codec_ctx_->thread_count = config_.max_decode_threads;
  }
  // Slice threading keeps the seek → first frame latency low; frame
  // threading would buffer several frames behind every seek.
  codec_ctx_->thread_type = FF_THREAD_SLICE;

  if (avcodec_open2(codec_ctx_, codec, nullptr) < 0) {
    Logger::Error("[FFmpegFrameDecoder] Failed to open codec");
    return false;
  }

  frame_ = av_frame_alloc();
  last_frame_ = av_frame_alloc();
  if (!frame_ || !last_frame_) {
    Logger::Error("[FFmpegFrameDecoder] Failed to allocate frames");
    return false;
  }
  return true;
}

int64_t FFmpegFrameDecoder::FramePtsMs(const AVFrame* frame) const {
  const int64_t pts =
      frame->pts != AV_NOPTS_VALUE ? frame->pts : frame->best_effort_timestamp;
  if (pts == AV_NOPTS_VALUE) return 0;
  return static_cast<int64_t>(static_cast<double>(pts - start_time_) * time_base_ * 1000.0);
}

FrameStatus FFmpegFrameDecoder::SeekTo(int64_t timestamp_ms) {
  AVStream* stream = format_ctx_->streams[video_stream_index_];
  const int64_t timestamp =
      av_rescale_q(timestamp_ms * 1000, AVRational{1, AV_TIME_BASE}, stream->time_base) +
      start_time_;

  // DECODER_STEP: seek (keyframe at or before target)
  int ret = av_seek_frame(format_ctx_, video_stream_index_, timestamp, AVSEEK_FLAG_BACKWARD);
  if (ret < 0) {
    FrameStatus interrupted = CheckInterrupt();
    if (interrupted != FrameStatus::kOk) return interrupted;
    std::ostringstream oss;
    oss << "[FFmpegFrameDecoder] DECODER_STEP seek FAILED position_ms=" << timestamp_ms
        << " ret=" << ret << " err=" << AvError(ret);
    Logger::Warn(oss.str());
    return FrameStatus::kSeekFailed;
  }

  avcodec_flush_buffers(codec_ctx_);
  av_frame_unref(last_frame_);
  return FrameStatus::kOk;
}

FrameStatus FFmpegFrameDecoder::DecodeAtOrAfter(int64_t timestamp_ms) {
  bool draining = false;

  while (true) {
    FrameStatus interrupted = CheckInterrupt();
    if (interrupted != FrameStatus::kOk) return interrupted;

    if (!draining) {
      int ret = av_read_frame(format_ctx_, packet_);
      if (ret == AVERROR_EOF) {
        // Flush the decoder so frames it still holds are delivered.
        draining = true;
        avcodec_send_packet(codec_ctx_, nullptr);
      } else if (ret < 0) {
        interrupted = CheckInterrupt();
        if (interrupted != FrameStatus::kOk) return interrupted;
        std::ostringstream oss;
        oss << "[FFmpegFrameDecoder] read_frame FAILED target_ms=" << timestamp_ms
            << " err=" << AvError(ret);
        Logger::Warn(oss.str());
        return last_frame_->data[0] ? FrameStatus::kOk : FrameStatus::kSeekFailed;
      } else {
        if (packet_->stream_index != video_stream_index_) {
          av_packet_unref(packet_);
          continue;
        }
        ret = avcodec_send_packet(codec_ctx_, packet_);
        av_packet_unref(packet_);
        if (ret < 0 && ret != AVERROR(EAGAIN)) {
          // Corrupt packet; keep reading.
          continue;
        }
      }
    }

    while (true) {
      int ret = avcodec_receive_frame(codec_ctx_, frame_);
      if (ret == AVERROR(EAGAIN)) break;
      if (ret == AVERROR_EOF) {
        // Target lies beyond the last frame: use the last one decoded.
        return last_frame_->data[0] ? FrameStatus::kOk : FrameStatus::kSeekFailed;
      }
      if (ret < 0) {
        return last_frame_->data[0] ? FrameStatus::kOk : FrameStatus::kRenderFailed;
      }

      av_frame_unref(last_frame_);
      av_frame_move_ref(last_frame_, frame_);
      if (FramePtsMs(last_frame_) >= timestamp_ms) {
        return FrameStatus::kOk;
      }
    }

    if (draining) {
      // EAGAIN while draining should not happen; treat as end of stream.
      return last_frame_->data[0] ? FrameStatus::kOk : FrameStatus::kSeekFailed;
    }
  }
}

bool FFmpegFrameDecoder::ConvertToRgb(const AVFrame* src, sampling::RgbRaster& raster) {
  int dst_w = 0;
  int dst_h = 0;
  ScaledDimensions(src->width, src->height, config_.max_edge_px, &dst_w, &dst_h);

  rgb_sws_ctx_ = sws_getCachedContext(
      rgb_sws_ctx_,
      src->width, src->height, static_cast<AVPixelFormat>(src->format),
      dst_w, dst_h, AV_PIX_FMT_RGB24,
      SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!rgb_sws_ctx_) {
    Logger::Warn("[FFmpegFrameDecoder] Failed to create RGB scaler context");
    return false;
  }

  raster.width = dst_w;
  raster.height = dst_h;
  raster.data.assign(static_cast<size_t>(dst_w) * static_cast<size_t>(dst_h) * 3, 0);

  uint8_t* dst_data[4] = {raster.data.data(), nullptr, nullptr, nullptr};
  int dst_linesize[4] = {dst_w * 3, 0, 0, 0};
  const int rows = sws_scale(rgb_sws_ctx_, src->data, src->linesize, 0, src->height,
                             dst_data, dst_linesize);
  if (rows <= 0) {
    raster = sampling::RgbRaster{};
    return false;
  }
  return true;
}

bool FFmpegFrameDecoder::EncodeThumbnail(const AVFrame* src, std::vector<uint8_t>& jpeg) {
  jpeg.clear();

  int dst_w = 0;
  int dst_h = 0;
  ScaledDimensions(src->width, src->height, config_.thumbnail_max_edge_px, &dst_w, &dst_h);

  const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_MJPEG);
  if (!codec) {
    Logger::Warn("[FFmpegFrameDecoder] MJPEG encoder not found");
    return false;
  }

  AVCodecContextPtr enc(avcodec_alloc_context3(codec));
  if (!enc) return false;
  enc->width = dst_w;
  enc->height = dst_h;
  enc->pix_fmt = AV_PIX_FMT_YUVJ420P;
  enc->time_base = AVRational{1, 25};
  enc->flags |= AV_CODEC_FLAG_QSCALE;
  enc->global_quality = FF_QP2LAMBDA * std::clamp(config_.jpeg_qscale, 2, 31);

  int ret = avcodec_open2(enc.get(), codec, nullptr);
  if (ret < 0) {
    Logger::Warn("[FFmpegFrameDecoder] Failed to open MJPEG encoder: " + AvError(ret));
    return false;
  }

  AVFramePtr thumb(av_frame_alloc());
  if (!thumb) return false;
  thumb->format = AV_PIX_FMT_YUVJ420P;
  thumb->width = dst_w;
  thumb->height = dst_h;
  if (av_frame_get_buffer(thumb.get(), 0) < 0) {
    Logger::Warn("[FFmpegFrameDecoder] Failed to allocate thumbnail frame");
    return false;
  }

  thumb_sws_ctx_ = sws_getCachedContext(
      thumb_sws_ctx_,
      src->width, src->height, static_cast<AVPixelFormat>(src->format),
      dst_w, dst_h, AV_PIX_FMT_YUVJ420P,
      SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!thumb_sws_ctx_) {
    Logger::Warn("[FFmpegFrameDecoder] Failed to create thumbnail scaler context");
    return false;
  }
  sws_scale(thumb_sws_ctx_, src->data, src->linesize, 0, src->height,
            thumb->data, thumb->linesize);
  thumb->pts = 0;
  thumb->quality = enc->global_quality;

  ret = avcodec_send_frame(enc.get(), thumb.get());
  if (ret < 0) {
    Logger::Warn("[FFmpegFrameDecoder] Error sending thumbnail frame: " + AvError(ret));
    return false;
  }

  AVPacketPtr pkt(av_packet_alloc());
  if (!pkt) return false;
  ret = avcodec_receive_packet(enc.get(), pkt.get());
  if (ret < 0) {
    Logger::Warn("[FFmpegFrameDecoder] Error receiving thumbnail packet: " + AvError(ret));
    return false;
  }
  jpeg.assign(pkt->data, pkt->data + pkt->size);
  return true;
}

FrameStatus FFmpegFrameDecoder::RenderAt(int64_t timestamp_ms,
                                         const sampling::FrameDeadline& deadline,
                                         sampling::SampledFrame& out) {
  out.timestamp_ms = timestamp_ms;
  out.raster = sampling::RgbRaster{};
  out.thumbnail_jpeg.clear();

  if (!format_ctx_ || !codec_ctx_ || video_stream_index_ < 0) {
    return FrameStatus::kSeekFailed;
  }

  interrupt_.deadline_utc_ms = deadline.deadline_utc_ms;
  interrupt_.cancel = deadline.cancel;

  FrameStatus status = CheckInterrupt();
  if (status == FrameStatus::kOk) status = SeekTo(timestamp_ms);
  if (status == FrameStatus::kOk) status = DecodeAtOrAfter(timestamp_ms);

  // Disarm before conversion; scaling and encoding do no I/O.
  interrupt_.deadline_utc_ms = 0;
  interrupt_.cancel = nullptr;

  if (status != FrameStatus::kOk) {
    av_frame_unref(last_frame_);
    return status;
  }

  if (!ConvertToRgb(last_frame_, out.raster)) {
    av_frame_unref(last_frame_);
    return FrameStatus::kRenderFailed;
  }
  if (!EncodeThumbnail(last_frame_, out.thumbnail_jpeg)) {
    out.thumbnail_jpeg.clear();
  }

  if (Logger::DebugEnabled()) {
    std::ostringstream oss;
    oss << "[FFmpegFrameDecoder] rendered target_ms=" << timestamp_ms
        << " frame_pts_ms=" << FramePtsMs(last_frame_)
        << " raster=" << out.raster.width << "x" << out.raster.height
        << " jpeg_bytes=" << out.thumbnail_jpeg.size();
    Logger::Debug(oss.str());
  }
  av_frame_unref(last_frame_);
  return FrameStatus::kOk;
}

}  // namespace reelforge::decode
