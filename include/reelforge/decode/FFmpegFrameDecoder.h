// Repository: ReelForge
// Component: FFmpeg Frame Decoder
// Purpose: Seek-and-render IFrameDecoder on libavformat/libavcodec/libswscale.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_DECODE_FFMPEG_FRAME_DECODER_H_
#define REELFORGE_DECODE_FFMPEG_FRAME_DECODER_H_

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "reelforge/sampling/IFrameDecoder.hpp"
#include "reelforge/time/ITimeSource.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace reelforge::decode {

// DecoderConfig holds configuration for FFmpeg-based frame rendering.
struct DecoderConfig {
  std::string input_uri;          // File path or URL understood by libavformat
  int max_edge_px;                // Comparison raster: longest edge cap
  int thumbnail_max_edge_px;      // JPEG preview: longest edge cap
  int jpeg_qscale;                // MJPEG qscale, 2 (best) .. 31 (worst)
  int max_decode_threads;         // Maximum decoder threads (0 = auto)

  DecoderConfig()
      : max_edge_px(720),
        thumbnail_max_edge_px(320),
        jpeg_qscale(5),
        max_decode_threads(0) {}
};

// FFmpegFrameDecoder renders single frames at arbitrary timestamps.
//
// RenderAt(t):
//   av_seek_frame(t, BACKWARD) → flush → decode until pts >= t (or EOF, in
//   which case the last decoded frame is used) → sws_scale to packed RGB24
//   capped at max_edge_px → sws_scale to YUVJ420P capped at
//   thumbnail_max_edge_px → MJPEG encode.
//
// Output dimensions preserve aspect ratio and are even.
//
// Deadline / cancel:
// - An FFmpeg interrupt callback aborts blocking I/O once the clock passes
//   the per-call deadline or the cancel flag is set.
// - The decode loop polls the same conditions between packets.
//
// Thread Safety:
// - Not thread-safe: one instance per extraction run.
//
// Error Handling:
// - Open() returns false for unreadable sources / no video stream.
// - RenderAt() reports per-frame failures via FrameStatus; a failed JPEG
//   encode leaves the thumbnail empty without failing the frame.
class FFmpegFrameDecoder : public sampling::IFrameDecoder {
 public:
  FFmpegFrameDecoder(const DecoderConfig& config, const time::ITimeSource& clock);
  ~FFmpegFrameDecoder() override;

  FFmpegFrameDecoder(const FFmpegFrameDecoder&) = delete;
  FFmpegFrameDecoder& operator=(const FFmpegFrameDecoder&) = delete;

  bool Open() override;
  int64_t DurationMs() const override;
  sampling::FrameStatus RenderAt(int64_t timestamp_ms,
                                 const sampling::FrameDeadline& deadline,
                                 sampling::SampledFrame& out) override;
  void Close() override;

  bool IsOpen() const { return format_ctx_ != nullptr; }
  int GetVideoWidth() const;
  int GetVideoHeight() const;

  // Longest-edge cap preserving aspect ratio, rounded down to even, min 2.
  static void ScaledDimensions(int src_width, int src_height, int max_edge,
                               int* dst_width, int* dst_height);

 private:
  // Read by the FFmpeg interrupt callback.
  struct InterruptState {
    const time::ITimeSource* clock = nullptr;
    int64_t deadline_utc_ms = 0;
    const std::atomic<bool>* cancel = nullptr;
  };

  static int InterruptCallback(void* opaque);

  // kOk when neither deadline nor cancel has tripped.
  sampling::FrameStatus CheckInterrupt() const;

  bool FindVideoStream();
  bool InitializeCodec();

  sampling::FrameStatus SeekTo(int64_t timestamp_ms);

  // Leaves the chosen frame in last_frame_.
  sampling::FrameStatus DecodeAtOrAfter(int64_t timestamp_ms);

  int64_t FramePtsMs(const AVFrame* frame) const;

  bool ConvertToRgb(const AVFrame* src, sampling::RgbRaster& raster);
  bool EncodeThumbnail(const AVFrame* src, std::vector<uint8_t>& jpeg);

  DecoderConfig config_;
  const time::ITimeSource& clock_;
  InterruptState interrupt_;

  AVFormatContext* format_ctx_;
  AVCodecContext* codec_ctx_;
  AVFrame* frame_;
  AVFrame* last_frame_;
  AVPacket* packet_;
  SwsContext* rgb_sws_ctx_;
  SwsContext* thumb_sws_ctx_;

  int video_stream_index_;
  int64_t start_time_;
  double time_base_;
};

}  // namespace reelforge::decode

#endif  // REELFORGE_DECODE_FFMPEG_FRAME_DECODER_H_
