// Repository: ReelForge
// Component: Frame Decoder Interface
// Purpose: Seek-and-render abstraction between the sampler and a media backend
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_SAMPLING_IFRAME_DECODER_HPP_
#define REELFORGE_SAMPLING_IFRAME_DECODER_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "reelforge/sampling/FrameTypes.hpp"

namespace reelforge::sampling {

enum class FrameStatus {
  kOk = 0,
  kSeekFailed,    // container refused the seek / no frame at or after target
  kSeekTimeout,   // deadline passed while seeking or decoding
  kRenderFailed,  // frame decoded but could not be converted
  kAborted,       // cancel flag observed
};

const char* FrameStatusToString(FrameStatus status);

// Passed to every RenderAt. Cooperative decoders abort blocking I/O once
// NowUtcMs() >= deadline_utc_ms (when non-zero) or *cancel becomes true.
struct FrameDeadline {
  int64_t deadline_utc_ms = 0;                  // 0 = no deadline
  const std::atomic<bool>* cancel = nullptr;    // not owned

  bool cancelled() const {
    return cancel != nullptr && cancel->load(std::memory_order_acquire);
  }
};

class IFrameDecoder {
 public:
  virtual ~IFrameDecoder() = default;

  // Returns false when the source cannot be opened or has no video stream.
  virtual bool Open() = 0;

  // Probed duration; 0 when the container does not report one.
  virtual int64_t DurationMs() const = 0;

  // Seeks to timestamp_ms, decodes the first frame at or after it and fills
  // `out` (raster + thumbnail). `out.timestamp_ms` is set to timestamp_ms.
  virtual FrameStatus RenderAt(int64_t timestamp_ms,
                               const FrameDeadline& deadline,
                               SampledFrame& out) = 0;

  virtual void Close() = 0;
};

// Builds a decoder for a source URI. The service and pipeline take one of
// these so tests can substitute scripted decoders.
using FrameDecoderFactory =
    std::function<std::unique_ptr<IFrameDecoder>(const std::string& uri)>;

}  // namespace reelforge::sampling

#endif  // REELFORGE_SAMPLING_IFRAME_DECODER_HPP_
