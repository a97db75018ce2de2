// Repository: ReelForge
// Component: Frame Types
// Purpose: Raster and sampled-frame containers passed from decoder to detector
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_SAMPLING_FRAME_TYPES_HPP_
#define REELFORGE_SAMPLING_FRAME_TYPES_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace reelforge::sampling {

// Packed RGB24 raster: 3 bytes per pixel, no row padding.
struct RgbRaster {
  int32_t width = 0;
  int32_t height = 0;
  std::vector<uint8_t> data;

  size_t stride() const { return static_cast<size_t>(width) * 3; }
  size_t pixel_count() const {
    return static_cast<size_t>(width) * static_cast<size_t>(height);
  }
  bool empty() const { return width <= 0 || height <= 0 || data.empty(); }

  // True when data holds exactly width * height * 3 bytes.
  bool well_formed() const { return !empty() && data.size() == pixel_count() * 3; }
};

// One decoded sample. The raster is consumed by the detector; the thumbnail
// outlives it when the frame opens a scene.
struct SampledFrame {
  int64_t timestamp_ms = 0;
  RgbRaster raster;
  std::vector<uint8_t> thumbnail_jpeg;  // may be empty
};

}  // namespace reelforge::sampling

#endif  // REELFORGE_SAMPLING_FRAME_TYPES_HPP_
