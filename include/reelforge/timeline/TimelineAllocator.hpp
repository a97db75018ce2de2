// Repository: ReelForge
// Component: Timeline Allocator
// Purpose: Count-based partition of a time budget into intro / items / outro
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_TIMELINE_ALLOCATOR_HPP_
#define REELFORGE_TIMELINE_ALLOCATOR_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "reelforge/timeline/TimelineTypes.hpp"

namespace reelforge::timeline {

struct AllocatorConfig {
  std::string intro_label = "Intro";
  std::string outro_label = "Outro";
  std::string placeholder_prefix = "Location";   // "Location i" for missing labels
  std::string default_outro_text = "Follow for more!";
  size_t max_label_chars = 40;                     // longer labels get "..."
  size_t max_items = 100;                          // larger N is kComputationError
};

struct AllocationRequest {
  int64_t total_duration_ms = 0;
  size_t item_count = 0;                 // N ≤ max_items; labels beyond N are ignored
  std::vector<std::string> item_labels;  // optional, per item
  std::optional<std::string> hook_text;  // intro overlay
  std::optional<std::string> outro_text; // defaults to AllocatorConfig text
};

struct AllocationResult {
  bool ok;
  ExtractionError error;
  std::string detail;

  // Ordered: intro, N content segments, outro.
  std::vector<Segment> segments;

  // Σ durations − T. Zero except for very short T where the one-second floors
  // stack; reported, never corrected.
  int64_t drift_ms;

  static AllocationResult Success(std::vector<Segment> segs, int64_t drift) {
    return {true, ExtractionError::kNone, "", std::move(segs), drift};
  }

  static AllocationResult Failure(ExtractionError err, const std::string& detail = "") {
    return {false, err, detail, {}, 0};
  }
};

// TimelineAllocator converts (T, N) into a named time partition. It is the
// fallback whenever visual detection or label extraction is unavailable.
//
//   intro   = max(1s, round_s(min(2s, 0.1·T)))
//   outro   = min(2s, 0.1·T)
//   perItem = (T − intro − outro) / max(N, 1)
//   item_i  = max(1s, round_0.1s(perItem))
//   outro'  = max(1s, T − cursor)      (absorbs all rounding drift)
//
// Deterministic and stateless; safe to share across threads.
class TimelineAllocator {
 public:
  explicit TimelineAllocator(AllocatorConfig config = AllocatorConfig());

  AllocationResult Allocate(const AllocationRequest& request) const;

  // Label shown for item i (1-based): the caller's label trimmed and stripped of
  // a leading "N." / "N)" prefix, or "Location i".
  std::string ItemLabel(const AllocationRequest& request, size_t i) const;

 private:
  AllocatorConfig config_;
};

}  // namespace reelforge::timeline

#endif  // REELFORGE_TIMELINE_ALLOCATOR_HPP_
