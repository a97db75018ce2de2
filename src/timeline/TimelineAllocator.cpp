// Repository: ReelForge
// Component: Timeline Allocator Implementation
// Copyright (c) 2025 ReelForge

#include "reelforge/timeline/TimelineAllocator.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "reelforge/timeline/TextStyles.hpp"
#include "reelforge/timeline/TimeMath.hpp"
#include "reelforge/util/Logger.hpp"
#include "reelforge/util/Utf8.hpp"

namespace reelforge::timeline {

namespace {

constexpr int64_t kMaxIntroOutroMs = 2 * time_math::kMsPerSecond;

// Drops a leading "12." or "12)" list marker.
std::string StripListMarker(const std::string& s) {
  size_t i = 0;
  while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
  if (i > 0 && i < s.size() && (s[i] == '.' || s[i] == ')')) {
    return util::CollapseWhitespace(s.substr(i + 1));
  }
  return s;
}

}  // namespace

TimelineAllocator::TimelineAllocator(AllocatorConfig config)
    : config_(std::move(config)) {}

std::string TimelineAllocator::ItemLabel(const AllocationRequest& request, size_t i) const {
  if (i >= 1 && i <= request.item_labels.size()) {
    std::string label = StripListMarker(util::CollapseWhitespace(request.item_labels[i - 1]));
    if (!label.empty()) {
      return util::Utf8Ellipsize(label, config_.max_label_chars);
    }
  }
  return config_.placeholder_prefix + " " + std::to_string(i);
}

AllocationResult TimelineAllocator::Allocate(const AllocationRequest& request) const {
  const int64_t total = request.total_duration_ms;
  if (total <= 0) {
    std::ostringstream detail;
    detail << "total_duration_ms (" << total << ") <= 0";
    return AllocationResult::Failure(ExtractionError::kComputationError, detail.str());
  }

  const size_t n = request.item_count;
  if (n > config_.max_items) {
    std::ostringstream detail;
    detail << "item_count (" << n << ") > max_items (" << config_.max_items << ")";
    return AllocationResult::Failure(ExtractionError::kComputationError, detail.str());
  }
  const size_t segment_count = n + 2;
  const double tenth_of_total = static_cast<double>(total) * 0.1;

  const int64_t intro_ms = time_math::FloorAtOneSecond(
      time_math::RoundToSecondMs(std::min(static_cast<double>(kMaxIntroOutroMs), tenth_of_total)));
  const double outro_ms = std::min(static_cast<double>(kMaxIntroOutroMs), tenth_of_total);
  const double content_ms = static_cast<double>(total - intro_ms) - outro_ms;
  const double per_item_ms = content_ms / static_cast<double>(std::max<size_t>(n, 1));

  std::vector<Segment> segments;
  segments.reserve(segment_count);

  Segment intro;
  intro.position = 1;
  intro.kind = SegmentKind::kIntro;
  intro.label = config_.intro_label;
  intro.start_ms = 0;
  intro.duration_ms = intro_ms;
  intro.text = request.hook_text;
  intro.style_class = StyleClassForPosition(1, segment_count);
  segments.push_back(std::move(intro));

  int64_t cursor = intro_ms;
  const int64_t item_ms = time_math::RoundTenthFloorSecond(per_item_ms);
  for (size_t i = 1; i <= n; ++i) {
    Segment item;
    item.position = static_cast<int32_t>(i + 1);
    item.kind = SegmentKind::kContent;
    item.label = ItemLabel(request, i);
    item.start_ms = cursor;
    item.duration_ms = item_ms;
    item.text = std::to_string(i) + ". " + item.label;
    item.style_class = StyleClassForPosition(i + 1, segment_count);
    cursor += item_ms;
    segments.push_back(std::move(item));
  }

  // The outro is not perItem-derived: it takes whatever remains.
  Segment outro;
  outro.position = static_cast<int32_t>(segment_count);
  outro.kind = SegmentKind::kOutro;
  outro.label = config_.outro_label;
  outro.start_ms = cursor;
  outro.duration_ms = time_math::FloorAtOneSecond(total - cursor);
  outro.text = request.outro_text.value_or(config_.default_outro_text);
  outro.style_class = StyleClassForPosition(segment_count, segment_count);
  segments.push_back(std::move(outro));

  const int64_t sum = segments.back().end_ms();
  const int64_t drift = sum - total;
  if (drift != 0) {
    std::ostringstream oss;
    oss << "[TimelineAllocator] bounded drift: sum_ms=" << sum << " total_ms=" << total
        << " drift_ms=" << drift << " items=" << n;
    util::Logger::Warn(oss.str());
  }

  {
    std::ostringstream oss;
    oss << "[TimelineAllocator] allocated total_ms=" << total << " items=" << n
        << " intro_ms=" << intro_ms << " item_ms=" << item_ms
        << " outro_ms=" << segments.back().duration_ms;
    util::Logger::Debug(oss.str());
  }

  return AllocationResult::Success(std::move(segments), drift);
}

}  // namespace reelforge::timeline
