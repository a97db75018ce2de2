// Repository: ReelForge
// Component: Timeline Validator Implementation
// Copyright (c) 2025 ReelForge

#include "reelforge/timeline/TimelineValidator.hpp"

#include <algorithm>
#include <map>
#include <sstream>
#include <utility>

namespace reelforge::timeline {

using ValidationResult = TimelineValidator::ValidationResult;

ValidationResult TimelineValidator::ValidateScenes(const std::vector<Scene>& scenes,
                                                   int64_t min_scene_ms) {
  for (size_t i = 0; i < scenes.size(); ++i) {
    const Scene& s = scenes[i];
    if (s.start_ms < 0 || s.end_ms <= s.start_ms) {
      std::ostringstream detail;
      detail << "scene " << s.id << " has invalid interval [" << s.start_ms
             << ", " << s.end_ms << ")";
      return ValidationResult::Failure(detail.str());
    }
    if (min_scene_ms > 0 && s.duration_ms() < min_scene_ms) {
      std::ostringstream detail;
      detail << "scene " << s.id << " duration_ms (" << s.duration_ms()
             << ") < min_scene_ms (" << min_scene_ms << ")";
      return ValidationResult::Failure(detail.str());
    }
    if (i > 0 && scenes[i - 1].end_ms != s.start_ms) {
      std::ostringstream detail;
      if (scenes[i - 1].end_ms > s.start_ms) {
        detail << "scene " << s.id << " overlaps its predecessor by "
               << (scenes[i - 1].end_ms - s.start_ms) << "ms";
      } else {
        detail << "gap of " << (s.start_ms - scenes[i - 1].end_ms)
               << "ms before scene " << s.id;
      }
      return ValidationResult::Failure(detail.str());
    }
  }
  return ValidationResult::Success();
}

ValidationResult TimelineValidator::ValidateSegments(const std::vector<Segment>& segments) {
  int64_t cursor = 0;
  for (size_t i = 0; i < segments.size(); ++i) {
    const Segment& seg = segments[i];
    if (seg.position != static_cast<int32_t>(i + 1)) {
      std::ostringstream detail;
      detail << "segment at index " << i << " has position " << seg.position
             << " (expected " << (i + 1) << ")";
      return ValidationResult::Failure(detail.str());
    }
    if (seg.duration_ms <= 0) {
      std::ostringstream detail;
      detail << "segment " << seg.position << " has duration_ms " << seg.duration_ms;
      return ValidationResult::Failure(detail.str());
    }
    if (seg.start_ms != cursor) {
      std::ostringstream detail;
      detail << "segment " << seg.position << " starts at " << seg.start_ms
             << "ms (expected " << cursor << "ms)";
      return ValidationResult::Failure(detail.str());
    }
    cursor = seg.end_ms();
  }
  return ValidationResult::Success();
}

ValidationResult TimelineValidator::ValidateClips(const std::vector<Clip>& clips) {
  for (size_t i = 0; i < clips.size(); ++i) {
    const Clip& c = clips[i];
    if (c.index != static_cast<int32_t>(i)) {
      std::ostringstream detail;
      detail << "clip at slot " << i << " has index " << c.index;
      return ValidationResult::Failure(detail.str());
    }
    if (c.end_ms <= c.start_ms) {
      std::ostringstream detail;
      detail << "clip " << c.index << " has invalid interval [" << c.start_ms
             << ", " << c.end_ms << ")";
      return ValidationResult::Failure(detail.str());
    }
    if (i > 0 && clips[i - 1].end_ms != c.start_ms) {
      std::ostringstream detail;
      detail << "clip " << c.index << " starts at " << c.start_ms
             << "ms but clip " << clips[i - 1].index << " ends at "
             << clips[i - 1].end_ms << "ms";
      return ValidationResult::Failure(detail.str());
    }
  }
  return ValidationResult::Success();
}

ValidationResult TimelineValidator::ValidateOverlays(const std::vector<TextOverlay>& overlays,
                                                     const std::vector<Clip>& clips) {
  std::map<int32_t, std::pair<int64_t, int64_t>> ranges;
  for (const auto& c : clips) {
    auto it = ranges.find(c.group_id);
    if (it == ranges.end()) {
      ranges.emplace(c.group_id, std::make_pair(c.start_ms, c.end_ms));
    } else {
      it->second.first = std::min(it->second.first, c.start_ms);
      it->second.second = std::max(it->second.second, c.end_ms);
    }
  }

  for (const auto& o : overlays) {
    auto it = ranges.find(o.group_id);
    if (it == ranges.end()) {
      std::ostringstream detail;
      detail << "overlay references group " << o.group_id << " with no clips";
      return ValidationResult::Failure(detail.str());
    }
    if (o.start_ms < it->second.first || o.end_ms > it->second.second ||
        o.end_ms <= o.start_ms) {
      std::ostringstream detail;
      detail << "overlay [" << o.start_ms << ", " << o.end_ms << ") outside group "
             << o.group_id << " range [" << it->second.first << ", "
             << it->second.second << ")";
      return ValidationResult::Failure(detail.str());
    }
  }
  return ValidationResult::Success();
}

}  // namespace reelforge::timeline
