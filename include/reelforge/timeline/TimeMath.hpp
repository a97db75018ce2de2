// Repository: ReelForge
// Component: Timeline Time Math
// Purpose: The one place where timeline durations are rounded.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_TIMELINE_TIME_MATH_HPP_
#define REELFORGE_TIMELINE_TIME_MATH_HPP_

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace reelforge::timeline::time_math {

inline constexpr int64_t kMsPerSecond = 1000;
inline constexpr int64_t kMsPerTenth = 100;

// All durations are integer milliseconds. Allocator and Assembler round only
// through these helpers so Σ durations stays exact (no float accumulation).

// Round to 0.1 s (half away from zero).
inline int64_t RoundToTenthMs(double ms) {
  return static_cast<int64_t>(std::llround(ms / static_cast<double>(kMsPerTenth))) * kMsPerTenth;
}

// Round to whole seconds (half away from zero).
inline int64_t RoundToSecondMs(double ms) {
  return static_cast<int64_t>(std::llround(ms / static_cast<double>(kMsPerSecond))) * kMsPerSecond;
}

// Lower bound every slot at one second.
inline int64_t FloorAtOneSecond(int64_t ms) {
  return std::max<int64_t>(kMsPerSecond, ms);
}

// The combined "round to 1 decimal, floor at 1 second" step.
inline int64_t RoundTenthFloorSecond(double ms) {
  return FloorAtOneSecond(RoundToTenthMs(ms));
}

inline int64_t SecondsToMs(double seconds) {
  return static_cast<int64_t>(std::llround(seconds * static_cast<double>(kMsPerSecond)));
}

inline double MsToSeconds(int64_t ms) {
  return static_cast<double>(ms) / static_cast<double>(kMsPerSecond);
}

// Seconds rounded to one decimal, for display/wire fields.
inline double MsToSecondsOneDecimal(int64_t ms) {
  return static_cast<double>(RoundToTenthMs(static_cast<double>(ms))) /
         static_cast<double>(kMsPerSecond);
}

}  // namespace reelforge::timeline::time_math

#endif  // REELFORGE_TIMELINE_TIME_MATH_HPP_
