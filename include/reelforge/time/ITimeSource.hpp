// Repository: ReelForge
// Component: Time Source
// Purpose: Injectable wall clock for seek deadlines and run budgets.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_TIME_ITIME_SOURCE_HPP_
#define REELFORGE_TIME_ITIME_SOURCE_HPP_

#include <chrono>
#include <cstdint>

namespace reelforge::time {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
};

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowUtcMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
  }
};

}  // namespace reelforge::time

#endif  // REELFORGE_TIME_ITIME_SOURCE_HPP_
