// Repository: ReelForge
// Component: Template Id Generator
// Purpose: Opaque template ids of the form tmpl_<ms>_<9 base36 chars>
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_PIPELINE_TEMPLATE_ID_GENERATOR_HPP_
#define REELFORGE_PIPELINE_TEMPLATE_ID_GENERATOR_HPP_

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

#include "reelforge/time/ITimeSource.hpp"

namespace reelforge::pipeline {

class TemplateIdGenerator {
 public:
  static constexpr size_t kSuffixLength = 9;

  // Seeds from std::random_device.
  explicit TemplateIdGenerator(const time::ITimeSource& clock);

  // Fixed seed, for reproducible ids in tests.
  TemplateIdGenerator(const time::ITimeSource& clock, uint64_t seed);

  std::string Next();

  // True for strings of the form tmpl_<digits>_<kSuffixLength [0-9a-z]>.
  static bool IsWellFormed(const std::string& id);

 private:
  const time::ITimeSource& clock_;
  std::mutex mutex_;
  std::mt19937_64 rng_;
};

}  // namespace reelforge::pipeline

#endif  // REELFORGE_PIPELINE_TEMPLATE_ID_GENERATOR_HPP_
