// Repository: ReelForge
// Component: Template Id Generator Implementation
// Copyright (c) 2025 ReelForge

#include "reelforge/pipeline/TemplateIdGenerator.hpp"

#include <cctype>

namespace reelforge::pipeline {

namespace {

constexpr char kPrefix[] = "tmpl_";
constexpr char kBase36[] = "0123456789abcdefghijklmnopqrstuvwxyz";

}  // namespace

TemplateIdGenerator::TemplateIdGenerator(const time::ITimeSource& clock)
    : clock_(clock), rng_(std::random_device{}()) {}

TemplateIdGenerator::TemplateIdGenerator(const time::ITimeSource& clock, uint64_t seed)
    : clock_(clock), rng_(seed) {}

std::string TemplateIdGenerator::Next() {
  std::string id = kPrefix;
  id += std::to_string(clock_.NowUtcMs());
  id += '_';

  std::lock_guard<std::mutex> lock(mutex_);
  std::uniform_int_distribution<int> digit(0, 35);
  for (size_t i = 0; i < kSuffixLength; ++i) {
    id += kBase36[digit(rng_)];
  }
  return id;
}

bool TemplateIdGenerator::IsWellFormed(const std::string& id) {
  const std::string prefix = kPrefix;
  if (id.compare(0, prefix.size(), prefix) != 0) return false;

  const size_t sep = id.find('_', prefix.size());
  if (sep == std::string::npos || sep == prefix.size()) return false;
  for (size_t i = prefix.size(); i < sep; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(id[i]))) return false;
  }

  const std::string suffix = id.substr(sep + 1);
  if (suffix.size() != kSuffixLength) return false;
  for (char c : suffix) {
    const bool base36 = std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'z');
    if (!base36) return false;
  }
  return true;
}

}  // namespace reelforge::pipeline
