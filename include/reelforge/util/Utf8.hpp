// Repository: ReelForge
// Component: UTF-8 Helpers
// Purpose: Code-point aware truncation and scanning for overlay text.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_UTIL_UTF8_HPP_
#define REELFORGE_UTIL_UTF8_HPP_

#include <cstddef>
#include <optional>
#include <string>

namespace reelforge::util {

// Number of code points in a UTF-8 string (continuation bytes are not counted).
size_t Utf8Length(const std::string& s);

// First `max_code_points` code points of `s`. Never splits a sequence.
std::string Utf8Truncate(const std::string& s, size_t max_code_points);

// Truncates to `max_code_points` and appends "..." when anything was cut.
std::string Utf8Ellipsize(const std::string& s, size_t max_code_points);

// First code point of `s` in one of the pictographic / dingbat blocks
// (U+1F300..U+1F9FF, U+2600..U+26FF, U+2700..U+27BF), returned as its UTF-8
// byte sequence.
std::optional<std::string> FirstEmoji(const std::string& s);

// Leading/trailing ASCII whitespace removed, internal runs collapsed to ' '.
std::string CollapseWhitespace(const std::string& s);

}  // namespace reelforge::util

#endif  // REELFORGE_UTIL_UTF8_HPP_
