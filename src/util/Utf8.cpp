// Repository: ReelForge
// Component: UTF-8 Helpers Implementation
// Copyright (c) 2025 ReelForge

#include "reelforge/util/Utf8.hpp"

#include <cctype>

namespace reelforge::util {

namespace {

bool IsContinuation(unsigned char c) { return (c & 0xC0) == 0x80; }

// Byte length of the sequence introduced by lead byte `c`; 1 for invalid leads
// so malformed input still advances.
size_t SequenceLength(unsigned char c) {
  if (c < 0x80) return 1;
  if ((c & 0xE0) == 0xC0) return 2;
  if ((c & 0xF0) == 0xE0) return 3;
  if ((c & 0xF8) == 0xF0) return 4;
  return 1;
}

bool IsEmojiCodePoint(char32_t cp) {
  return (cp >= 0x1F300 && cp <= 0x1F9FF) ||
         (cp >= 0x2600 && cp <= 0x26FF) ||
         (cp >= 0x2700 && cp <= 0x27BF);
}

}  // namespace

size_t Utf8Length(const std::string& s) {
  size_t n = 0;
  for (unsigned char c : s) {
    if (!IsContinuation(c)) ++n;
  }
  return n;
}

std::string Utf8Truncate(const std::string& s, size_t max_code_points) {
  size_t count = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if (IsContinuation(static_cast<unsigned char>(s[i]))) continue;
    if (count == max_code_points) return s.substr(0, i);
    ++count;
  }
  return s;
}

std::string Utf8Ellipsize(const std::string& s, size_t max_code_points) {
  if (Utf8Length(s) <= max_code_points) return s;
  return Utf8Truncate(s, max_code_points) + "...";
}

std::optional<std::string> FirstEmoji(const std::string& s) {
  size_t i = 0;
  while (i < s.size()) {
    const unsigned char lead = static_cast<unsigned char>(s[i]);
    const size_t len = SequenceLength(lead);
    if (len == 1 || i + len > s.size()) {
      ++i;
      continue;
    }
    char32_t cp = lead & (0xFF >> (len + 1));
    bool valid = true;
    for (size_t k = 1; k < len; ++k) {
      const unsigned char c = static_cast<unsigned char>(s[i + k]);
      if (!IsContinuation(c)) {
        valid = false;
        break;
      }
      cp = (cp << 6) | (c & 0x3F);
    }
    if (valid && IsEmojiCodePoint(cp)) {
      return s.substr(i, len);
    }
    i += valid ? len : 1;
  }
  return std::nullopt;
}

std::string CollapseWhitespace(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  bool pending_space = false;
  for (char ch : s) {
    if (std::isspace(static_cast<unsigned char>(ch))) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) out.push_back(' ');
    pending_space = false;
    out.push_back(ch);
  }
  return out;
}

}  // namespace reelforge::util
