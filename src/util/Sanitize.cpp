#include "util/Sanitize.hpp"

namespace tessera::util {

namespace {

bool is_stripped_control(unsigned char c) {
  if (c == '\t' || c == '\n' || c == '\r') return false;
  return c < 0x20 || c == 0x7F;
}

// Length of the escape sequence starting at s[i] (s[i] == ESC).
std::size_t escape_len(std::string_view s, std::size_t i) {
  std::size_t j = i + 1;
  if (j >= s.size()) return 1;
  if (s[j] == '[') {
    ++j;
    while (j < s.size() && (static_cast<unsigned char>(s[j]) < 0x40 || static_cast<unsigned char>(s[j]) > 0x7E)) ++j;
    return (j < s.size() ? j + 1 : j) - i;
  }
  if (s[j] == ']') {
    ++j;
    while (j < s.size()) {
      if (s[j] == '\x07') return j + 1 - i;
      if (s[j] == '\x1B' && j + 1 < s.size() && s[j + 1] == '\\') return j + 2 - i;
      ++j;
    }
    return j - i;
  }
  return 2;
}

} // namespace

std::string strip_ansi(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size();) {
    if (s[i] == '\x1B' && i + 1 < s.size() && (s[i + 1] == '[' || s[i + 1] == ']')) {
      i += escape_len(s, i);
      continue;
    }
    out.push_back(s[i++]);
  }
  return out;
}

std::string strip_control(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (!is_stripped_control(static_cast<unsigned char>(c))) out.push_back(c);
  }
  return out;
}

std::string sanitize_text(std::string_view s) {
  return strip_control(strip_ansi(s));
}

bool is_safe_text(std::string_view s) {
  for (char c : s) {
    if (is_stripped_control(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

} // namespace tessera::util
