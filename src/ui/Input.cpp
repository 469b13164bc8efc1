#include "ui/Input.hpp"
#include "util/Grapheme.hpp"
#include <poll.h>
#include <algorithm>
#include <cctype>

namespace tessera::ui {

namespace {

KeyEvent make_key(std::string name, std::string_view seq) {
  KeyEvent k;
  k.name = std::move(name);
  k.sequence.assign(seq);
  return k;
}

// xterm modifier parameter: 1 + (shift | alt << 1 | ctrl << 2).
void apply_modifier(KeyEvent& k, int param) {
  if (param <= 1) return;
  const int bits = param - 1;
  k.shift = (bits & 1) != 0;
  k.meta = (bits & 2) != 0;
  k.ctrl = (bits & 4) != 0;
}

std::string tilde_key(int code) {
  switch (code) {
    case 1: case 7: return "home";
    case 2: return "insert";
    case 3: return "delete";
    case 4: case 8: return "end";
    case 5: return "pageup";
    case 6: return "pagedown";
    case 11: return "f1";
    case 12: return "f2";
    case 13: return "f3";
    case 14: return "f4";
    case 15: return "f5";
    case 17: return "f6";
    case 18: return "f7";
    case 19: return "f8";
    case 20: return "f9";
    case 21: return "f10";
    case 23: return "f11";
    case 24: return "f12";
    default: return "unknown";
  }
}

std::string final_key(char f) {
  switch (f) {
    case 'A': return "up";
    case 'B': return "down";
    case 'C': return "right";
    case 'D': return "left";
    case 'H': return "home";
    case 'F': return "end";
    case 'P': return "f1";
    case 'Q': return "f2";
    case 'R': return "f3";
    case 'S': return "f4";
    case 'Z': return "tab";
    default: return "unknown";
  }
}

// Decodes one non-escape key at `i`, advancing past it.
KeyEvent decode_plain(std::string_view b, std::size_t& i) {
  const auto c = static_cast<unsigned char>(b[i]);
  if (c == '\r' || c == '\n') return make_key("return", b.substr(i++, 1));
  if (c == '\t') return make_key("tab", b.substr(i++, 1));
  if (c == 0x7f || c == 0x08) return make_key("backspace", b.substr(i++, 1));
  if (c == ' ') return make_key("space", b.substr(i++, 1));
  if (c == 0x00) {
    auto k = make_key("space", b.substr(i++, 1));
    k.ctrl = true;
    return k;
  }
  if (c < 0x20) {
    // 0x01..0x1a are ctrl+a..ctrl+z; 0x1c..0x1f are ctrl+\ ] ^ _
    const char base = c <= 0x1a ? static_cast<char>('a' + c - 1) : static_cast<char>(c + 0x40);
    auto k = make_key(std::string(1, base), b.substr(i++, 1));
    k.ctrl = true;
    return k;
  }
  if (c < 0x80) {
    auto k = make_key(std::string(1, static_cast<char>(c)), b.substr(i++, 1));
    k.shift = std::isupper(c) != 0;
    return k;
  }
  std::size_t len = static_cast<std::size_t>(std::max(1, util::u8_len(c)));
  len = std::min(len, b.size() - i);
  auto k = make_key(std::string(b.substr(i, len)), b.substr(i, len));
  i += len;
  return k;
}

} // namespace

std::vector<KeyEvent> decode_keys(std::string_view b) {
  std::vector<KeyEvent> out;
  std::size_t i = 0;
  while (i < b.size()) {
    if (b[i] != '\x1b') {
      out.push_back(decode_plain(b, i));
      continue;
    }
    const std::size_t start = i;
    if (i + 1 >= b.size() || b[i + 1] == '\x1b') {
      out.push_back(make_key("escape", b.substr(i, 1)));
      ++i;
      continue;
    }

    const char intro = b[i + 1];
    if (intro == '[') {
      std::size_t j = i + 2;
      std::vector<int> params{0};
      while (j < b.size()) {
        const char ch = b[j];
        if (ch >= '0' && ch <= '9') {
          // Long digit runs saturate instead of overflowing.
          if (params.back() < 100000) params.back() = params.back() * 10 + (ch - '0');
        } else if (ch == ';') {
          params.push_back(0);
        } else {
          break;
        }
        ++j;
      }
      if (j >= b.size() || static_cast<unsigned char>(b[j]) < 0x40 || static_cast<unsigned char>(b[j]) > 0x7e) {
        out.push_back(make_key("escape", b.substr(i, 1)));
        ++i;
        continue;
      }
      const char fin = b[j];
      KeyEvent k = make_key(fin == '~' ? tilde_key(params.front()) : final_key(fin), b.substr(start, j + 1 - start));
      if (params.size() > 1) apply_modifier(k, params[1]);
      if (fin == 'Z') k.shift = true;
      out.push_back(std::move(k));
      i = j + 1;
      continue;
    }

    if (intro == 'O' && i + 2 < b.size()) {
      out.push_back(make_key(final_key(b[i + 2]), b.substr(start, 3)));
      i += 3;
      continue;
    }

    // ESC prefix is alt/meta on the following key.
    i += 1;
    KeyEvent k = decode_plain(b, i);
    k.meta = true;
    k.sequence.assign(b.substr(start, i - start));
    out.push_back(std::move(k));
  }
  return out;
}

bool has_input_available(int fd, int timeout_ms) {
  struct pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
  int to = std::clamp(timeout_ms, 0, 1000);
  int rv = ::poll(&pfd, 1, to);
  return rv > 0 && (pfd.revents & POLLIN);
}

} // namespace tessera::ui
