#include "render/Color.hpp"
#include <cctype>
#include <charconv>

namespace tessera::render {

namespace {

struct NamedColor { const char* name; int idx; };
constexpr NamedColor kNamed[] = {
  {"black", 0}, {"red", 1}, {"green", 2}, {"yellow", 3},
  {"blue", 4}, {"magenta", 5}, {"cyan", 6}, {"white", 7},
  {"gray", 8}, {"grey", 8},
  {"bright_black", 8}, {"bright_red", 9}, {"bright_green", 10}, {"bright_yellow", 11},
  {"bright_blue", 12}, {"bright_magenta", 13}, {"bright_cyan", 14}, {"bright_white", 15},
};

std::string sgr_code_int(int code) {
  return std::string("\x1B[") + std::to_string(code) + "m";
}

// base is 38 for foreground, 48 for background
std::string sgr_for(const Color& c, int base) {
  switch (c.kind) {
    case Color::Kind::Default:
      return sgr_code_int(base + 1);
    case Color::Kind::Named: {
      int idx = c.index();
      int first = base == 38 ? 30 : 40;
      if (idx <= 7) return sgr_code_int(first + idx);
      return sgr_code_int(first + 60 + (idx - 8));
    }
    case Color::Kind::Palette:
      return std::string("\x1B[") + std::to_string(base) + ";5;" + std::to_string(c.index()) + "m";
    case Color::Kind::Rgb:
      return std::string("\x1B[") + std::to_string(base) + ";2;" + std::to_string(c.r) + ";" +
             std::to_string(c.g) + ";" + std::to_string(c.b) + "m";
  }
  return {};
}

} // namespace

bool parse_hex_rgb(std::string_view hex, int& r, int& g, int& b) {
  if (hex.size()!=7 || hex[0] != '#') return false;
  auto hexv = [&](char c)->int{
    if (c>='0'&&c<='9') return c-'0';
    if (c>='a'&&c<='f') return c-'a'+10;
    if (c>='A'&&c<='F') return c-'A'+10;
    return -1;
  };
  int v1=hexv(hex[1]), v2=hexv(hex[2]), v3=hexv(hex[3]), v4=hexv(hex[4]), v5=hexv(hex[5]), v6=hexv(hex[6]);
  if (v1<0||v2<0||v3<0||v4<0||v5<0||v6<0) return false;
  r = v1*16+v2; g = v3*16+v4; b = v5*16+v6;
  return true;
}

std::optional<Color> parse_color(std::string_view s) {
  if (s.empty()) return std::nullopt;
  if (s[0] == '#') {
    int r, g, b;
    if (parse_hex_rgb(s, r, g, b)) return Color::rgb(r, g, b);
    return std::nullopt;
  }
  if (std::isdigit(static_cast<unsigned char>(s[0]))) {
    int idx = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), idx);
    if (ec != std::errc{} || ptr != s.data() + s.size() || idx > 255) return std::nullopt;
    return Color::palette(idx);
  }
  std::string lower(s);
  for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (lower == "default" || lower == "none") return Color::none();
  for (const auto& n : kNamed) {
    if (lower == n.name) return Color::named(n.idx);
  }
  return std::nullopt;
}

std::string sgr_fg(const Color& c) { return sgr_for(c, 38); }
std::string sgr_bg(const Color& c) { return sgr_for(c, 48); }
std::string sgr_reset() { return "\x1B[0m"; }

} // namespace tessera::render
