#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tessera::render {

// Cell color. Named covers the 16 ANSI slots (30-37 / 90-97), Palette the
// 256-color cube, Rgb truecolor. Default means "terminal default".
struct Color {
  enum class Kind : std::uint8_t { Default, Named, Palette, Rgb };

  Kind kind{Kind::Default};
  std::uint8_t r{0};
  std::uint8_t g{0};
  std::uint8_t b{0};

  static constexpr Color none() { return Color{}; }
  static constexpr Color named(int idx) {
    return Color{Kind::Named, static_cast<std::uint8_t>(idx < 0 ? 0 : idx > 15 ? 15 : idx), 0, 0};
  }
  static constexpr Color palette(int idx) {
    return Color{Kind::Palette, static_cast<std::uint8_t>(idx < 0 ? 0 : idx > 255 ? 255 : idx), 0, 0};
  }
  static constexpr Color rgb(int rr, int gg, int bb) {
    auto c = [](int v) { return static_cast<std::uint8_t>(v < 0 ? 0 : v > 255 ? 255 : v); };
    return Color{Kind::Rgb, c(rr), c(gg), c(bb)};
  }

  [[nodiscard]] constexpr bool is_default() const { return kind == Kind::Default; }
  [[nodiscard]] constexpr int index() const { return r; }

  friend constexpr bool operator==(const Color&, const Color&) = default;
};

// Named colors ("red", "bright_blue", "gray"), decimal palette indices, "#RRGGBB".
[[nodiscard]] std::optional<Color> parse_color(std::string_view s);
bool parse_hex_rgb(std::string_view hex, int& r, int& g, int& b);

// SGR sequences; Default maps to 39 / 49.
[[nodiscard]] std::string sgr_fg(const Color& c);
[[nodiscard]] std::string sgr_bg(const Color& c);
[[nodiscard]] std::string sgr_reset();

} // namespace tessera::render
