#include "minitest.hpp"
#include "render/Color.hpp"
#include <string>

using tessera::render::Color;
using namespace tessera::render;

TEST(color_parse_names) {
  ASSERT_TRUE(parse_color("red") == Color::named(1));
  ASSERT_TRUE(parse_color("Bright_Blue") == Color::named(12));
  ASSERT_TRUE(parse_color("grey") == Color::named(8));
  ASSERT_TRUE(parse_color("default") == Color::none());
  ASSERT_TRUE(!parse_color("nope").has_value());
  ASSERT_TRUE(!parse_color("").has_value());
}

TEST(color_parse_palette_and_hex) {
  ASSERT_TRUE(parse_color("42") == Color::palette(42));
  ASSERT_TRUE(!parse_color("256").has_value());
  ASSERT_TRUE(parse_color("#ff8000") == Color::rgb(255, 128, 0));
  ASSERT_TRUE(!parse_color("#ff80").has_value());
  ASSERT_TRUE(!parse_color("#gg0000").has_value());
}

TEST(color_sgr_codes) {
  ASSERT_EQ(sgr_fg(Color::named(1)), std::string("\x1B[31m"));
  ASSERT_EQ(sgr_bg(Color::named(9)), std::string("\x1B[101m"));
  ASSERT_EQ(sgr_fg(Color::palette(200)), std::string("\x1B[38;5;200m"));
  ASSERT_EQ(sgr_bg(Color::rgb(1, 2, 3)), std::string("\x1B[48;2;1;2;3m"));
  ASSERT_EQ(sgr_fg(Color::none()), std::string("\x1B[39m"));
  ASSERT_EQ(sgr_bg(Color::none()), std::string("\x1B[49m"));
  ASSERT_EQ(sgr_reset(), std::string("\x1B[0m"));
}

TEST(color_constructors_clamp) {
  ASSERT_TRUE(Color::named(20) == Color::named(15));
  ASSERT_TRUE(Color::rgb(300, -1, 5) == Color::rgb(255, 0, 5));
}
