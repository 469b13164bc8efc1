#include "minitest.hpp"
#include "render/Diff.hpp"
#include "render/Draw.hpp"
#include <charconv>
#include <string>
#include <vector>

using namespace tessera::render;

namespace {

std::vector<int> sgr_params(std::string_view body) {
  std::vector<int> out;
  std::size_t start = 0;
  while (start <= body.size()) {
    auto semi = body.find(';', start);
    auto part = body.substr(start, semi == std::string_view::npos ? std::string_view::npos : semi - start);
    int v = 0;
    std::from_chars(part.data(), part.data() + part.size(), v);
    out.push_back(v);
    if (semi == std::string_view::npos) break;
    start = semi + 1;
  }
  return out;
}

void apply_sgr(const std::vector<int>& p, Color& fg, Color& bg) {
  for (std::size_t i = 0; i < p.size(); ++i) {
    const int code = p[i];
    if (code == 0) {
      fg = Color::none();
      bg = Color::none();
    } else if (code == 39) {
      fg = Color::none();
    } else if (code == 49) {
      bg = Color::none();
    } else if (code >= 30 && code <= 37) {
      fg = Color::named(code - 30);
    } else if (code >= 90 && code <= 97) {
      fg = Color::named(code - 90 + 8);
    } else if (code >= 40 && code <= 47) {
      bg = Color::named(code - 40);
    } else if (code >= 100 && code <= 107) {
      bg = Color::named(code - 100 + 8);
    } else if ((code == 38 || code == 48) && i + 1 < p.size()) {
      Color c;
      if (p[i + 1] == 5 && i + 2 < p.size()) {
        c = Color::palette(p[i + 2]);
        i += 2;
      } else if (p[i + 1] == 2 && i + 4 < p.size()) {
        c = Color::rgb(p[i + 2], p[i + 3], p[i + 4]);
        i += 4;
      }
      (code == 38 ? fg : bg) = c;
    }
  }
}

// Plays a frame's output onto `screen` the way a terminal would: cursor
// moves, SGR pen changes, and one glyph per move.
void replay(std::string_view out, ScreenBuffer& screen) {
  int row = 0, col = 0;
  Color fg, bg;
  std::size_t i = 0;
  while (i < out.size()) {
    if (out[i] == '\x1B') {
      std::size_t j = i + 2;
      while (j < out.size() && out[j] != 'H' && out[j] != 'm') ++j;
      if (j >= out.size()) break;
      const auto body = out.substr(i + 2, j - (i + 2));
      if (out[j] == 'H') {
        const auto semi = body.find(';');
        std::from_chars(body.data(), body.data() + semi, row);
        std::from_chars(body.data() + semi + 1, body.data() + body.size(), col);
        --row;
        --col;
      } else {
        apply_sgr(sgr_params(body), fg, bg);
      }
      i = j + 1;
      continue;
    }
    std::size_t j = out.find('\x1B', i);
    if (j == std::string_view::npos) j = out.size();
    screen.set(row, col, out.substr(i, j - i), CellStyle{fg, bg});
    i = j;
  }
}

// Every cell but the ones the diff never writes (the bottom-right corner and
// a wide glyph reaching it).
bool same_visible_cells(const ScreenBuffer& a, const ScreenBuffer& b) {
  if (!a.same_size(b)) return false;
  for (int r = 0; r < b.rows(); ++r) {
    for (int c = 0; c < b.cols(); ++c) {
      const auto idx = b.index(r, c);
      if (r == b.rows() - 1 && (c == b.cols() - 1 || c + b.width(idx) > b.cols() - 1)) continue;
      if (a.width(idx) != b.width(idx)) return false;
      if (b.width(idx) == 0) continue;
      if (!a.same_glyph(idx, b, idx)) return false;
      if (!(a.fg(idx) == b.fg(idx)) || !(a.bg(idx) == b.bg(idx))) return false;
    }
  }
  return true;
}

} // namespace

TEST(diff_identical_buffers_emit_nothing) {
  ScreenBuffer a(3, 4), b(3, 4);
  draw_text(a, 0, 0, "abc", CellStyle{Color::named(1), std::nullopt});
  draw_text(b, 0, 0, "abc", CellStyle{Color::named(1), std::nullopt});
  DiffStats s;
  ASSERT_EQ(render_diff(a, b, &s), std::string());
  ASSERT_EQ(s.changed_cells, 0u);
  ASSERT_EQ(s.ops, 0u);
}

TEST(diff_wide_glyph_is_one_cursor_move) {
  ScreenBuffer prev(1, 4), next(1, 4);
  next.set(0, 0, "雪");
  DiffStats s;
  auto out = render_diff(prev, next, &s);
  ASSERT_EQ(out, std::string("\x1B[1;1H雪"));
  ASSERT_EQ(s.cursor_moves, 1u);
}

TEST(diff_skips_bottom_right_cell) {
  ScreenBuffer prev(2, 2), next(2, 2);
  next.set(1, 1, "z");
  ASSERT_EQ(render_diff(prev, next), std::string());
}

TEST(diff_skips_wide_glyph_reaching_bottom_right) {
  ScreenBuffer prev(1, 4), next(1, 4);
  next.set(0, 2, "雪");
  ASSERT_EQ(next.width(next.index(0, 2)), 2);
  ASSERT_EQ(render_diff(prev, next), std::string());

  ScreenBuffer tall_prev(2, 4), tall_next(2, 4);
  tall_next.set(0, 2, "雪");
  ASSERT_EQ(render_diff(tall_prev, tall_next), std::string("\x1B[1;3H雪"));
}

TEST(diff_colors_only_on_pen_change) {
  ScreenBuffer prev(2, 4), next(2, 4);
  draw_text(next, 0, 0, "ab", CellStyle{Color::named(1), std::nullopt});
  DiffStats s;
  auto out = render_diff(prev, next, &s);
  ASSERT_EQ(out, std::string("\x1B[1;1H\x1B[31ma\x1B[1;2Hb\x1B[0m"));
  ASSERT_EQ(s.fg_changes, 1u);
  ASSERT_EQ(s.bg_changes, 0u);
  ASSERT_EQ(s.resets, 1u);
  ASSERT_EQ(s.ops, 4u);
}

TEST(diff_style_only_change_redraws_cell) {
  ScreenBuffer prev(2, 2), next(2, 2);
  next.set_style(0, 0, CellStyle{std::nullopt, Color::named(4)});
  auto out = render_diff(prev, next);
  ASSERT_EQ(out, std::string("\x1B[1;1H\x1B[44m \x1B[0m"));
}

TEST(diff_size_change_redraws_everything) {
  ScreenBuffer prev(0, 0), next(2, 2);
  DiffStats s;
  auto out = render_diff(prev, next, &s);
  ASSERT_TRUE(s.size_changed);
  ASSERT_TRUE(s.full_redraw);
  ASSERT_EQ(s.changed_cells, 3u);
  ASSERT_EQ(out, std::string("\x1B[1;1H \x1B[1;2H \x1B[2;1H "));
}

TEST(diff_applying_output_twice_is_idempotent) {
  ScreenBuffer prev(2, 5), next(2, 5);
  draw_text(next, 0, 1, "hey", CellStyle{Color::named(2), Color::named(0)});
  (void)render_diff(prev, next);
  prev.copy_from(next);
  ASSERT_EQ(render_diff(prev, next), std::string());
}

TEST(diff_replayed_output_reproduces_next) {
  ScreenBuffer prev(3, 6), next(3, 6);
  draw_text(prev, 0, 0, "hello", CellStyle{Color::named(1), std::nullopt});
  draw_text(prev, 1, 0, "雪ab", {});
  draw_text(next, 0, 0, "h雪lo", CellStyle{Color::named(12), Color::palette(200)});
  draw_text(next, 1, 0, "xy雪", CellStyle{Color::rgb(1, 2, 3), std::nullopt});
  draw_text(next, 2, 0, "tail", {});

  auto screen = clone_buffer(prev);
  replay(render_diff(prev, next), *screen);
  ASSERT_TRUE(same_visible_cells(*screen, next));
}

TEST(diff_replayed_resize_reproduces_next) {
  ScreenBuffer prev(1, 3), next(3, 5);
  draw_text(prev, 0, 0, "old", {});
  draw_text(next, 0, 0, "雪山x", CellStyle{Color::named(3), Color::named(8)});
  draw_text(next, 1, 1, "mid", {});
  draw_text(next, 2, 0, "end", CellStyle{std::nullopt, Color::named(4)});

  ScreenBuffer screen(3, 5);
  DiffStats s;
  replay(render_diff(prev, next, &s), screen);
  ASSERT_TRUE(s.full_redraw);
  ASSERT_TRUE(same_visible_cells(screen, next));
}

TEST(diff_empty_next_emits_nothing) {
  ScreenBuffer prev(2, 2), next(0, 0);
  DiffStats s;
  ASSERT_EQ(render_diff(prev, next, &s), std::string());
  ASSERT_TRUE(s.size_changed);
}
