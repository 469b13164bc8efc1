#include "render/Diff.hpp"
#include <charconv>

namespace tessera::render {

namespace {

void append_int(std::string& out, int v) {
  char buf[16];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, static_cast<std::size_t>(ptr - buf));
}

void append_cursor(std::string& out, int row, int col) {
  out += "\x1B[";
  append_int(out, row + 1);
  out.push_back(';');
  append_int(out, col + 1);
  out.push_back('H');
}

} // namespace

std::string render_diff(const ScreenBuffer& prev, const ScreenBuffer& next, DiffStats* stats) {
  const int rows = next.rows();
  const int cols = next.cols();
  const bool size_changed = !prev.same_size(next);

  if (stats) {
    *stats = DiffStats{};
    stats->size_changed = size_changed;
    stats->full_redraw = size_changed;
  }
  if (rows == 0 || cols == 0) return {};

  std::string out;
  Color pen_fg = Color::none();
  Color pen_bg = Color::none();
  bool style_dirty = false;

  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      const auto idx = next.index(r, c);
      const auto w = next.width(idx);
      if (w == 0) continue;
      // Writing the last cell can scroll some terminals; a wide glyph
      // ending there counts too.
      if (r == rows - 1 && c + w > cols - 1) continue;

      bool needs_draw = size_changed;
      if (!needs_draw) {
        needs_draw = prev.width(idx) != w || !next.same_glyph(idx, prev, idx) ||
                     !(prev.fg(idx) == next.fg(idx)) || !(prev.bg(idx) == next.bg(idx));
      }
      if (!needs_draw) continue;

      if (stats) {
        ++stats->changed_cells;
        ++stats->cursor_moves;
      }
      append_cursor(out, r, c);

      const Color& fg = next.fg(idx);
      if (!(fg == pen_fg)) {
        out += sgr_fg(fg);
        pen_fg = fg;
        style_dirty = true;
        if (stats) ++stats->fg_changes;
      }
      const Color& bg = next.bg(idx);
      if (!(bg == pen_bg)) {
        out += sgr_bg(bg);
        pen_bg = bg;
        style_dirty = true;
        if (stats) ++stats->bg_changes;
      }
      next.append_glyph(idx, out);
    }
  }

  if (style_dirty) {
    out += sgr_reset();
    if (stats) ++stats->resets;
  }
  if (stats) stats->ops = stats->cursor_moves + stats->fg_changes + stats->bg_changes + stats->resets;
  return out;
}

} // namespace tessera::render
