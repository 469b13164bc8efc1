#include "render/Draw.hpp"
#include "util/Grapheme.hpp"
#include <algorithm>

namespace tessera::render {

void draw_text(ScreenBuffer& buf, int row, int col, std::string_view text,
               const CellStyle& style, const std::optional<ClipRect>& clip) {
  if (row < 0 || row >= buf.rows() || buf.cols() == 0) return;
  int min_col = 0;
  int max_col = buf.cols();
  if (clip) {
    if (!clip->contains_row(row)) return;
    min_col = std::max(min_col, clip->col);
    max_col = std::min(max_col, clip->col + clip->width);
  }
  if (min_col >= max_col) return;

  bool ascii = std::all_of(text.begin(), text.end(),
                           [](char c) { return static_cast<unsigned char>(c) < 0x80; });
  int cur = col;
  // Controls take no cell, matching util::text_width.
  if (ascii) {
    for (char c : text) {
      const auto cp = static_cast<unsigned char>(c);
      if (cp < 0x20 || cp == 0x7F) continue;
      if (cur >= max_col) break;
      if (cur >= min_col) buf.set_code_point(row, cur, cp, style);
      ++cur;
    }
    return;
  }

  for (const auto& cluster : util::segment_graphemes(text)) {
    if (util::is_control(util::decode_utf8(cluster).front())) continue;
    const int w = std::max(util::grapheme_width(cluster), 1);
    if (cur >= max_col) break;
    if (cur >= min_col && cur + w <= max_col) buf.set(row, cur, cluster, style);
    cur += w;
  }
}

void fill_rect(ScreenBuffer& buf, int row, int col, int width, int height,
               std::string_view glyph, const CellStyle& style) {
  if (width <= 0 || height <= 0) return;

  std::string fill = " ";
  if (glyph.size() == 1 && static_cast<unsigned char>(glyph[0]) < 0x80) {
    fill.assign(glyph);
  } else if (!glyph.empty()) {
    auto clusters = util::segment_graphemes(glyph);
    if (!clusters.empty() && util::grapheme_width(clusters.front()) <= 1) fill = clusters.front();
  }

  const int max_row = std::min(buf.rows(), row + height);
  const int max_col = std::min(buf.cols(), col + width);
  for (int r = std::max(0, row); r < max_row; ++r) {
    for (int c = std::max(0, col); c < max_col; ++c) buf.set(r, c, fill, style);
  }
}

void set_cell(ScreenBuffer& buf, int row, int col, const CellSpec& cell) {
  if (row < 0 || row >= buf.rows() || col < 0 || col >= buf.cols()) return;
  if (cell.glyph) buf.set(row, col, *cell.glyph);
  if (cell.fg || cell.bg) buf.set_style(row, col, CellStyle{cell.fg, cell.bg});
}

std::unique_ptr<ScreenBuffer> clone_buffer(const ScreenBuffer& buf) {
  auto copy = std::make_unique<ScreenBuffer>(buf.rows(), buf.cols());
  copy->copy_from(buf);
  return copy;
}

} // namespace tessera::render
