#include "render/ScreenBuffer.hpp"
#include "util/Grapheme.hpp"
#include <algorithm>
#include <stdexcept>

namespace tessera::render {

namespace {
constexpr char32_t kSpace = U' ';
}

ScreenBuffer::ScreenBuffer(int rows, int cols)
    : rows_(std::max(0, rows)), cols_(std::max(0, cols)) {
  const auto n = static_cast<std::size_t>(rows_) * static_cast<std::size_t>(cols_);
  codes_.assign(n, kSpace);
  widths_.assign(n, 1);
  fg_.assign(n, Color::none());
  bg_.assign(n, Color::none());
}

void ScreenBuffer::clear() {
  std::fill(codes_.begin(), codes_.end(), kSpace);
  std::fill(widths_.begin(), widths_.end(), std::uint8_t{1});
  std::fill(fg_.begin(), fg_.end(), Color::none());
  std::fill(bg_.begin(), bg_.end(), Color::none());
  extras_.clear();
}

void ScreenBuffer::clear_row(int row) {
  if (row < 0 || row >= rows_) return;
  for (int c = 0; c < cols_; ++c) blank(index(row, c));
}

void ScreenBuffer::blank(std::size_t idx) {
  extras_.erase(idx);
  codes_[idx] = kSpace;
  widths_[idx] = 1;
  fg_[idx] = Color::none();
  bg_[idx] = Color::none();
}

void ScreenBuffer::set(int row, int col, std::string_view glyph, const CellStyle& style) {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return;

  // ASCII fast path
  if (glyph.size() == 1 && static_cast<unsigned char>(glyph[0]) < 0x80) {
    auto c = static_cast<unsigned char>(glyph[0]);
    char32_t cp = util::is_control(c) ? kSpace : c;
    write_glyph(row, col, {}, cp, false, 1, style);
    return;
  }

  auto clusters = util::segment_graphemes(glyph);
  if (clusters.empty()) {
    write_glyph(row, col, {}, kSpace, false, 1, style);
    return;
  }
  const std::string& cluster = clusters.front();
  auto cps = util::decode_utf8(cluster);
  if (util::is_control(cps.front())) {
    write_glyph(row, col, {}, kSpace, false, 1, style);
    return;
  }
  int w = std::max(util::grapheme_width(cluster), 1);
  write_glyph(row, col, cluster, cps.front(), cps.size() > 1, w, style);
}

void ScreenBuffer::set_code_point(int row, int col, char32_t cp, const CellStyle& style) {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return;
  if (util::is_control(cp)) cp = kSpace;
  write_glyph(row, col, {}, cp, false, 1, style);
}

void ScreenBuffer::set_style(int row, int col, const CellStyle& style) {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return;
  auto idx = index(row, col);
  if (widths_[idx] == 0) {
    // Restyle through the owning wide cell
    int base = col;
    while (base > 0 && widths_[index(row, base)] == 0) --base;
    set_style(row, base, style);
    return;
  }
  int w = widths_[idx];
  for (int k = 0; k < w && col + k < cols_; ++k) {
    auto i = index(row, col + k);
    if (style.fg) fg_[i] = *style.fg;
    if (style.bg) bg_[i] = *style.bg;
  }
}

void ScreenBuffer::write_glyph(int row, int col, std::string_view glyph, char32_t first, bool multi,
                               int width, const CellStyle& style) {
  if (col + width > cols_) return;

  const auto idx = index(row, col);
  if (widths_[idx] == 0) clear_wide_span(row, col);
  clear_following_continuations(row, col);

  if (multi) extras_[idx] = std::string(glyph);
  else extras_.erase(idx);
  codes_[idx] = first;
  widths_[idx] = static_cast<std::uint8_t>(width);
  if (style.fg) fg_[idx] = *style.fg;
  if (style.bg) bg_[idx] = *style.bg;

  for (int off = 1; off < width; ++off) {
    const auto cont = index(row, col + off);
    // A wide glyph under the continuation slot loses its tail
    if (widths_[cont] > 1) {
      for (int k = 1; k < widths_[cont] && col + off + k < cols_; ++k) blank(index(row, col + off + k));
    }
    extras_.erase(cont);
    codes_[cont] = 0;
    widths_[cont] = 0;
    fg_[cont] = fg_[idx];
    bg_[cont] = bg_[idx];
  }
}

void ScreenBuffer::clear_wide_span(int row, int col) {
  int base_col = col - 1;
  while (base_col >= 0 && widths_[index(row, base_col)] == 0) --base_col;
  if (base_col < 0) return;
  const auto base_idx = index(row, base_col);
  const int span = widths_[base_idx];
  if (span <= 1) return;
  for (int off = 0; off < span && base_col + off < cols_; ++off) blank(index(row, base_col + off));
}

void ScreenBuffer::clear_following_continuations(int row, int col) {
  for (int c = col + 1; c < cols_; ++c) {
    const auto idx = index(row, c);
    if (widths_[idx] != 0) break;
    blank(idx);
  }
}

std::string ScreenBuffer::glyph(std::size_t idx) const {
  std::string out;
  append_glyph(idx, out);
  return out;
}

void ScreenBuffer::append_glyph(std::size_t idx, std::string& out) const {
  if (widths_[idx] == 0) return;
  if (auto it = extras_.find(idx); it != extras_.end()) {
    out += it->second;
    return;
  }
  char32_t cp = codes_[idx];
  if (cp == 0) cp = kSpace;
  if (cp < 0x80) out.push_back(static_cast<char>(cp));
  else util::append_utf8(out, cp);
}

bool ScreenBuffer::same_glyph(std::size_t idx, const ScreenBuffer& other, std::size_t other_idx) const {
  auto a = extras_.find(idx);
  auto b = other.extras_.find(other_idx);
  const bool a_multi = a != extras_.end();
  const bool b_multi = b != other.extras_.end();
  if (a_multi != b_multi) return false;
  if (a_multi) return a->second == b->second;
  return codes_[idx] == other.codes_[other_idx];
}

void ScreenBuffer::copy_from(const ScreenBuffer& other) {
  if (!same_size(other)) {
    throw std::invalid_argument("ScreenBuffer::copy_from: dimension mismatch");
  }
  codes_ = other.codes_;
  widths_ = other.widths_;
  fg_ = other.fg_;
  bg_ = other.bg_;
  extras_ = other.extras_;
}

} // namespace tessera::render
