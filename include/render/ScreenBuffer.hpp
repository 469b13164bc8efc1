#pragma once

#include "render/Color.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tessera::render {

// Unset fields leave the existing cell color untouched.
struct CellStyle {
  std::optional<Color> fg;
  std::optional<Color> bg;
};

// Fixed rows x cols grid stored as parallel arrays. Width-2 glyphs are
// followed by a continuation cell (code 0, width 0) that shares their style.
class ScreenBuffer {
public:
  ScreenBuffer(int rows, int cols);

  [[nodiscard]] int rows() const noexcept { return rows_; }
  [[nodiscard]] int cols() const noexcept { return cols_; }
  [[nodiscard]] std::size_t size() const noexcept { return widths_.size(); }
  [[nodiscard]] std::size_t index(int row, int col) const noexcept {
    return static_cast<std::size_t>(row) * static_cast<std::size_t>(cols_) + static_cast<std::size_t>(col);
  }
  [[nodiscard]] bool same_size(const ScreenBuffer& o) const noexcept {
    return rows_ == o.rows_ && cols_ == o.cols_;
  }

  void clear();
  void clear_row(int row);

  // Writes the first grapheme cluster of `glyph`. Out-of-range positions and
  // clusters that would cross the last column are ignored.
  void set(int row, int col, std::string_view glyph, const CellStyle& style = {});
  void set_code_point(int row, int col, char32_t cp, const CellStyle& style = {});
  // Restyle one cell (and its continuation) without touching the glyph.
  void set_style(int row, int col, const CellStyle& style);

  [[nodiscard]] std::string glyph(std::size_t idx) const;
  void append_glyph(std::size_t idx, std::string& out) const;
  [[nodiscard]] bool same_glyph(std::size_t idx, const ScreenBuffer& other, std::size_t other_idx) const;
  [[nodiscard]] char32_t code(std::size_t idx) const { return codes_[idx]; }
  [[nodiscard]] std::uint8_t width(std::size_t idx) const { return widths_[idx]; }
  [[nodiscard]] const Color& fg(std::size_t idx) const { return fg_[idx]; }
  [[nodiscard]] const Color& bg(std::size_t idx) const { return bg_[idx]; }

  // Requires equal dimensions; throws std::invalid_argument otherwise.
  void copy_from(const ScreenBuffer& other);

private:
  void write_glyph(int row, int col, std::string_view glyph, char32_t first, bool multi,
                   int width, const CellStyle& style);
  void clear_wide_span(int row, int col);
  void clear_following_continuations(int row, int col);
  void blank(std::size_t idx);

  int rows_;
  int cols_;
  std::vector<char32_t> codes_;
  std::unordered_map<std::size_t, std::string> extras_;
  std::vector<std::uint8_t> widths_;
  std::vector<Color> fg_;
  std::vector<Color> bg_;
};

} // namespace tessera::render
