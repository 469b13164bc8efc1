#pragma once

#include "render/ScreenBuffer.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tessera::render {

// Half-open cell region [row, row+height) x [col, col+width).
struct ClipRect {
  int row{0};
  int col{0};
  int height{0};
  int width{0};

  [[nodiscard]] bool contains_row(int r) const { return r >= row && r < row + height; }
};

struct CellSpec {
  std::optional<std::string> glyph;
  std::optional<Color> fg;
  std::optional<Color> bg;
};

// Draws clusters left to right, advancing max(width, 1) columns per cluster.
// A cluster that does not fit entirely inside the buffer (or clip) is skipped.
// Control characters take no cell.
void draw_text(ScreenBuffer& buf, int row, int col, std::string_view text,
               const CellStyle& style = {}, const std::optional<ClipRect>& clip = std::nullopt);

// Wide fill glyphs are replaced with a space.
void fill_rect(ScreenBuffer& buf, int row, int col, int width, int height,
               std::string_view glyph = " ", const CellStyle& style = {});

void set_cell(ScreenBuffer& buf, int row, int col, const CellSpec& cell);

[[nodiscard]] std::unique_ptr<ScreenBuffer> clone_buffer(const ScreenBuffer& buf);

} // namespace tessera::render
