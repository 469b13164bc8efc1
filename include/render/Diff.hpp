#pragma once

#include "render/ScreenBuffer.hpp"
#include <cstddef>
#include <string>

namespace tessera::render {

struct DiffStats {
  bool size_changed{false};
  bool full_redraw{false};
  std::size_t changed_cells{0};
  std::size_t cursor_moves{0};
  std::size_t fg_changes{0};
  std::size_t bg_changes{0};
  std::size_t resets{0};
  std::size_t ops{0};
};

// Minimal byte stream turning `prev` into `next` on screen. Cells are
// scanned row-major; every changed cell gets an absolute cursor move, color
// codes are emitted only when the running pen differs, and one trailing
// reset closes the frame if any color code was written. Continuation cells
// and the bottom-right cell are never written. Mismatched dimensions redraw
// every cell. `stats` (optional) is overwritten and never alters the output.
[[nodiscard]] std::string render_diff(const ScreenBuffer& prev, const ScreenBuffer& next,
                                      DiffStats* stats = nullptr);

} // namespace tessera::render
