#pragma once

#include "layout/Layout.hpp"
#include "render/ScreenBuffer.hpp"
#include "view/Element.hpp"

namespace tessera::layout {

// Paints `root` into `buf` using the rectangles in `layout`: background,
// outline, text, then children. Elements without a rectangle are skipped
// along with their subtree. Foreground colors inherit down the tree.
void rasterize(const view::Element& root, const ComputedLayout& layout, render::ScreenBuffer& buf);

} // namespace tessera::layout
