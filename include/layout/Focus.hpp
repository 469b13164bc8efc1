#pragma once

#include "layout/Layout.hpp"
#include "view/Element.hpp"
#include <string>
#include <vector>

namespace tessera::layout {

struct FocusTarget {
  std::string focus_key;
  // Layout key of the element carrying the focus key.
  std::string key;
  Rect rect;
};

// Elements with a focus key, in tree order, with their rectangles from
// `layout`. An element without a rectangle is skipped with its subtree.
[[nodiscard]] std::vector<FocusTarget> collect_focus_targets(const view::Element& root, const ComputedLayout& layout);

} // namespace tessera::layout
