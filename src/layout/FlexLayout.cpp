#include "layout/FlexLayout.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace tessera::layout {

namespace {

using view::Align;
using view::Dimension;
using view::Direction;
using view::Justify;

int resolve(const Dimension& d, int parent, int fallback) {
  switch (d.unit) {
    case Dimension::Unit::Auto: return fallback;
    case Dimension::Unit::Cells: return static_cast<int>(std::lround(d.value));
    case Dimension::Unit::Percent: return static_cast<int>(std::floor(parent * d.value / 100.0));
  }
  return fallback;
}

int clamp_dim(int v, const Dimension& min, const Dimension& max, int parent) {
  if (!max.is_auto()) v = std::min(v, resolve(max, parent, v));
  if (!min.is_auto()) v = std::max(v, resolve(min, parent, v));
  return std::max(0, v);
}

bool is_row(Direction d) { return d == Direction::Row || d == Direction::RowReverse; }
bool is_reverse(Direction d) { return d == Direction::RowReverse || d == Direction::ColumnReverse; }

Rect inner_rect(const LayoutNode& node, const Rect& rect) {
  auto in = content_insets(node.style);
  return Rect{rect.x + in.left, rect.y + in.top, std::max(0, rect.width - in.horizontal()),
              std::max(0, rect.height - in.vertical())};
}

int align_offset(Align a, int space, int size) {
  const int slack = std::max(0, space - size);
  switch (a) {
    case Align::Center: return slack / 2;
    case Align::End: return slack;
    case Align::Start:
    case Align::Stretch: return 0;
  }
  return 0;
}

void layout_children(const LayoutNode& node, const Rect& rect, ComputedLayout& out);

void layout_overlay(const LayoutNode& node, const Rect& inner, ComputedLayout& out) {
  const auto& s = node.style;
  const Size avail{inner.width, inner.height};
  for (const auto& c : node.children) {
    const auto& cs = c.style;
    Size m = measure_node(c, avail);
    const int avail_w = std::max(0, inner.width - cs.margin.horizontal());
    const int avail_h = std::max(0, inner.height - cs.margin.vertical());
    int w = (cs.width.is_auto() && s.align == Align::Stretch)
                ? clamp_dim(avail_w, cs.min_width, cs.max_width, inner.width)
                : m.width;
    int h = (cs.height.is_auto() && s.align == Align::Stretch)
                ? clamp_dim(avail_h, cs.min_height, cs.max_height, inner.height)
                : m.height;
    Rect r{inner.x + cs.margin.left + align_offset(s.align, avail_w, w),
           inner.y + cs.margin.top + align_offset(s.align, avail_h, h), w, h};
    out[c.key] = r;
    layout_children(c, r, out);
  }
}

struct Item {
  const LayoutNode* node;
  int main;
  int cross;
  int margin_main_start;
  int margin_main_end;
  int margin_cross_start;
  int margin_cross_end;
};

void layout_flex(const LayoutNode& node, const Rect& inner, ComputedLayout& out) {
  const auto& s = node.style;
  const bool row = is_row(s.direction);
  const int main_size = row ? inner.width : inner.height;
  const int cross_size = row ? inner.height : inner.width;
  const Size avail{inner.width, inner.height};
  const int n = static_cast<int>(node.children.size());

  std::vector<Item> items;
  items.reserve(node.children.size());
  for (const auto& c : node.children) {
    const auto& cs = c.style;
    Size m = measure_node(c, avail);
    Item it{};
    it.node = &c;
    it.margin_main_start = row ? cs.margin.left : cs.margin.top;
    it.margin_main_end = row ? cs.margin.right : cs.margin.bottom;
    it.margin_cross_start = row ? cs.margin.top : cs.margin.left;
    it.margin_cross_end = row ? cs.margin.bottom : cs.margin.right;
    it.main = row ? m.width : m.height;
    const Dimension& cross_dim = row ? cs.height : cs.width;
    if (cross_dim.is_auto() && s.align == Align::Stretch) {
      const int cross_avail = std::max(0, cross_size - it.margin_cross_start - it.margin_cross_end);
      it.cross = row ? clamp_dim(cross_avail, cs.min_height, cs.max_height, cross_size)
                     : clamp_dim(cross_avail, cs.min_width, cs.max_width, cross_size);
    } else {
      it.cross = row ? m.height : m.width;
    }
    items.push_back(it);
  }

  const int gaps = n > 1 ? s.gap * (n - 1) : 0;
  auto used_space = [&] {
    int used = gaps;
    for (const auto& it : items) used += it.main + it.margin_main_start + it.margin_main_end;
    return used;
  };

  const int free = main_size - used_space();
  if (free > 0) {
    double total_grow = 0.0;
    for (const auto& it : items) total_grow += it.node->style.grow;
    if (total_grow > 0.0) {
      int given = 0;
      int last = -1;
      for (int i = 0; i < n; ++i) {
        const double g = items[i].node->style.grow;
        if (g <= 0.0) continue;
        const int add = static_cast<int>(std::floor(free * g / total_grow));
        items[i].main += add;
        given += add;
        last = i;
      }
      items[last].main += free - given;
    }
  } else if (free < 0) {
    double total = 0.0;
    for (const auto& it : items) total += it.node->style.shrink * it.main;
    if (total > 0.0) {
      const int deficit = -free;
      int taken = 0;
      for (auto& it : items) {
        const double w = it.node->style.shrink * it.main;
        if (w <= 0.0) continue;
        const int cut = std::min(it.main, static_cast<int>(std::floor(deficit * w / total)));
        it.main -= cut;
        taken += cut;
      }
      // Rounding leftovers come off the trailing shrinkable items.
      int rest = deficit - taken;
      for (int i = n - 1; i >= 0 && rest > 0; --i) {
        if (items[i].node->style.shrink <= 0.0) continue;
        const int cut = std::min(rest, items[i].main);
        items[i].main -= cut;
        rest -= cut;
      }
    }
  }

  for (auto& it : items) {
    const auto& cs = it.node->style;
    it.main = row ? clamp_dim(it.main, cs.min_width, cs.max_width, main_size)
                  : clamp_dim(it.main, cs.min_height, cs.max_height, main_size);
  }

  const int remaining = std::max(0, main_size - used_space());
  int offset = 0;
  int extra = 0;
  int extra_rem = 0;
  switch (s.justify) {
    case Justify::Start: break;
    case Justify::Center: offset = remaining / 2; break;
    case Justify::End: offset = remaining; break;
    case Justify::SpaceBetween:
      if (n > 1) {
        extra = remaining / (n - 1);
        extra_rem = remaining % (n - 1);
      }
      break;
  }

  const bool reverse = is_reverse(s.direction);
  int pos = offset;
  for (int i = 0; i < n; ++i) {
    auto& it = items[i];
    pos += it.margin_main_start;
    const int start = pos;
    pos += it.main + it.margin_main_end;
    if (i + 1 < n) pos += s.gap + extra + (i < extra_rem ? 1 : 0);

    const int main_pos = reverse ? main_size - start - it.main : start;
    const int cross_space = cross_size - it.margin_cross_start - it.margin_cross_end;
    const int cross_pos = it.margin_cross_start + align_offset(s.align, cross_space, it.cross);
    Rect r = row ? Rect{inner.x + main_pos, inner.y + cross_pos, it.main, it.cross}
                 : Rect{inner.x + cross_pos, inner.y + main_pos, it.cross, it.main};
    out[it.node->key] = r;
    layout_children(*it.node, r, out);
  }
}

void layout_children(const LayoutNode& node, const Rect& rect, ComputedLayout& out) {
  if (node.children.empty()) return;
  const Rect inner = inner_rect(node, rect);
  if (node.style.stack) layout_overlay(node, inner, out);
  else layout_flex(node, inner, out);
}

} // namespace

Size measure_node(const LayoutNode& node, Size available) {
  const auto& s = node.style;
  const auto in = content_insets(s);
  Size content;
  if (node.measured) {
    content = *node.measured;
  } else {
    const Size inner{std::max(0, available.width - in.horizontal()), std::max(0, available.height - in.vertical())};
    const bool row = is_row(s.direction);
    for (std::size_t i = 0; i < node.children.size(); ++i) {
      const auto& c = node.children[i];
      const Size cs = measure_node(c, inner);
      const int cw = cs.width + c.style.margin.horizontal();
      const int ch = cs.height + c.style.margin.vertical();
      if (s.stack) {
        content.width = std::max(content.width, cw);
        content.height = std::max(content.height, ch);
      } else if (row) {
        content.width += cw + (i > 0 ? s.gap : 0);
        content.height = std::max(content.height, ch);
      } else {
        content.height += ch + (i > 0 ? s.gap : 0);
        content.width = std::max(content.width, cw);
      }
    }
  }
  Size out{content.width + in.horizontal(), content.height + in.vertical()};
  out.width = clamp_dim(resolve(s.width, available.width, out.width), s.min_width, s.max_width, available.width);
  out.height =
      clamp_dim(resolve(s.height, available.height, out.height), s.min_height, s.max_height, available.height);
  return out;
}

ComputedLayout FlexLayoutEngine::compute(const LayoutNode& root, Size viewport) {
  if (!ready_) {
    throw LayoutError(LayoutError::Kind::NotInitialized, "layout: engine not initialized; call initialize() first");
  }
  if (viewport.width < 0 || viewport.height < 0) {
    throw LayoutError(LayoutError::Kind::InvalidInput, "layout: negative viewport");
  }
  validate_tree(root);

  const auto& s = root.style;
  const int w = clamp_dim(resolve(s.width, viewport.width, viewport.width - s.margin.horizontal()), s.min_width,
                          s.max_width, viewport.width);
  const int h = clamp_dim(resolve(s.height, viewport.height, viewport.height - s.margin.vertical()),
                          s.min_height, s.max_height, viewport.height);

  ComputedLayout out;
  out.reserve(count_nodes(root));
  const Rect r{s.margin.left, s.margin.top, w, h};
  out[root.key] = r;
  layout_children(root, r, out);
  return out;
}

} // namespace tessera::layout
