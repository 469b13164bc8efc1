#include "layout/Layout.hpp"
#include "util/Grapheme.hpp"
#include "util/Sanitize.hpp"
#include <algorithm>
#include <climits>
#include <cmath>

namespace tessera::layout {

namespace {

void check_dimension(const view::Dimension& d, const std::string& key, const char* field) {
  if (d.is_auto()) return;
  if (!std::isfinite(d.value) || d.value < 0.0) {
    throw LayoutError(LayoutError::Kind::InvalidInput,
                      "layout: invalid " + std::string(field) + " on node '" + key + "'");
  }
}

void check_edges(const view::Edges& e, const std::string& key, const char* field) {
  if (e.top < 0 || e.right < 0 || e.bottom < 0 || e.left < 0) {
    throw LayoutError(LayoutError::Kind::InvalidInput,
                      "layout: negative " + std::string(field) + " on node '" + key + "'");
  }
}

Size measure_text(const view::TextElement& t) {
  const auto& s = t.style;
  int limit = INT_MAX / 2;
  if (s.width.unit == view::Dimension::Unit::Cells && std::isfinite(s.width.value)) {
    auto in = content_insets(s);
    limit = std::max(1, static_cast<int>(s.width.value) - in.horizontal());
  }
  Size out;
  for (const auto& line : text_lines(t.content, limit)) {
    out.width = std::max(out.width, util::text_width(line));
    ++out.height;
  }
  return out;
}

LayoutNode build(view::Element& el, const std::string& key) {
  if (el.key().empty()) el.key(key);
  LayoutNode node;
  node.key = el.key();
  node.kind = el.kind();
  node.style = el.style();
  el.visit(view::overloaded{
      [&](view::TextElement& t) {
        t.content = display_text(t.content);
        node.measured = measure_text(t);
      },
      [&](view::BlockElement& b) {
        node.children.reserve(b.children.size());
        for (std::size_t i = 0; i < b.children.size(); ++i) {
          auto& child = b.children[i];
          std::string child_key = node.key + "/" + std::string(view::kind_name(child.kind())) + "-" +
                                  std::to_string(i);
          node.children.push_back(build(child, child_key));
        }
      },
  });
  return node;
}

} // namespace

LayoutNode build_layout_tree(view::Element& root) { return build(root, "root"); }

void validate_tree(const LayoutNode& root) {
  const auto& s = root.style;
  check_dimension(s.width, root.key, "width");
  check_dimension(s.height, root.key, "height");
  check_dimension(s.min_width, root.key, "min_width");
  check_dimension(s.min_height, root.key, "min_height");
  check_dimension(s.max_width, root.key, "max_width");
  check_dimension(s.max_height, root.key, "max_height");
  check_edges(s.padding, root.key, "padding");
  check_edges(s.margin, root.key, "margin");
  if (s.gap < 0) {
    throw LayoutError(LayoutError::Kind::InvalidInput, "layout: negative gap on node '" + root.key + "'");
  }
  if (!std::isfinite(s.grow) || s.grow < 0.0 || !std::isfinite(s.shrink) || s.shrink < 0.0) {
    throw LayoutError(LayoutError::Kind::InvalidInput,
                      "layout: invalid grow/shrink on node '" + root.key + "'");
  }
  if (root.measured && (root.measured->width < 0 || root.measured->height < 0)) {
    throw LayoutError(LayoutError::Kind::InvalidInput,
                      "layout: negative measured size on node '" + root.key + "'");
  }
  for (const auto& c : root.children) validate_tree(c);
}

std::size_t count_nodes(const LayoutNode& root) {
  std::size_t n = 1;
  for (const auto& c : root.children) n += count_nodes(c);
  return n;
}

std::string display_text(std::string_view content) {
  std::string out;
  out.reserve(content.size());
  for (std::size_t i = 0; i < content.size(); ++i) {
    const char c = content[i];
    if (c == '\t') {
      out.push_back(' ');
    } else if (c == '\r') {
      if (i + 1 < content.size() && content[i + 1] == '\n') ++i;
      out.push_back('\n');
    } else {
      out.push_back(c);
    }
  }
  // Tabs and returns are already gone; this drops the escapes and other controls.
  return util::sanitize_text(out);
}

std::vector<std::string> text_lines(std::string_view content, int max_width) {
  std::vector<std::string> out;
  if (content.empty()) return out;
  std::size_t start = 0;
  while (start <= content.size()) {
    std::size_t nl = content.find('\n', start);
    std::string_view line = content.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);
    start = (nl == std::string_view::npos) ? content.size() + 1 : nl + 1;
    if (util::text_width(line) <= max_width) {
      out.emplace_back(line);
      continue;
    }
    for (auto& w : util::wrap_text_width(line, max_width)) out.push_back(std::move(w));
  }
  return out;
}

view::Edges content_insets(const view::Style& style) {
  view::Edges e = style.padding;
  if (style.outline) {
    e.top += 1;
    e.right += 1;
    e.bottom += 1;
    e.left += 1;
  }
  return e;
}

} // namespace tessera::layout
