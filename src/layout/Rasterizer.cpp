#include "layout/Rasterizer.hpp"
#include "render/Draw.hpp"
#include <optional>

namespace tessera::layout {

namespace {

struct BorderGlyphs {
  const char* h;
  const char* v;
  const char* tl;
  const char* tr;
  const char* bl;
  const char* br;
};

constexpr BorderGlyphs kSingle{"─", "│", "┌", "┐", "└", "┘"};
constexpr BorderGlyphs kDouble{"═", "║", "╔", "╗", "╚", "╝"};

void draw_outline(render::ScreenBuffer& buf, const Rect& r, const view::Outline& outline) {
  if (r.width <= 0 || r.height <= 0) return;
  const auto& g = outline.style == view::BorderStyle::Double ? kDouble : kSingle;
  render::CellStyle st{outline.color, std::nullopt};
  const int right = r.x + r.width - 1;
  const int bottom = r.y + r.height - 1;
  render::fill_rect(buf, r.y, r.x, r.width, 1, g.h, st);
  render::fill_rect(buf, bottom, r.x, r.width, 1, g.h, st);
  render::fill_rect(buf, r.y, r.x, 1, r.height, g.v, st);
  render::fill_rect(buf, r.y, right, 1, r.height, g.v, st);
  render::draw_text(buf, r.y, r.x, g.tl, st);
  render::draw_text(buf, r.y, right, g.tr, st);
  render::draw_text(buf, bottom, r.x, g.bl, st);
  render::draw_text(buf, bottom, right, g.br, st);
}

void paint(const view::Element& el, const ComputedLayout& layout, render::ScreenBuffer& buf,
           std::optional<render::Color> inherited_fg) {
  const auto& key = el.key();
  if (key.empty()) return;
  auto it = layout.find(key);
  if (it == layout.end()) return;
  const Rect& r = it->second;
  const auto& style = el.style();
  const auto fg = style.foreground ? style.foreground : inherited_fg;

  if (style.background) {
    render::fill_rect(buf, r.y, r.x, r.width, r.height, " ", render::CellStyle{std::nullopt, style.background});
  }
  if (style.outline) draw_outline(buf, r, *style.outline);

  el.visit(view::overloaded{
      [&](const view::TextElement& t) {
        const auto in = content_insets(style);
        const render::ClipRect clip{r.y + in.top, r.x + in.left, r.height - in.vertical(),
                                    r.width - in.horizontal()};
        if (clip.width <= 0 || clip.height <= 0) return;
        const render::CellStyle st{fg, style.background};
        int row = clip.row;
        for (const auto& line : text_lines(t.content, clip.width)) {
          if (!clip.contains_row(row)) break;
          render::draw_text(buf, row, clip.col, line, st, clip);
          ++row;
        }
      },
      [&](const view::BlockElement& b) {
        for (const auto& child : b.children) paint(child, layout, buf, fg);
      },
  });
}

} // namespace

void rasterize(const view::Element& root, const ComputedLayout& layout, render::ScreenBuffer& buf) {
  paint(root, layout, buf, std::nullopt);
}

} // namespace tessera::layout
