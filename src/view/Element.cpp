#include "view/Element.hpp"

namespace tessera::view {

std::string_view kind_name(ElementKind kind) {
  switch (kind) {
    case ElementKind::Block: return "block";
    case ElementKind::Text: return "text";
  }
  return "block";
}

const std::string& Element::key() const {
  return visit([](const auto& n) -> const std::string& { return n.key; });
}

const std::string& Element::focus_key() const {
  return visit([](const auto& n) -> const std::string& { return n.focus_key; });
}

const Style& Element::style() const {
  return visit([](const auto& n) -> const Style& { return n.style; });
}

Style& Element::style() {
  return visit([](auto& n) -> Style& { return n.style; });
}

const std::vector<Element>& Element::children() const {
  static const std::vector<Element> none;
  if (const auto* b = as_block()) return b->children;
  return none;
}

Element& Element::key(std::string k) {
  visit([&](auto& n) { n.key = std::move(k); });
  return *this;
}

Element& Element::focus_key(std::string k) {
  visit([&](auto& n) { n.focus_key = std::move(k); });
  return *this;
}

Element& Element::width(Dimension d) {
  style().width = d;
  return *this;
}

Element& Element::height(Dimension d) {
  style().height = d;
  return *this;
}

Element& Element::min_width(int cells) {
  style().min_width = Dimension::cells(cells);
  return *this;
}

Element& Element::min_height(int cells) {
  style().min_height = Dimension::cells(cells);
  return *this;
}

Element& Element::max_width(int cells) {
  style().max_width = Dimension::cells(cells);
  return *this;
}

Element& Element::max_height(int cells) {
  style().max_height = Dimension::cells(cells);
  return *this;
}

Element& Element::padding(Edges e) {
  style().padding = e;
  return *this;
}

Element& Element::margin(Edges e) {
  style().margin = e;
  return *this;
}

Element& Element::direction(Direction d) {
  style().direction = d;
  return *this;
}

Element& Element::grow(double g) {
  style().grow = g;
  return *this;
}

Element& Element::shrink(double s) {
  style().shrink = s;
  return *this;
}

Element& Element::justify(Justify j) {
  style().justify = j;
  return *this;
}

Element& Element::align(Align a) {
  style().align = a;
  return *this;
}

Element& Element::gap(int g) {
  style().gap = g;
  return *this;
}

Element& Element::foreground(render::Color c) {
  style().foreground = c;
  return *this;
}

Element& Element::background(render::Color c) {
  style().background = c;
  return *this;
}

Element& Element::border(BorderStyle s, std::optional<render::Color> color) {
  style().outline = Outline{s, color};
  return *this;
}

Element& Element::add(Element child) {
  if (auto* b = std::get_if<BlockElement>(&node_)) b->children.push_back(std::move(child));
  return *this;
}

Element text(std::string content) {
  TextElement t;
  t.content = std::move(content);
  return Element(std::move(t));
}

Element block(std::vector<Element> children) {
  BlockElement b;
  b.children = std::move(children);
  return Element(std::move(b));
}

Element vstack(std::vector<Element> children) {
  return block(std::move(children)).direction(Direction::Column);
}

Element hstack(std::vector<Element> children) {
  return block(std::move(children)).direction(Direction::Row).align(Align::Center);
}

Element zstack(std::vector<Element> children) {
  Element e = block(std::move(children));
  e.style().stack = true;
  return e;
}

Element spacer() { return block().grow(1.0); }

} // namespace tessera::view
