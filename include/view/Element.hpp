#pragma once

#include "render/Color.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tessera::view {

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

struct Dimension {
  enum class Unit { Auto, Cells, Percent };
  Unit unit{Unit::Auto};
  double value{0.0};

  static constexpr Dimension automatic() { return {}; }
  static constexpr Dimension cells(double n) { return {Unit::Cells, n}; }
  static constexpr Dimension percent(double p) { return {Unit::Percent, p}; }
  [[nodiscard]] constexpr bool is_auto() const { return unit == Unit::Auto; }
  friend constexpr bool operator==(const Dimension&, const Dimension&) = default;
};

struct Edges {
  int top{0};
  int right{0};
  int bottom{0};
  int left{0};

  static constexpr Edges all(int n) { return {n, n, n, n}; }
  static constexpr Edges symmetric(int vertical, int horizontal) {
    return {vertical, horizontal, vertical, horizontal};
  }
  [[nodiscard]] constexpr int horizontal() const { return left + right; }
  [[nodiscard]] constexpr int vertical() const { return top + bottom; }
  friend constexpr bool operator==(const Edges&, const Edges&) = default;
};

enum class Direction { Row, Column, RowReverse, ColumnReverse };
enum class Justify { Start, Center, End, SpaceBetween };
enum class Align { Stretch, Start, Center, End };
enum class BorderStyle { Single, Double };

struct Outline {
  BorderStyle style{BorderStyle::Single};
  std::optional<render::Color> color;
};

struct Style {
  // layout
  Dimension width;
  Dimension height;
  Dimension min_width;
  Dimension min_height;
  Dimension max_width;
  Dimension max_height;
  Edges padding;
  Edges margin;
  Direction direction{Direction::Column};
  double grow{0.0};
  double shrink{1.0};
  Justify justify{Justify::Start};
  Align align{Align::Stretch};
  int gap{0};
  // Children overlay each other instead of flowing.
  bool stack{false};

  // paint
  std::optional<render::Color> foreground;
  std::optional<render::Color> background;
  std::optional<Outline> outline;
};

enum class ElementKind { Block, Text };

[[nodiscard]] std::string_view kind_name(ElementKind kind);

class Element;

struct BlockElement {
  std::string key;
  Style style;
  std::vector<Element> children;
  std::string focus_key;
};

struct TextElement {
  std::string key;
  Style style;
  std::string content;
  std::string focus_key;
};

// Closed set of view nodes. Setters mutate in place and return *this so
// builders chain: text("hi").foreground(c).width(10).
class Element {
public:
  Element(BlockElement block) : node_(std::move(block)) {}
  Element(TextElement text) : node_(std::move(text)) {}

  [[nodiscard]] ElementKind kind() const noexcept {
    return std::holds_alternative<TextElement>(node_) ? ElementKind::Text : ElementKind::Block;
  }
  [[nodiscard]] bool is_text() const noexcept { return kind() == ElementKind::Text; }
  [[nodiscard]] bool is_block() const noexcept { return kind() == ElementKind::Block; }

  [[nodiscard]] const std::string& key() const;
  // Empty when the element takes no focus.
  [[nodiscard]] const std::string& focus_key() const;
  [[nodiscard]] const Style& style() const;
  [[nodiscard]] Style& style();
  // Empty for text elements.
  [[nodiscard]] const std::vector<Element>& children() const;
  [[nodiscard]] const TextElement* as_text() const { return std::get_if<TextElement>(&node_); }
  [[nodiscard]] const BlockElement* as_block() const { return std::get_if<BlockElement>(&node_); }

  template <typename F>
  decltype(auto) visit(F&& f) const {
    return std::visit(std::forward<F>(f), node_);
  }
  template <typename F>
  decltype(auto) visit(F&& f) {
    return std::visit(std::forward<F>(f), node_);
  }

  Element& key(std::string k);
  Element& focus_key(std::string k);
  Element& width(Dimension d);
  Element& width(int cells) { return width(Dimension::cells(cells)); }
  Element& height(Dimension d);
  Element& height(int cells) { return height(Dimension::cells(cells)); }
  Element& min_width(int cells);
  Element& min_height(int cells);
  Element& max_width(int cells);
  Element& max_height(int cells);
  Element& padding(int all) { return padding(Edges::all(all)); }
  Element& padding(Edges e);
  Element& margin(int all) { return margin(Edges::all(all)); }
  Element& margin(Edges e);
  Element& direction(Direction d);
  Element& grow(double g);
  Element& shrink(double s);
  Element& justify(Justify j);
  Element& align(Align a);
  Element& gap(int g);
  Element& foreground(render::Color c);
  Element& background(render::Color c);
  Element& border(BorderStyle style = BorderStyle::Single, std::optional<render::Color> color = std::nullopt);
  // No-op on text elements.
  Element& add(Element child);

private:
  std::variant<BlockElement, TextElement> node_;
};

[[nodiscard]] Element text(std::string content);
[[nodiscard]] Element block(std::vector<Element> children = {});
[[nodiscard]] Element vstack(std::vector<Element> children = {});
// Row with children centered on the cross axis.
[[nodiscard]] Element hstack(std::vector<Element> children = {});
[[nodiscard]] Element zstack(std::vector<Element> children = {});
// Grows to fill the remaining main-axis space.
[[nodiscard]] Element spacer();

} // namespace tessera::view
