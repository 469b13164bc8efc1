#pragma once

#include "view/Element.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tessera::layout {

struct Size {
  int width{0};
  int height{0};
  friend constexpr bool operator==(const Size&, const Size&) = default;
};

struct Rect {
  int x{0};
  int y{0};
  int width{0};
  int height{0};
  friend constexpr bool operator==(const Rect&, const Rect&) = default;
};

// Absolute rectangle per node key.
using ComputedLayout = std::unordered_map<std::string, Rect>;

struct LayoutNode {
  std::string key;
  view::ElementKind kind{view::ElementKind::Block};
  view::Style style;
  // Intrinsic size of leaves, pre-measured by the caller.
  std::optional<Size> measured;
  std::vector<LayoutNode> children;
};

class LayoutError : public std::runtime_error {
public:
  enum class Kind { NotInitialized, InvalidInput, Failed };

  LayoutError(Kind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}
  [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
  Kind kind_;
};

// Solver behind the frame pipeline. initialize() runs once before the first
// frame; compute() before that throws LayoutError::NotInitialized.
class LayoutEngine {
public:
  virtual ~LayoutEngine() = default;
  virtual void initialize() = 0;
  [[nodiscard]] virtual bool ready() const = 0;
  [[nodiscard]] virtual ComputedLayout compute(const LayoutNode& root, Size viewport) = 0;
};

// Assigns missing keys on `root` in place ("root", then
// "{parent}/{kind}-{index}"), replaces text content with display_text() and
// measures text leaves.
[[nodiscard]] LayoutNode build_layout_tree(view::Element& root);

// Rejects negative or non-finite dimensions anywhere in the tree.
void validate_tree(const LayoutNode& root);

[[nodiscard]] std::size_t count_nodes(const LayoutNode& root);

// Text as it is drawn: escape sequences and controls removed, tabs become
// one space, CR LF and lone CR become LF.
[[nodiscard]] std::string display_text(std::string_view content);

// Lines of a text leaf: split on newlines, wrapping only lines wider than
// `max_width`. Measurement and rasterization both go through this.
[[nodiscard]] std::vector<std::string> text_lines(std::string_view content, int max_width);

// Cells taken on each side by padding plus a one-cell outline.
[[nodiscard]] view::Edges content_insets(const view::Style& style);

} // namespace tessera::layout
