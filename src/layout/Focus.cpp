#include "layout/Focus.hpp"

namespace tessera::layout {

namespace {

void collect(const view::Element& el, const ComputedLayout& layout, std::vector<FocusTarget>& out) {
  const auto& key = el.key();
  if (key.empty()) return;
  auto it = layout.find(key);
  if (it == layout.end()) return;
  if (!el.focus_key().empty()) out.push_back(FocusTarget{el.focus_key(), key, it->second});
  for (const auto& child : el.children()) collect(child, layout, out);
}

} // namespace

std::vector<FocusTarget> collect_focus_targets(const view::Element& root, const ComputedLayout& layout) {
  std::vector<FocusTarget> out;
  collect(root, layout, out);
  return out;
}

} // namespace tessera::layout
