#pragma once

#include "layout/Layout.hpp"

namespace tessera::layout {

// Single-line flexbox over integer cells. The root fills the viewport unless
// it sets its own size; results are absolute.
class FlexLayoutEngine : public LayoutEngine {
public:
  void initialize() override { ready_ = true; }
  [[nodiscard]] bool ready() const override { return ready_; }
  [[nodiscard]] ComputedLayout compute(const LayoutNode& root, Size viewport) override;

private:
  bool ready_{false};
};

// Intrinsic size of a node, margins excluded, given the space offered to it.
[[nodiscard]] Size measure_node(const LayoutNode& node, Size available);

} // namespace tessera::layout
