#pragma once

#include "app/ErrorBoundary.hpp"
#include "app/Profiler.hpp"
#include "layout/Focus.hpp"
#include "layout/Layout.hpp"
#include "reactive/Effect.hpp"
#include "render/BufferPool.hpp"
#include "render/ScreenBuffer.hpp"
#include "ui/Terminal.hpp"
#include "view/Element.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace tessera::app {

using TerminalSize = ui::TerminalSize;

struct RenderLoopConfig {
  std::function<TerminalSize()> get_size;
  std::function<void(std::string_view)> write;
  std::function<view::Element()> view;
  std::shared_ptr<layout::LayoutEngine> layout_engine;
  ErrorHandler on_error;
  // Optional; not owned.
  Profiler* profiler{nullptr};
  // Optional; the process-wide registry when null. Not owned.
  render::PoolRegistry* pools{nullptr};
  // Run untracked around every frame after the first completed one: before
  // the view is built, and after the frame is written.
  std::function<void()> on_before_update;
  std::function<void()> on_updated;
};

enum class RenderPhase { Idle, Sizing, LayingOut, Rasterizing, Diffing, Writing };

// Frame pipeline for one mount: size, view, layout, rasterize, diff, write,
// swap. A failing frame is reported with its phase and dropped; the buffer
// retained from the last good frame stays the diff base.
class RenderLoop {
public:
  explicit RenderLoop(RenderLoopConfig config);
  ~RenderLoop();
  RenderLoop(const RenderLoop&) = delete;
  RenderLoop& operator=(const RenderLoop&) = delete;

  // Runs render_once() inside the render effect, so state read while
  // building the view re-renders on change.
  void render();
  // Returns true when the frame completed.
  bool render_once(bool force = false);
  // The next frame redraws every cell.
  void request_full_redraw() noexcept { full_redraw_ = true; }
  // Stops the render effect and hands the retained buffer back. Idempotent.
  void dispose();

  [[nodiscard]] RenderPhase phase() const noexcept { return phase_; }
  [[nodiscard]] TerminalSize size() const noexcept { return size_; }
  [[nodiscard]] std::uint64_t frame_count() const noexcept { return frames_; }
  [[nodiscard]] bool disposed() const noexcept { return disposed_; }
  [[nodiscard]] const render::ScreenBuffer* previous() const noexcept { return prev_.get(); }
  [[nodiscard]] const std::shared_ptr<render::BufferPool>& pool() const noexcept { return pool_; }
  [[nodiscard]] const reactive::EffectPtr& effect() const noexcept { return effect_; }
  // Focusable elements of the last completed frame.
  [[nodiscard]] const std::vector<layout::FocusTarget>& focus_targets() const noexcept { return focus_targets_; }

private:
  template <typename F>
  decltype(auto) timed(ProfilePhase phase, F&& fn) {
    if (config_.profiler) return config_.profiler->measure(phase, std::forward<F>(fn));
    return std::forward<F>(fn)();
  }
  [[nodiscard]] render::PoolRegistry& pools() const;
  void report(ErrorPhase phase, std::exception_ptr error, std::uint64_t frame);
  void run_hook(const std::function<void()>& hook, std::uint64_t frame);

  RenderLoopConfig config_;
  std::shared_ptr<render::BufferPool> pool_;
  std::unique_ptr<render::ScreenBuffer> prev_;
  render::ScreenBuffer blank_{0, 0};
  TerminalSize size_{};
  bool full_redraw_{true};
  bool disposed_{false};
  RenderPhase phase_{RenderPhase::Idle};
  std::uint64_t frames_{0};
  reactive::EffectPtr effect_;
  std::vector<layout::FocusTarget> focus_targets_;
};

} // namespace tessera::app
