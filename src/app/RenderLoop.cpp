#include "app/RenderLoop.hpp"
#include "layout/Rasterizer.hpp"
#include "render/Diff.hpp"
#include <cstdio>
#include <stdexcept>
#include <string>

namespace tessera::app {

RenderLoop::RenderLoop(RenderLoopConfig config) : config_(std::move(config)) {
  if (!config_.get_size) throw std::invalid_argument("RenderLoop: get_size is required");
  if (!config_.write) throw std::invalid_argument("RenderLoop: write is required");
  if (!config_.view) throw std::invalid_argument("RenderLoop: view is required");
}

RenderLoop::~RenderLoop() { dispose(); }

render::PoolRegistry& RenderLoop::pools() const {
  return config_.pools ? *config_.pools : render::global_pool_registry();
}

void RenderLoop::report(ErrorPhase phase, std::exception_ptr error, std::uint64_t frame) {
  auto ctx = make_error_context(phase, std::move(error),
                                {{"frame", std::to_string(frame)},
                                 {"size", std::to_string(size_.cols) + "x" + std::to_string(size_.rows)}});
  if (!config_.on_error) {
    std::fprintf(stderr, "tessera: RenderLoop: %s\n", ctx.message.c_str());
    return;
  }
  try {
    config_.on_error(ctx);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "tessera: RenderLoop: error handler threw: %s\n", e.what());
  }
}

void RenderLoop::run_hook(const std::function<void()>& hook, std::uint64_t frame) {
  if (!hook) return;
  reactive::TrackingPause untracked;
  try {
    hook();
  } catch (...) {
    report(ErrorPhase::Lifecycle, std::current_exception(), frame);
  }
}

void RenderLoop::render() {
  if (disposed_) return;
  if (effect_ && effect_->active()) {
    effect_->run();
    return;
  }
  effect_ = reactive::effect([this] { render_once(); });
}

bool RenderLoop::render_once(bool force) {
  if (disposed_) return false;

  const std::uint64_t frame = frames_ + 1;
  const bool update = frames_ > 0;
  if (update) run_hook(config_.on_before_update, frame);
  if (disposed_) return false;

  std::unique_ptr<render::ScreenBuffer> next;
  ErrorPhase err_phase = ErrorPhase::Resize;
  try {
    phase_ = RenderPhase::Sizing;
    const TerminalSize sz = config_.get_size();
    if (sz.rows < 0 || sz.cols < 0) throw std::invalid_argument("terminal size is negative");
    if (!pool_ || sz != size_) {
      pool_ = pools().pool_for(sz.rows, sz.cols);
      size_ = sz;
      full_redraw_ = true;
    }
    if (force) full_redraw_ = true;
    if (config_.profiler) config_.profiler->begin_frame(sz.rows, sz.cols);

    err_phase = ErrorPhase::Render;
    phase_ = RenderPhase::LayingOut;
    view::Element root = config_.view();

    err_phase = ErrorPhase::Layout;
    layout::LayoutNode tree = layout::build_layout_tree(root);
    if (config_.profiler && config_.profiler->wants_node_count()) {
      config_.profiler->record_node_count(layout::count_nodes(tree));
    }
    const layout::ComputedLayout computed = timed(ProfilePhase::Layout, [&] {
      auto& engine = config_.layout_engine;
      if (!engine || !engine->ready()) {
        throw layout::LayoutError(layout::LayoutError::Kind::NotInitialized, "layout: engine not initialized");
      }
      return engine->compute(tree, layout::Size{sz.cols, sz.rows});
    });

    err_phase = ErrorPhase::Rasterize;
    phase_ = RenderPhase::Rasterizing;
    next = pool_->acquire();
    timed(ProfilePhase::Render, [&] { layout::rasterize(root, computed, *next); });
    auto targets = layout::collect_focus_targets(root, computed);

    err_phase = ErrorPhase::Diff;
    phase_ = RenderPhase::Diffing;
    render::DiffStats stats;
    const render::ScreenBuffer& base = (full_redraw_ || !prev_) ? blank_ : *prev_;
    const std::string out = timed(ProfilePhase::Diff, [&] { return render::render_diff(base, *next, &stats); });
    if (config_.profiler) config_.profiler->record_diff(stats);

    err_phase = ErrorPhase::Write;
    phase_ = RenderPhase::Writing;
    if (!out.empty()) {
      timed(ProfilePhase::Write, [&] { config_.write(out); });
      if (config_.profiler) config_.profiler->record_output(out.size());
    }

    // A previous buffer of another size is dropped by the pool.
    if (prev_) pool_->release(std::move(prev_));
    prev_ = std::move(next);
    focus_targets_ = std::move(targets);
    full_redraw_ = false;
    ++frames_;
    if (config_.profiler) config_.profiler->end_frame();
    phase_ = RenderPhase::Idle;
    if (update) run_hook(config_.on_updated, frame);
    return true;
  } catch (...) {
    if (next && pool_) pool_->release(std::move(next));
    if (config_.profiler) config_.profiler->abort_frame();
    phase_ = RenderPhase::Idle;
    report(err_phase, std::current_exception(), frame);
    return false;
  }
}

void RenderLoop::dispose() {
  if (disposed_) return;
  disposed_ = true;
  if (effect_) effect_->stop();
  effect_.reset();
  if (prev_ && pool_) pool_->release(std::move(prev_));
  prev_.reset();
  focus_targets_.clear();
}

} // namespace tessera::app
