#include "app/App.hpp"
#include "layout/FlexLayout.hpp"
#include "render/BufferPool.hpp"
#include <atomic>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace tessera::app {

namespace {

std::atomic<bool> g_app_mounted{false};

ProfilerOptions profile_from(const ui::EngineConfig& c) {
  ProfilerOptions p;
  p.enabled = c.profile_enabled;
  p.output_file = c.profile_output;
  p.max_frames = static_cast<std::size_t>(c.profile_max_frames);
  p.node_count = c.profile_node_count;
  return p;
}

} // namespace

App::App(ViewFn view, AppOptions options)
    : view_(std::move(view)),
      options_(std::move(options)),
      config_(options_.config ? *options_.config : ui::config()),
      on_error_(make_error_handler(options_.on_error, config_.error_log)),
      profiler_(options_.profile ? *options_.profile : profile_from(config_)),
      ticker_(on_error_) {
  if (!view_) throw std::invalid_argument("App: view function is required");
  terminal_ = options_.terminal;
  if (!terminal_) {
    ui::PosixTerminalOptions to;
    to.alt_screen = config_.alt_screen;
    to.hide_cursor = config_.hide_cursor;
    terminal_ = std::make_shared<ui::PosixTerminal>(to);
  }
  layout_ = options_.layout_engine ? options_.layout_engine : std::make_shared<layout::FlexLayoutEngine>();
}

App::~App() { unmount(); }

void App::on_key(KeyHandler handler) {
  if (handler) key_handlers_.push_back(std::move(handler));
}

void App::on_mounted(Hook fn) {
  if (fn) mounted_hooks_.push_back(std::move(fn));
}

void App::on_unmounted(Hook fn) {
  if (fn) unmounted_hooks_.push_back(std::move(fn));
}

void App::on_before_update(Hook fn) {
  if (fn) before_update_hooks_.push_back(std::move(fn));
}

void App::on_updated(Hook fn) {
  if (fn) updated_hooks_.push_back(std::move(fn));
}

void App::run_hooks(const std::vector<Hook>& hooks) {
  // A hook may register more hooks; only the current set runs.
  const auto current = hooks;
  for (const auto& h : current) guarded(ErrorPhase::Lifecycle, on_error_, h);
}

std::vector<layout::FocusTarget> App::focus_targets() const {
  if (!loop_) return {};
  return loop_->focus_targets();
}

TimerId App::on_tick(std::chrono::milliseconds interval, std::function<void()> fn) {
  return ticker_.add(interval, std::move(fn));
}

TerminalSize App::viewport() const {
  if (options_.rows > 0 && options_.cols > 0) return {options_.rows, options_.cols};
  TerminalSize sz = terminal_->size();
  if (options_.rows > 0) sz.rows = options_.rows;
  if (options_.cols > 0) sz.cols = options_.cols;
  return sz;
}

void App::mount() {
  if (g_app_mounted.exchange(true)) {
    throw std::logic_error("App: an app is already mounted");
  }
  exit_requested_ = false;
  exit_code_ = 0;
  bool terminal_ready = false;
  try {
    terminal_->setup();
    terminal_ready = true;
    if (!layout_->ready()) layout_->initialize();
    render::global_pool_registry().set_limits(static_cast<std::size_t>(config_.pool_initial),
                                              static_cast<std::size_t>(config_.pool_max));

    RenderLoopConfig rc;
    rc.get_size = [this] { return viewport(); };
    rc.write = [this](std::string_view bytes) { terminal_->write(bytes); };
    rc.view = view_;
    rc.layout_engine = layout_;
    rc.on_error = on_error_;
    rc.profiler = profiler_.enabled() ? &profiler_ : nullptr;
    rc.on_before_update = [this] { run_hooks(before_update_hooks_); };
    rc.on_updated = [this] { run_hooks(updated_hooks_); };
    loop_ = std::make_unique<RenderLoop>(std::move(rc));
    mounted_ = true;
    loop_->render();
  } catch (...) {
    on_error_(make_error_context(ErrorPhase::Mount, std::current_exception()));
    loop_.reset();
    mounted_ = false;
    if (terminal_ready) terminal_->restore();
    g_app_mounted.store(false);
    throw;
  }
  run_hooks(mounted_hooks_);
}

void App::exit(int code) noexcept {
  exit_requested_ = true;
  exit_code_ = code;
}

void App::dispatch_key(const ui::KeyEvent& key) {
  if (key.ctrl && key.name == "c") {
    exit(0);
    return;
  }
  // Handlers may register more handlers; this key only sees the current set.
  const auto handlers = key_handlers_;
  for (const auto& h : handlers) {
    bool handled = false;
    const bool ok = guarded(ErrorPhase::Key, on_error_, [&] { handled = h(key); });
    if (ok && handled) break;
  }
}

void App::poll_once() {
  if (!mounted_) return;
  if (terminal_->interrupted()) {
    exit(0);
    return;
  }
  if (terminal_->consume_resize()) {
    guarded(ErrorPhase::Resize, on_error_, [&] {
      terminal_->write("\x1B[2J");
      loop_->request_full_redraw();
      loop_->render();
    });
  }
  const int timeout = ticker_.timeout_ms(Ticker::Clock::now(), config_.poll_ms);
  std::vector<ui::KeyEvent> keys;
  guarded(ErrorPhase::Key, on_error_, [&] { keys = terminal_->read_keys(timeout); });
  for (const auto& k : keys) {
    dispatch_key(k);
    if (exit_requested_) return;
  }
  ticker_.run_due(Ticker::Clock::now());
  if (options_.max_frames > 0 && loop_ && loop_->frame_count() >= options_.max_frames) exit(0);
}

int App::run() {
  if (!mounted_) mount();
  while (mounted_ && !exit_requested_) poll_once();
  unmount();
  return exit_code_;
}

void App::unmount() {
  if (!mounted_ || unmounting_) return;
  unmounting_ = true;
  if (options_.on_exit) guarded(ErrorPhase::Unmount, on_error_, options_.on_exit);
  ticker_.cancel_all();
  run_hooks(unmounted_hooks_);
  if (loop_) loop_->dispose();
  guarded(ErrorPhase::Unmount, on_error_, [&] { terminal_->restore(); });
  if (profiler_.enabled() && !profiler_.options().output_file.empty() && !profiler_.flush()) {
    std::fprintf(stderr, "tessera: App: failed to write profile to %s\n",
                 profiler_.options().output_file.c_str());
  }
  loop_.reset();
  mounted_ = false;
  unmounting_ = false;
  g_app_mounted.store(false);
}

} // namespace tessera::app
