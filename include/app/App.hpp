#pragma once

#include "app/ErrorBoundary.hpp"
#include "app/Profiler.hpp"
#include "app/RenderLoop.hpp"
#include "app/Ticker.hpp"
#include "layout/Focus.hpp"
#include "layout/Layout.hpp"
#include "ui/Config.hpp"
#include "ui/Input.hpp"
#include "ui/Terminal.hpp"
#include "view/Element.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace tessera::app {

struct AppOptions {
  // PosixTerminal configured from `config` when null.
  std::shared_ptr<ui::TerminalAdapter> terminal;
  // FlexLayoutEngine when null.
  std::shared_ptr<layout::LayoutEngine> layout_engine;
  ErrorHandler on_error;
  // Runs first thing in unmount().
  std::function<void()> on_exit;
  // ui::config() when empty.
  std::optional<ui::EngineConfig> config;
  // Overrides the profile settings of the config when set.
  std::optional<ProfilerOptions> profile;
  // Fixed viewport; 0 follows the terminal.
  int rows{0};
  int cols{0};
  // run() exits after this many completed frames; 0 runs until exit().
  std::uint64_t max_frames{0};
};

// Binds a view function to a terminal: mount() sets the terminal up and
// draws the first frame, run() drives keys, ticks and resizes until exit(),
// unmount() puts everything back. One app may be mounted per process.
class App {
public:
  using ViewFn = std::function<view::Element()>;
  // Returning true stops later handlers from seeing the key.
  using KeyHandler = std::function<bool(const ui::KeyEvent&)>;
  using Hook = std::function<void()>;

  explicit App(ViewFn view, AppOptions options = {});
  ~App();
  App(const App&) = delete;
  App& operator=(const App&) = delete;

  void on_key(KeyHandler handler);
  TimerId on_tick(std::chrono::milliseconds interval, std::function<void()> fn);
  bool cancel_tick(TimerId id) { return ticker_.cancel(id); }

  // Lifecycle hooks run in registration order, each failure reported with
  // phase Lifecycle without stopping the rest. Mounted hooks run at the end
  // of mount(), after the first frame; hooks added later wait for the next
  // mount.
  // Unmounted hooks run after the timers stop and before the render effect
  // does. Update hooks wrap every later frame.
  void on_mounted(Hook fn);
  void on_unmounted(Hook fn);
  void on_before_update(Hook fn);
  void on_updated(Hook fn);

  // Throws std::logic_error when an app is already mounted. Setup failures
  // are reported with phase Mount, rolled back and rethrown.
  void mount();
  // Mounts if needed, loops until exit() or an interrupt, then unmounts.
  // Returns the exit code.
  int run();
  void exit(int code = 0) noexcept;
  void unmount();

  // Dispatches one key as run() would. Ctrl+C requests exit.
  void dispatch_key(const ui::KeyEvent& key);
  // One pass of the event loop: resize, input (waiting at most the poll
  // interval or until the next tick), timers.
  void poll_once();

  [[nodiscard]] bool mounted() const noexcept { return mounted_; }
  [[nodiscard]] bool exit_requested() const noexcept { return exit_requested_; }
  [[nodiscard]] int exit_code() const noexcept { return exit_code_; }
  [[nodiscard]] const ui::EngineConfig& config() const noexcept { return config_; }
  [[nodiscard]] Profiler& profiler() noexcept { return profiler_; }
  [[nodiscard]] RenderLoop* render_loop() noexcept { return loop_.get(); }
  [[nodiscard]] const ErrorHandler& error_handler() const noexcept { return on_error_; }
  // Empty before the first frame.
  [[nodiscard]] std::vector<layout::FocusTarget> focus_targets() const;

private:
  [[nodiscard]] TerminalSize viewport() const;
  void run_hooks(const std::vector<Hook>& hooks);

  ViewFn view_;
  AppOptions options_;
  ui::EngineConfig config_;
  ErrorHandler on_error_;
  Profiler profiler_;
  Ticker ticker_;
  std::shared_ptr<ui::TerminalAdapter> terminal_;
  std::shared_ptr<layout::LayoutEngine> layout_;
  std::unique_ptr<RenderLoop> loop_;
  std::vector<KeyHandler> key_handlers_;
  std::vector<Hook> mounted_hooks_;
  std::vector<Hook> unmounted_hooks_;
  std::vector<Hook> before_update_hooks_;
  std::vector<Hook> updated_hooks_;
  bool mounted_{false};
  bool unmounting_{false};
  bool exit_requested_{false};
  int exit_code_{0};
};

} // namespace tessera::app
