#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::reactive {

class ReactiveEffect;

// Subscribers of one (target, key) pair, kept in subscription order.
class Dep {
public:
  [[nodiscard]] bool contains(const ReactiveEffect* e) const noexcept;
  void add(const std::shared_ptr<ReactiveEffect>& e);
  void remove(const ReactiveEffect* e) noexcept;
  [[nodiscard]] std::vector<std::shared_ptr<ReactiveEffect>> snapshot() const;
  [[nodiscard]] std::size_t size() const noexcept { return subs_.size(); }

private:
  struct Entry {
    const ReactiveEffect* raw;
    std::weak_ptr<ReactiveEffect> ref;
  };
  std::vector<Entry> subs_;
};

// Anything that can be tracked. A target owns its dependency sets, so they
// go away with it; effects only hold weak references to them. Copies start
// with no subscribers.
class Target {
public:
  Target() = default;
  Target(const Target&) {}
  Target& operator=(const Target&) { return *this; }
  virtual ~Target() = default;

  [[nodiscard]] std::shared_ptr<Dep> find_dep(std::string_view key) const;
  [[nodiscard]] std::shared_ptr<Dep> ensure_dep(std::string_view key);
  [[nodiscard]] std::size_t subscriber_count(std::string_view key) const;

private:
  std::map<std::string, std::shared_ptr<Dep>, std::less<>> deps_;
};

using EffectScheduler = std::function<void(ReactiveEffect&)>;

struct EffectOptions {
  EffectScheduler scheduler;
  std::function<void()> on_stop;
  bool lazy{false};
};

class ReactiveEffect : public std::enable_shared_from_this<ReactiveEffect> {
  struct Private { explicit Private() = default; };

public:
  ReactiveEffect(Private, std::function<void()> fn, EffectScheduler scheduler,
                 std::function<void()> on_stop);
  ~ReactiveEffect();
  ReactiveEffect(const ReactiveEffect&) = delete;
  ReactiveEffect& operator=(const ReactiveEffect&) = delete;

  [[nodiscard]] static std::shared_ptr<ReactiveEffect> create(std::function<void()> fn,
                                                              EffectScheduler scheduler = {},
                                                              std::function<void()> on_stop = {});

  // Re-collects dependencies: detaches from every recorded set, then runs
  // with this effect active. A stopped effect runs untracked; a run already
  // in progress further up the stack is not re-entered.
  void run();
  // Idempotent. Detaches and makes every later trigger a no-op.
  void stop();
  // Scheduler if present, otherwise run().
  void schedule();

  [[nodiscard]] bool active() const noexcept { return active_; }
  [[nodiscard]] std::size_t dependency_count() const noexcept;

private:
  friend void track(Target& target, std::string_view key);
  void cleanup() noexcept;

  std::function<void()> fn_;
  EffectScheduler scheduler_;
  std::function<void()> on_stop_;
  bool active_{true};
  bool running_{false};
  std::vector<std::weak_ptr<Dep>> deps_;
};

using EffectPtr = std::shared_ptr<ReactiveEffect>;

// Creates an effect and runs it once unless options.lazy. The returned
// handle owns the effect; dropping the last handle detaches it.
[[nodiscard]] EffectPtr effect(std::function<void()> fn, EffectOptions options = {});
void stop(const EffectPtr& e);

void track(Target& target, std::string_view key);
void trigger(Target& target, std::string_view key);

// Stack-based tracking suspension.
void pause_tracking();
void enable_tracking();
void reset_tracking();
[[nodiscard]] bool is_tracking();
[[nodiscard]] ReactiveEffect* active_effect();

class TrackingPause {
public:
  TrackingPause() { pause_tracking(); }
  ~TrackingPause() { reset_tracking(); }
  TrackingPause(const TrackingPause&) = delete;
  TrackingPause& operator=(const TrackingPause&) = delete;
};

// Failures thrown by effects re-run from trigger() land here; the other
// subscribers of that trigger still run.
using EffectErrorHandler = std::function<void(std::exception_ptr)>;
EffectErrorHandler set_effect_error_handler(EffectErrorHandler handler);

using WarningHandler = std::function<void(std::string_view)>;
WarningHandler set_warning_handler(WarningHandler handler);
void warn(std::string_view message);

// Property key used by single-value targets (refs, computeds).
inline constexpr std::string_view kValueKey = "value";

} // namespace tessera::reactive
