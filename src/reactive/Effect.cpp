#include "reactive/Effect.hpp"
#include <algorithm>
#include <cstdio>
#include <string>

namespace tessera::reactive {

namespace {

struct TrackerState {
  ReactiveEffect* active{nullptr};
  bool should_track{true};
  std::vector<bool> track_stack;
  EffectErrorHandler error_handler;
  WarningHandler warning_handler;
};

// The core is single-threaded; each thread gets an independent tracker.
TrackerState& tracker() {
  thread_local TrackerState state;
  return state;
}

// Installs an effect as the active one for the duration of its run.
class ActiveScope {
public:
  explicit ActiveScope(ReactiveEffect* e) {
    auto& t = tracker();
    prev_ = t.active;
    prev_should_track_ = t.should_track;
    t.active = e;
    t.should_track = true;
  }
  ~ActiveScope() {
    auto& t = tracker();
    t.active = prev_;
    t.should_track = prev_should_track_;
  }
  ActiveScope(const ActiveScope&) = delete;
  ActiveScope& operator=(const ActiveScope&) = delete;

private:
  ReactiveEffect* prev_{nullptr};
  bool prev_should_track_{true};
};

void report_effect_error(std::exception_ptr ep) {
  auto& t = tracker();
  if (t.error_handler) {
    t.error_handler(ep);
    return;
  }
  try {
    std::rethrow_exception(ep);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "tessera: effect: %s\n", e.what());
  } catch (...) {
    std::fprintf(stderr, "tessera: effect: unknown exception\n");
  }
}

} // namespace

// ---- Dep ----

bool Dep::contains(const ReactiveEffect* e) const noexcept {
  return std::any_of(subs_.begin(), subs_.end(), [e](const Entry& s) { return s.raw == e; });
}

void Dep::add(const std::shared_ptr<ReactiveEffect>& e) {
  if (!contains(e.get())) subs_.push_back(Entry{e.get(), e});
}

void Dep::remove(const ReactiveEffect* e) noexcept {
  subs_.erase(std::remove_if(subs_.begin(), subs_.end(), [e](const Entry& s) { return s.raw == e; }),
              subs_.end());
}

std::vector<std::shared_ptr<ReactiveEffect>> Dep::snapshot() const {
  std::vector<std::shared_ptr<ReactiveEffect>> out;
  out.reserve(subs_.size());
  for (const auto& s : subs_) {
    if (auto e = s.ref.lock()) out.push_back(std::move(e));
  }
  return out;
}

// ---- Target ----

std::shared_ptr<Dep> Target::find_dep(std::string_view key) const {
  auto it = deps_.find(key);
  return it == deps_.end() ? nullptr : it->second;
}

std::shared_ptr<Dep> Target::ensure_dep(std::string_view key) {
  auto it = deps_.find(key);
  if (it != deps_.end()) return it->second;
  auto dep = std::make_shared<Dep>();
  deps_.emplace(std::string(key), dep);
  return dep;
}

std::size_t Target::subscriber_count(std::string_view key) const {
  auto dep = find_dep(key);
  return dep ? dep->size() : 0;
}

// ---- ReactiveEffect ----

ReactiveEffect::ReactiveEffect(Private, std::function<void()> fn, EffectScheduler scheduler,
                               std::function<void()> on_stop)
    : fn_(std::move(fn)), scheduler_(std::move(scheduler)), on_stop_(std::move(on_stop)) {}

ReactiveEffect::~ReactiveEffect() { cleanup(); }

std::shared_ptr<ReactiveEffect> ReactiveEffect::create(std::function<void()> fn,
                                                       EffectScheduler scheduler,
                                                       std::function<void()> on_stop) {
  return std::make_shared<ReactiveEffect>(Private{}, std::move(fn), std::move(scheduler),
                                          std::move(on_stop));
}

void ReactiveEffect::cleanup() noexcept {
  for (auto& weak : deps_) {
    if (auto dep = weak.lock()) dep->remove(this);
  }
  deps_.clear();
}

void ReactiveEffect::run() {
  if (!active_) {
    if (fn_) fn_();
    return;
  }
  if (running_) return;
  cleanup();
  ActiveScope scope(this);
  running_ = true;
  try {
    if (fn_) fn_();
  } catch (...) {
    running_ = false;
    throw;
  }
  running_ = false;
}

void ReactiveEffect::stop() {
  if (!active_) return;
  cleanup();
  active_ = false;
  if (on_stop_) on_stop_();
}

void ReactiveEffect::schedule() {
  if (scheduler_) scheduler_(*this);
  else run();
}

std::size_t ReactiveEffect::dependency_count() const noexcept {
  return static_cast<std::size_t>(std::count_if(deps_.begin(), deps_.end(),
                                                [](const std::weak_ptr<Dep>& d) { return !d.expired(); }));
}

// ---- free functions ----

EffectPtr effect(std::function<void()> fn, EffectOptions options) {
  auto e = ReactiveEffect::create(std::move(fn), std::move(options.scheduler), std::move(options.on_stop));
  if (!options.lazy) e->run();
  return e;
}

void stop(const EffectPtr& e) {
  if (e) e->stop();
}

void track(Target& target, std::string_view key) {
  auto& t = tracker();
  if (!t.should_track || !t.active || !t.active->active()) return;
  auto dep = target.ensure_dep(key);
  if (dep->contains(t.active)) return;
  dep->add(t.active->shared_from_this());
  t.active->deps_.push_back(dep);
}

void trigger(Target& target, std::string_view key) {
  auto dep = target.find_dep(key);
  if (!dep) return;
  // Re-runs may resubscribe; iterate over a stable copy.
  const auto effects = dep->snapshot();
  for (const auto& e : effects) {
    if (!e->active()) continue;
    if (e.get() == tracker().active) continue;
    try {
      e->schedule();
    } catch (...) {
      report_effect_error(std::current_exception());
    }
  }
}

void pause_tracking() {
  auto& t = tracker();
  t.track_stack.push_back(t.should_track);
  t.should_track = false;
}

void enable_tracking() {
  auto& t = tracker();
  t.track_stack.push_back(t.should_track);
  t.should_track = true;
}

void reset_tracking() {
  auto& t = tracker();
  if (t.track_stack.empty()) {
    t.should_track = true;
    return;
  }
  t.should_track = t.track_stack.back();
  t.track_stack.pop_back();
}

bool is_tracking() {
  const auto& t = tracker();
  return t.should_track && t.active != nullptr;
}

ReactiveEffect* active_effect() { return tracker().active; }

EffectErrorHandler set_effect_error_handler(EffectErrorHandler handler) {
  auto& t = tracker();
  auto prev = std::move(t.error_handler);
  t.error_handler = std::move(handler);
  return prev;
}

WarningHandler set_warning_handler(WarningHandler handler) {
  auto& t = tracker();
  auto prev = std::move(t.warning_handler);
  t.warning_handler = std::move(handler);
  return prev;
}

void warn(std::string_view message) {
  auto& t = tracker();
  if (t.warning_handler) {
    t.warning_handler(message);
    return;
  }
  std::fprintf(stderr, "tessera: warning: %.*s\n", static_cast<int>(message.size()), message.data());
}

} // namespace tessera::reactive
