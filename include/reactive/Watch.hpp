#pragma once

#include "reactive/Computed.hpp"
#include "reactive/Reactive.hpp"
#include "reactive/Ref.hpp"
#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace tessera::reactive {

// Registers the function to run before the next callback and on stop.
using OnCleanup = std::function<void(std::function<void()>)>;

// `old` is empty on the first call, which only happens with `immediate`.
template <typename T>
using WatchCallback = std::function<void(const T& value, const std::optional<T>& old, const OnCleanup&)>;

struct WatchOptions {
  bool immediate{false};
  bool deep{false};
};

namespace detail {

struct WatchState {
  EffectPtr effect;
  std::function<void()> cleanup;
  OnCleanup on_cleanup;

  void run_cleanup() {
    if (!cleanup) return;
    auto fn = std::move(cleanup);
    cleanup = nullptr;
    fn();
  }
};

template <typename T>
struct WatchValues {
  std::optional<T> current;
  std::optional<T> old;
};

[[nodiscard]] std::shared_ptr<WatchState> make_watch_state();

} // namespace detail

// Owns a watcher. Stopping (explicitly or by destruction) stops the effect and
// runs the pending cleanup once.
class WatchHandle {
public:
  WatchHandle() = default;
  explicit WatchHandle(std::shared_ptr<detail::WatchState> state) : state_(std::move(state)) {}
  WatchHandle(WatchHandle&&) noexcept = default;
  WatchHandle& operator=(WatchHandle&& other) noexcept;
  WatchHandle(const WatchHandle&) = delete;
  WatchHandle& operator=(const WatchHandle&) = delete;
  ~WatchHandle();

  void stop();
  void operator()() { stop(); }
  [[nodiscard]] bool active() const noexcept;
  [[nodiscard]] const EffectPtr& effect() const;

private:
  std::shared_ptr<detail::WatchState> state_;
};

namespace detail {

// Shared body of every watch() overload. The effect only collects the source;
// the scheduler decides whether the callback fires.
template <typename T>
WatchHandle watch_getter(std::function<T()> getter, WatchCallback<T> cb, WatchOptions opts, bool force) {
  auto state = make_watch_state();
  auto values = std::make_shared<WatchValues<T>>();
  std::weak_ptr<WatchState> weak = state;
  const bool deep = opts.deep;
  force = force || deep;

  auto job = [weak, values, cb = std::move(cb), force]() {
    auto s = weak.lock();
    if (!s || !s->effect->active()) return;
    s->effect->run();
    if (!values->current) return;
    if (!force && values->old && !has_changed(*values->old, *values->current)) return;
    s->run_cleanup();
    T value = *values->current;
    std::optional<T> prev = std::move(values->old);
    values->old = value;
    cb(value, prev, s->on_cleanup);
  };

  state->effect = ReactiveEffect::create(
      [values, getter = std::move(getter), deep] {
        values->current = getter();
        if constexpr (std::is_same_v<T, Reactive>) {
          if (deep && *values->current) traverse(*values->current);
        }
      },
      [job](ReactiveEffect&) { job(); },
      [weak] {
        if (auto s = weak.lock()) s->run_cleanup();
      });

  if (opts.immediate) {
    job();
  } else {
    state->effect->run();
    values->old = values->current;
  }
  return WatchHandle(std::move(state));
}

} // namespace detail

template <typename T>
[[nodiscard]] WatchHandle watch(const Ref<T>& source, std::type_identity_t<WatchCallback<T>> cb, WatchOptions opts = {}) {
  return detail::watch_getter<T>([source] { return source.get(); }, std::move(cb), opts, false);
}

template <typename T>
[[nodiscard]] WatchHandle watch(const Computed<T>& source, std::type_identity_t<WatchCallback<T>> cb,
                  WatchOptions opts = {}) {
  return detail::watch_getter<T>([source] { return source.get(); }, std::move(cb), opts, false);
}

// Reactive objects are always watched deeply.
[[nodiscard]] inline WatchHandle watch(const Reactive& source, WatchCallback<Reactive> cb, WatchOptions opts = {}) {
  opts.deep = true;
  return detail::watch_getter<Reactive>([source] { return source; }, std::move(cb), opts, true);
}

// Multiple sources fire on any trigger, with the values in source order.
template <typename T>
[[nodiscard]] WatchHandle watch(const std::vector<Ref<T>>& sources, std::type_identity_t<WatchCallback<std::vector<T>>> cb,
                  WatchOptions opts = {}) {
  return detail::watch_getter<std::vector<T>>(
      [sources] {
        std::vector<T> out;
        out.reserve(sources.size());
        for (const auto& r : sources) out.push_back(r.get());
        return out;
      },
      std::move(cb), opts, true);
}

template <typename F, typename T = std::decay_t<std::invoke_result_t<F&>>>
  requires std::invocable<F&>
[[nodiscard]] WatchHandle watch(F getter, std::type_identity_t<WatchCallback<T>> cb, WatchOptions opts = {}) {
  return detail::watch_getter<T>(std::function<T()>(std::move(getter)), std::move(cb), opts, false);
}

// Runs `fn` now and again whenever what it read changes. A registered
// cleanup runs before each re-run and on stop.
[[nodiscard]] WatchHandle watch_effect(std::function<void(const OnCleanup&)> fn);

} // namespace tessera::reactive
