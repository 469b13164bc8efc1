#include "reactive/Watch.hpp"
#include <cstdio>
#include <exception>

namespace tessera::reactive {

namespace detail {

std::shared_ptr<WatchState> make_watch_state() {
  auto state = std::make_shared<WatchState>();
  std::weak_ptr<WatchState> weak = state;
  state->on_cleanup = [weak](std::function<void()> fn) {
    if (auto s = weak.lock()) s->cleanup = std::move(fn);
  };
  return state;
}

} // namespace detail

WatchHandle& WatchHandle::operator=(WatchHandle&& other) noexcept {
  if (this != &other) {
    stop();
    state_ = std::move(other.state_);
  }
  return *this;
}

WatchHandle::~WatchHandle() { stop(); }

void WatchHandle::stop() {
  if (!state_) return;
  auto state = std::move(state_);
  state_.reset();
  if (!state->effect) return;
  try {
    state->effect->stop();
  } catch (const std::exception& e) {
    std::fprintf(stderr, "tessera: watch: cleanup failed: %s\n", e.what());
  }
}

bool WatchHandle::active() const noexcept { return state_ && state_->effect && state_->effect->active(); }

const EffectPtr& WatchHandle::effect() const {
  static const EffectPtr empty;
  return state_ ? state_->effect : empty;
}

WatchHandle watch_effect(std::function<void(const OnCleanup&)> fn) {
  auto state = detail::make_watch_state();
  std::weak_ptr<detail::WatchState> weak = state;
  state->effect = ReactiveEffect::create(
      [weak, fn = std::move(fn)] {
        auto s = weak.lock();
        if (!s) return;
        s->run_cleanup();
        fn(s->on_cleanup);
      },
      {},
      [weak] {
        if (auto s = weak.lock()) s->run_cleanup();
      });
  state->effect->run();
  return WatchHandle(std::move(state));
}

} // namespace tessera::reactive
