#pragma once

#include "reactive/Effect.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace tessera::reactive {

// Lazily evaluated, cached derivation. Its effect's scheduler only marks the
// value dirty; dependents are notified once per clean-to-dirty transition and
// the getter runs again on the next read.
template <typename T>
class ComputedImpl : public Target {
public:
  using Getter = std::function<T()>;
  using Setter = std::function<void(const T&)>;

  ComputedImpl(Getter getter, Setter setter)
      : getter_(std::move(getter)), setter_(std::move(setter)) {
    effect_ = ReactiveEffect::create([this] { value_ = getter_(); },
                                     [this](ReactiveEffect&) {
                                       if (dirty_) return;
                                       dirty_ = true;
                                       trigger(*this, kValueKey);
                                     });
  }
  ComputedImpl(const ComputedImpl&) = delete;
  ComputedImpl& operator=(const ComputedImpl&) = delete;
  ~ComputedImpl() override { effect_->stop(); }

  const T& get() {
    if (computing_) throw std::logic_error("computed: value read while it is being computed");
    track(*this, kValueKey);
    if (dirty_) {
      dirty_ = false;
      computing_ = true;
      try {
        effect_->run();
      } catch (...) {
        computing_ = false;
        dirty_ = true;
        throw;
      }
      computing_ = false;
    }
    return *value_;
  }

  void set(const T& value) {
    if (!setter_) {
      warn("write operation failed: computed value is readonly");
      return;
    }
    setter_(value);
  }

  [[nodiscard]] bool dirty() const noexcept { return dirty_; }
  [[nodiscard]] bool writable() const noexcept { return static_cast<bool>(setter_); }
  void stop() { effect_->stop(); }
  [[nodiscard]] const std::shared_ptr<ReactiveEffect>& effect() const noexcept { return effect_; }

private:
  Getter getter_;
  Setter setter_;
  std::optional<T> value_;
  bool dirty_{true};
  bool computing_{false};
  std::shared_ptr<ReactiveEffect> effect_;
};

template <typename T>
class Computed {
public:
  using value_type = T;

  Computed() = default;
  explicit Computed(std::shared_ptr<ComputedImpl<T>> impl) : impl_(std::move(impl)) {}

  [[nodiscard]] const T& get() const { return impl_->get(); }
  void set(const T& value) const { impl_->set(value); }
  [[nodiscard]] bool dirty() const { return impl_->dirty(); }
  [[nodiscard]] bool writable() const { return impl_->writable(); }
  void stop() const { impl_->stop(); }
  [[nodiscard]] const std::shared_ptr<ReactiveEffect>& effect() const { return impl_->effect(); }
  [[nodiscard]] std::size_t subscriber_count() const { return impl_->subscriber_count(kValueKey); }

  explicit operator bool() const noexcept { return static_cast<bool>(impl_); }
  friend bool operator==(const Computed& a, const Computed& b) noexcept { return a.impl_ == b.impl_; }

private:
  std::shared_ptr<ComputedImpl<T>> impl_;
};

template <typename F, typename T = std::decay_t<std::invoke_result_t<F&>>>
[[nodiscard]] Computed<T> computed(F getter) {
  return Computed<T>(std::make_shared<ComputedImpl<T>>(std::move(getter), nullptr));
}

template <typename F, typename S, typename T = std::decay_t<std::invoke_result_t<F&>>>
[[nodiscard]] Computed<T> computed(F getter, S setter) {
  return Computed<T>(std::make_shared<ComputedImpl<T>>(std::move(getter), std::move(setter)));
}

template <typename T>
[[nodiscard]] const T& unref(const Computed<T>& c) {
  return c.get();
}

} // namespace tessera::reactive
