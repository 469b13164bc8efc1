#pragma once

#include "reactive/Effect.hpp"
#include <cmath>
#include <concepts>
#include <memory>
#include <type_traits>
#include <utility>

namespace tessera::reactive {

class Object;

// Change detection shared by refs, reactive objects and watchers: operator==
// on the stored value (shared_ptr compares by identity), with NaN equal to
// itself. Types without operator== always count as changed.
template <typename T>
[[nodiscard]] bool has_changed(const T& old_value, const T& new_value) {
  if constexpr (std::is_floating_point_v<T>) {
    if (std::isnan(old_value) && std::isnan(new_value)) return false;
  }
  if constexpr (std::equality_comparable<T>) {
    return !(old_value == new_value);
  } else {
    return true;
  }
}

template <typename T>
class RefImpl : public Target {
public:
  explicit RefImpl(T value, bool shallow) : value_(std::move(value)), shallow_(shallow) {}
  RefImpl(const RefImpl&) = delete;
  RefImpl& operator=(const RefImpl&) = delete;

  const T& get() {
    track(*this, kValueKey);
    return value_;
  }
  [[nodiscard]] const T& peek() const noexcept { return value_; }

  void set(T value) {
    if (!has_changed(value_, value)) return;
    value_ = std::move(value);
    trigger(*this, kValueKey);
  }

  // Mutable access for in-place edits; pair with notify().
  T& raw() noexcept { return value_; }
  void notify() { trigger(*this, kValueKey); }
  [[nodiscard]] bool shallow() const noexcept { return shallow_; }

private:
  T value_;
  bool shallow_;
};

// Shared handle to a reactive cell. Copies alias the same cell; handle
// equality is cell identity.
template <typename T>
class Ref {
public:
  using value_type = T;

  Ref() = default;
  explicit Ref(std::shared_ptr<RefImpl<T>> impl) : impl_(std::move(impl)) {}

  [[nodiscard]] const T& get() const { return impl_->get(); }
  [[nodiscard]] const T& peek() const { return impl_->peek(); }
  void set(T value) const { impl_->set(std::move(value)); }

  template <typename F>
  void update(F&& fn) const {
    T copy = impl_->peek();
    std::forward<F>(fn)(copy);
    impl_->set(std::move(copy));
  }

  [[nodiscard]] bool shallow() const { return impl_->shallow(); }
  [[nodiscard]] std::size_t subscriber_count() const { return impl_->subscriber_count(kValueKey); }
  [[nodiscard]] RefImpl<T>& impl() const { return *impl_; }

  explicit operator bool() const noexcept { return static_cast<bool>(impl_); }
  friend bool operator==(const Ref& a, const Ref& b) noexcept { return a.impl_ == b.impl_; }

private:
  std::shared_ptr<RefImpl<T>> impl_;
};

// Objects are deep-wrapped; see ref(const ObjectPtr&) in Reactive.hpp.
// Call it qualified when the argument is a std type: unqualified ref(s) with
// a std::string or std::shared_ptr lvalue finds std::ref through ADL.
template <typename T>
  requires(!std::is_same_v<std::decay_t<T>, std::shared_ptr<Object>>)
[[nodiscard]] Ref<std::decay_t<T>> ref(T&& value) {
  return Ref<std::decay_t<T>>(std::make_shared<RefImpl<std::decay_t<T>>>(std::forward<T>(value), false));
}

// Only assignment of the whole value is tracked.
template <typename T>
[[nodiscard]] Ref<std::decay_t<T>> shallow_ref(T&& value) {
  return Ref<std::decay_t<T>>(std::make_shared<RefImpl<std::decay_t<T>>>(std::forward<T>(value), true));
}

// Force subscribers of a ref to re-run after an in-place edit.
template <typename T>
void trigger_ref(const Ref<T>& r) {
  r.impl().notify();
}

template <typename T>
struct is_ref : std::false_type {};
template <typename T>
struct is_ref<Ref<T>> : std::true_type {};
template <typename T>
inline constexpr bool is_ref_v = is_ref<std::decay_t<T>>::value;

template <typename T>
[[nodiscard]] const T& unref(const T& value) {
  return value;
}
template <typename T>
[[nodiscard]] const T& unref(const Ref<T>& r) {
  return r.get();
}

} // namespace tessera::reactive
