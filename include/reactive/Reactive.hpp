#pragma once

#include "reactive/Ref.hpp"
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tessera::reactive {

class Object;
using ObjectPtr = std::shared_ptr<Object>;
using Value = std::variant<std::monostate, bool, std::int64_t, double, std::string, ObjectPtr>;

// Variant equality, except that NaN doubles are equal to each other.
[[nodiscard]] bool has_changed(const Value& old_value, const Value& new_value);

// Plain keyed data. Direct access here is untracked; go through reactive()
// to observe or notify. The object also owns the dependency sets of every
// wrapper over it.
class Object : public Target {
public:
  Object() = default;
  Object(std::initializer_list<std::pair<const std::string, Value>> init) : fields_(init) {}

  [[nodiscard]] static ObjectPtr make(std::initializer_list<std::pair<const std::string, Value>> init = {}) {
    return std::make_shared<Object>(init);
  }

  [[nodiscard]] const Value* find(std::string_view key) const;
  [[nodiscard]] Value get(std::string_view key) const;
  void set(std::string_view key, Value value);
  [[nodiscard]] bool has(std::string_view key) const { return find(key) != nullptr; }
  bool erase(std::string_view key);
  [[nodiscard]] std::vector<std::string> keys() const;
  [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }

private:
  std::map<std::string, Value, std::less<>> fields_;
};

class ReactiveObject;

// Tracked view of an Object. Wrappers are memoized per object, so wrapping
// the same object twice yields equal handles.
class Reactive {
public:
  Reactive() = default;
  explicit Reactive(std::shared_ptr<ReactiveObject> impl) : impl_(std::move(impl)) {}

  [[nodiscard]] Value get(std::string_view key) const;
  // Nested object under `key`, wrapped the same way as this one; an empty
  // handle when the field is missing or not an object.
  [[nodiscard]] Reactive child(std::string_view key) const;

  template <typename T>
  [[nodiscard]] T get_as(std::string_view key, T fallback) const {
    Value v = get(key);
    if (auto* p = std::get_if<T>(&v)) return *p;
    return fallback;
  }

  // Notifies only when the stored value changes. Adding or removing a key
  // also notifies keys()/has() readers.
  void set(std::string_view key, Value value) const;
  void set(std::string_view key, const Reactive& nested) const;
  bool remove(std::string_view key) const;
  [[nodiscard]] bool has(std::string_view key) const;
  [[nodiscard]] std::vector<std::string> keys() const;

  [[nodiscard]] const ObjectPtr& raw() const;
  [[nodiscard]] bool shallow() const;

  explicit operator bool() const noexcept { return static_cast<bool>(impl_); }
  friend bool operator==(const Reactive& a, const Reactive& b) noexcept { return a.impl_ == b.impl_; }

private:
  std::shared_ptr<ReactiveObject> impl_;
};

[[nodiscard]] Reactive reactive(const ObjectPtr& obj);
// Only top-level keys are tracked; nested objects are returned raw.
[[nodiscard]] Reactive shallow_reactive(const ObjectPtr& obj);
[[nodiscard]] inline ObjectPtr to_raw(const Reactive& r) { return r.raw(); }

// Deep: the ref holds reactive(obj).
[[nodiscard]] Ref<Reactive> ref(const ObjectPtr& obj);

// Registers a read of every key at every depth of `r`.
void traverse(const Reactive& r);

// Two-way binding to one property of a reactive object.
class PropertyRef {
public:
  PropertyRef(Reactive target, std::string key) : target_(std::move(target)), key_(std::move(key)) {}
  [[nodiscard]] Value get() const { return target_.get(key_); }
  void set(Value v) const { target_.set(key_, std::move(v)); }
  [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
  Reactive target_;
  std::string key_;
};

[[nodiscard]] inline PropertyRef to_ref(const Reactive& target, std::string key) {
  return PropertyRef(target, std::move(key));
}
[[nodiscard]] std::vector<PropertyRef> to_refs(const Reactive& target);

template <>
struct is_ref<PropertyRef> : std::true_type {};

} // namespace tessera::reactive
