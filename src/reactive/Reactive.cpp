#include "reactive/Reactive.hpp"
#include <cmath>
#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace tessera::reactive {

namespace {

// Tracked by keys() and notified when a key is added or removed.
constexpr std::string_view kIterateKey = "\x01iterate";

using WrapperMap = std::unordered_map<const Object*, std::weak_ptr<ReactiveObject>>;

struct WrapperRegistry {
  WrapperMap deep;
  WrapperMap shallow;
  std::size_t prune_at{64};
};

WrapperRegistry& registry() {
  thread_local WrapperRegistry r;
  return r;
}

void prune(WrapperMap& m) {
  for (auto it = m.begin(); it != m.end();) {
    if (it->second.expired()) it = m.erase(it);
    else ++it;
  }
}

} // namespace

class ReactiveObject {
public:
  ReactiveObject(ObjectPtr raw, bool shallow) : raw_(std::move(raw)), shallow_(shallow) {}

  [[nodiscard]] Object& target() const { return *raw_; }
  [[nodiscard]] const ObjectPtr& raw() const noexcept { return raw_; }
  [[nodiscard]] bool shallow() const noexcept { return shallow_; }

private:
  ObjectPtr raw_;
  bool shallow_;
};

namespace {

Reactive wrap(const ObjectPtr& obj, bool shallow) {
  if (!obj) throw std::invalid_argument("reactive: null object");
  auto& reg = registry();
  auto& map = shallow ? reg.shallow : reg.deep;
  if (auto it = map.find(obj.get()); it != map.end()) {
    if (auto existing = it->second.lock()) return Reactive(std::move(existing));
  }
  if (map.size() >= reg.prune_at) {
    prune(map);
    reg.prune_at = std::max<std::size_t>(64, map.size() * 2);
  }
  auto impl = std::make_shared<ReactiveObject>(obj, shallow);
  map[obj.get()] = impl;
  return Reactive(std::move(impl));
}

void traverse_into(const Reactive& r, std::unordered_set<const Object*>& seen) {
  if (!r || !seen.insert(r.raw().get()).second) return;
  for (const auto& k : r.keys()) {
    Value v = r.get(k);
    if (std::holds_alternative<ObjectPtr>(v)) traverse_into(r.child(k), seen);
  }
}

} // namespace

// ---- Object ----

const Value* Object::find(std::string_view key) const {
  auto it = fields_.find(key);
  return it == fields_.end() ? nullptr : &it->second;
}

Value Object::get(std::string_view key) const {
  const Value* v = find(key);
  return v ? *v : Value{};
}

void Object::set(std::string_view key, Value value) {
  auto it = fields_.find(key);
  if (it != fields_.end()) it->second = std::move(value);
  else fields_.emplace(std::string(key), std::move(value));
}

bool Object::erase(std::string_view key) {
  auto it = fields_.find(key);
  if (it == fields_.end()) return false;
  fields_.erase(it);
  return true;
}

std::vector<std::string> Object::keys() const {
  std::vector<std::string> out;
  out.reserve(fields_.size());
  for (const auto& [k, v] : fields_) out.push_back(k);
  return out;
}

// ---- Reactive ----

Value Reactive::get(std::string_view key) const {
  auto& obj = impl_->target();
  track(obj, key);
  return obj.get(key);
}

Reactive Reactive::child(std::string_view key) const {
  Value v = get(key);
  auto* nested = std::get_if<ObjectPtr>(&v);
  if (!nested || !*nested || impl_->shallow()) return Reactive{};
  return wrap(*nested, false);
}

bool has_changed(const Value& old_value, const Value& new_value) {
  const auto* a = std::get_if<double>(&old_value);
  const auto* b = std::get_if<double>(&new_value);
  if (a && b && std::isnan(*a) && std::isnan(*b)) return false;
  return !(old_value == new_value);
}

void Reactive::set(std::string_view key, Value value) const {
  auto& obj = impl_->target();
  const Value* old = obj.find(key);
  const bool had = old != nullptr;
  if (had && !has_changed(*old, value)) return;
  obj.set(key, std::move(value));
  trigger(obj, key);
  if (!had) trigger(obj, kIterateKey);
}

void Reactive::set(std::string_view key, const Reactive& nested) const {
  set(key, Value{nested ? nested.raw() : ObjectPtr{}});
}

bool Reactive::remove(std::string_view key) const {
  auto& obj = impl_->target();
  if (!obj.erase(key)) return false;
  trigger(obj, key);
  trigger(obj, kIterateKey);
  return true;
}

bool Reactive::has(std::string_view key) const {
  auto& obj = impl_->target();
  track(obj, key);
  return obj.has(key);
}

std::vector<std::string> Reactive::keys() const {
  auto& obj = impl_->target();
  track(obj, kIterateKey);
  return obj.keys();
}

const ObjectPtr& Reactive::raw() const { return impl_->raw(); }
bool Reactive::shallow() const { return impl_->shallow(); }

Reactive reactive(const ObjectPtr& obj) { return wrap(obj, false); }
Reactive shallow_reactive(const ObjectPtr& obj) { return wrap(obj, true); }

Ref<Reactive> ref(const ObjectPtr& obj) {
  return Ref<Reactive>(std::make_shared<RefImpl<Reactive>>(reactive(obj), false));
}

void traverse(const Reactive& r) {
  std::unordered_set<const Object*> seen;
  traverse_into(r, seen);
}

std::vector<PropertyRef> to_refs(const Reactive& target) {
  std::vector<PropertyRef> out;
  for (auto& k : target.keys()) out.emplace_back(target, std::move(k));
  return out;
}

} // namespace tessera::reactive
