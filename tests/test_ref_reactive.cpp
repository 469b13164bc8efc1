#include "minitest.hpp"
#include "reactive/Reactive.hpp"
#include "reactive/Ref.hpp"
#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace tessera::reactive;

TEST(ref_nan_assignment_is_not_a_change) {
  auto r = ref(std::numeric_limits<double>::quiet_NaN());
  int runs = 0;
  auto e = effect([&] { (void)r.get(); ++runs; });
  r.set(std::numeric_limits<double>::quiet_NaN());
  ASSERT_EQ(runs, 1);
  r.set(1.0);
  ASSERT_EQ(runs, 2);
}

TEST(ref_shared_ptr_compares_by_identity) {
  auto a = std::make_shared<int>(1);
  auto b = std::make_shared<int>(1);
  auto r = tessera::reactive::ref(a);
  int runs = 0;
  auto e = effect([&] { (void)r.get(); ++runs; });
  r.set(a);
  ASSERT_EQ(runs, 1);
  r.set(b);
  ASSERT_EQ(runs, 2);
}

TEST(ref_copies_alias_one_cell) {
  auto r = ref(1);
  auto alias = r;
  alias.set(7);
  ASSERT_EQ(r.peek(), 7);
  ASSERT_TRUE(r == alias);
  ASSERT_TRUE(!(r == ref(7)));
}

TEST(ref_update_and_trigger_ref) {
  auto list = shallow_ref(std::vector<int>{1});
  int runs = 0;
  auto e = effect([&] { (void)list.get(); ++runs; });
  list.impl().raw().push_back(2);
  ASSERT_EQ(runs, 1);
  trigger_ref(list);
  ASSERT_EQ(runs, 2);
  list.update([](std::vector<int>& v) { v.push_back(3); });
  ASSERT_EQ(runs, 3);
  ASSERT_EQ(list.peek().size(), 3u);
  ASSERT_TRUE(list.shallow());
}

TEST(ref_unref_passes_values_through) {
  auto r = ref(4);
  ASSERT_EQ(unref(r), 4);
  ASSERT_EQ(unref(5), 5);
  ASSERT_TRUE(is_ref_v<decltype(r)>);
  ASSERT_TRUE(!is_ref_v<int>);
}

TEST(reactive_tracks_per_key) {
  auto obj = Object::make({{"a", std::int64_t{1}}, {"b", std::int64_t{2}}});
  auto state = reactive(obj);
  int runs = 0;
  auto e = effect([&] { (void)state.get("a"); ++runs; });
  state.set("b", std::int64_t{3});
  ASSERT_EQ(runs, 1);
  state.set("a", std::int64_t{5});
  ASSERT_EQ(runs, 2);
  state.set("a", std::int64_t{5});
  ASSERT_EQ(runs, 2);
  ASSERT_EQ(state.get_as<std::int64_t>("a", 0), 5);
}

TEST(reactive_wrappers_are_memoized) {
  auto obj = Object::make();
  ASSERT_TRUE(reactive(obj) == reactive(obj));
  ASSERT_TRUE(!(reactive(obj) == shallow_reactive(obj)));
  ASSERT_TRUE(to_raw(reactive(obj)) == obj);
}

TEST(reactive_nested_objects_are_deep) {
  auto inner = Object::make({{"n", std::int64_t{1}}});
  auto state = reactive(Object::make({{"inner", inner}}));
  int runs = 0;
  auto e = effect([&] { (void)state.child("inner").get("n"); ++runs; });
  state.child("inner").set("n", std::int64_t{2});
  ASSERT_EQ(runs, 2);
  ASSERT_TRUE(state.child("inner") == reactive(inner));
}

TEST(reactive_shallow_returns_raw_nested) {
  auto inner = Object::make({{"n", std::int64_t{1}}});
  auto state = shallow_reactive(Object::make({{"inner", inner}}));
  ASSERT_TRUE(!state.child("inner"));
  int runs = 0;
  auto e = effect([&] { (void)state.get("inner"); ++runs; });
  inner->set("n", std::int64_t{9});
  ASSERT_EQ(runs, 1);
}

TEST(reactive_key_add_and_remove_notify_iteration) {
  auto state = reactive(Object::make());
  std::size_t seen = 99;
  auto e = effect([&] { seen = state.keys().size(); });
  ASSERT_EQ(seen, 0u);
  state.set("x", true);
  ASSERT_EQ(seen, 1u);
  ASSERT_TRUE(state.remove("x"));
  ASSERT_EQ(seen, 0u);
  ASSERT_TRUE(!state.remove("x"));
}

TEST(reactive_has_tracks_missing_keys) {
  auto state = reactive(Object::make());
  bool present = true;
  auto e = effect([&] { present = state.has("later"); });
  ASSERT_TRUE(!present);
  state.set("later", std::string("v"));
  ASSERT_TRUE(present);
}

TEST(reactive_ref_of_object_is_deep) {
  auto r = tessera::reactive::ref(Object::make({{"k", std::int64_t{1}}}));
  int runs = 0;
  auto e = effect([&] { (void)r.get().get("k"); ++runs; });
  r.get().set("k", std::int64_t{2});
  ASSERT_EQ(runs, 2);
}

TEST(reactive_property_refs_bind_both_ways) {
  auto state = reactive(Object::make({{"a", std::int64_t{1}}, {"b", std::string("x")}}));
  auto a = to_ref(state, "a");
  a.set(std::int64_t{4});
  ASSERT_TRUE(state.get("a") == Value{std::int64_t{4}});
  auto refs = to_refs(state);
  ASSERT_EQ(refs.size(), 2u);
  ASSERT_EQ(refs[1].key(), std::string("b"));
  ASSERT_TRUE(is_ref_v<PropertyRef>);
}

TEST(reactive_null_object_throws) {
  bool threw = false;
  try { (void)reactive(nullptr); } catch (const std::invalid_argument&) { threw = true; }
  ASSERT_TRUE(threw);
}

TEST(reactive_nan_property_is_not_a_change) {
  auto state = reactive(Object::make({{"x", std::numeric_limits<double>::quiet_NaN()}}));
  int runs = 0;
  auto e = effect([&] { (void)state.get("x"); ++runs; });
  state.set("x", Value{std::numeric_limits<double>::quiet_NaN()});
  ASSERT_EQ(runs, 1);
  state.set("x", Value{1.5});
  ASSERT_EQ(runs, 2);
  ASSERT_TRUE(!has_changed(Value{1.5}, Value{1.5}));
  ASSERT_TRUE(has_changed(Value{1.5}, Value{std::int64_t{1}}));
}
