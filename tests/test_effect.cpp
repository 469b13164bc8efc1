#include "minitest.hpp"
#include "reactive/Effect.hpp"
#include "reactive/Ref.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tessera::reactive;

TEST(effect_sees_each_distinct_write_once) {
  auto count = ref(0);
  std::vector<int> seen;
  auto e = effect([&] { seen.push_back(count.get()); });
  count.set(5);
  count.set(5);
  std::vector<int> want{0, 5};
  ASSERT_EQ(seen, want);
}

TEST(effect_lazy_does_not_run_until_asked) {
  auto r = ref(1);
  int runs = 0;
  auto e = effect([&] { (void)r.get(); ++runs; }, EffectOptions{{}, {}, true});
  ASSERT_EQ(runs, 0);
  r.set(2);
  ASSERT_EQ(runs, 0);
  e->run();
  ASSERT_EQ(runs, 1);
  r.set(3);
  ASSERT_EQ(runs, 2);
}

TEST(effect_recollects_branch_dependencies) {
  auto flag = ref(true);
  auto a = tessera::reactive::ref(std::string("a"));
  auto b = tessera::reactive::ref(std::string("b"));
  std::string last;
  int runs = 0;
  auto e = effect([&] {
    ++runs;
    last = flag.get() ? a.get() : b.get();
  });
  ASSERT_EQ(a.subscriber_count(), 1u);
  ASSERT_EQ(b.subscriber_count(), 0u);
  flag.set(false);
  ASSERT_EQ(last, std::string("b"));
  ASSERT_EQ(a.subscriber_count(), 0u);
  a.set("ignored");
  ASSERT_EQ(runs, 2);
  b.set("bb");
  ASSERT_EQ(last, std::string("bb"));
  ASSERT_EQ(runs, 3);
}

TEST(effect_stop_detaches_and_calls_on_stop) {
  auto r = ref(0);
  int runs = 0;
  int stops = 0;
  EffectOptions opts;
  opts.on_stop = [&] { ++stops; };
  auto e = effect([&] { (void)r.get(); ++runs; }, opts);
  stop(e);
  stop(e);
  ASSERT_EQ(stops, 1);
  ASSERT_TRUE(!e->active());
  ASSERT_EQ(e->dependency_count(), 0u);
  r.set(1);
  ASSERT_EQ(runs, 1);
}

TEST(effect_scheduler_replaces_rerun) {
  auto r = ref(0);
  int runs = 0;
  int scheduled = 0;
  EffectOptions opts;
  opts.scheduler = [&](ReactiveEffect&) { ++scheduled; };
  auto e = effect([&] { (void)r.get(); ++runs; }, opts);
  r.set(1);
  r.set(2);
  ASSERT_EQ(runs, 1);
  ASSERT_EQ(scheduled, 2);
}

TEST(effect_does_not_trigger_itself) {
  auto r = ref(0);
  int runs = 0;
  auto e = effect([&] {
    ++runs;
    r.set(r.get() + 1);
  });
  ASSERT_EQ(runs, 1);
  ASSERT_EQ(r.peek(), 1);
}

TEST(effect_nested_effects_track_independently) {
  auto outer_src = ref(0);
  auto inner_src = ref(0);
  int outer_runs = 0;
  int inner_runs = 0;
  EffectPtr inner;
  auto outer = effect([&] {
    ++outer_runs;
    (void)outer_src.get();
    if (!inner) inner = effect([&] { ++inner_runs; (void)inner_src.get(); });
  });
  inner_src.set(1);
  ASSERT_EQ(outer_runs, 1);
  ASSERT_EQ(inner_runs, 2);
  outer_src.set(1);
  ASSERT_EQ(outer_runs, 2);
  ASSERT_EQ(inner_runs, 2);
}

TEST(effect_dropping_handle_detaches) {
  auto r = ref(0);
  int runs = 0;
  {
    auto e = effect([&] { (void)r.get(); ++runs; });
  }
  r.set(1);
  ASSERT_EQ(runs, 1);
  ASSERT_EQ(r.subscriber_count(), 0u);
}

TEST(effect_pause_tracking_skips_reads) {
  auto r = ref(0);
  int runs = 0;
  auto e = effect([&] {
    ++runs;
    TrackingPause pause;
    (void)r.get();
  });
  r.set(1);
  ASSERT_EQ(runs, 1);
  ASSERT_TRUE(!is_tracking());
}

TEST(effect_trigger_isolates_failures) {
  auto r = ref(0);
  int errors = 0;
  int good_runs = 0;
  auto prev = set_effect_error_handler([&](std::exception_ptr) { ++errors; });
  auto bad = effect([&] {
    if (r.get() > 0) throw std::runtime_error("boom");
  });
  auto good = effect([&] { (void)r.get(); ++good_runs; });
  r.set(1);
  set_effect_error_handler(prev);
  ASSERT_EQ(errors, 1);
  ASSERT_EQ(good_runs, 2);
  ASSERT_TRUE(bad->active());
}

TEST(effect_failed_run_can_run_again) {
  auto r = ref(0);
  int runs = 0;
  auto prev = set_effect_error_handler([](std::exception_ptr) {});
  auto e = effect([&] {
    ++runs;
    if (r.get() == 1) throw std::runtime_error("once");
  });
  r.set(1);
  r.set(2);
  set_effect_error_handler(prev);
  ASSERT_EQ(runs, 3);
}

TEST(effect_warning_handler_receives_messages) {
  std::string got;
  auto prev = set_warning_handler([&](std::string_view m) { got = std::string(m); });
  warn("careful");
  set_warning_handler(prev);
  ASSERT_EQ(got, std::string("careful"));
}

TEST(effect_stopped_during_trigger_does_not_run) {
  auto r = ref(0);
  EffectPtr later;
  int later_runs = 0;
  auto first = effect([&] {
    if (r.get() > 0 && later) later->stop();
  });
  later = effect([&] { (void)r.get(); ++later_runs; });
  ASSERT_EQ(later_runs, 1);
  ASSERT_EQ(r.subscriber_count(), 2u);
  r.set(1);
  ASSERT_EQ(later_runs, 1);
  ASSERT_TRUE(!later->active());
  ASSERT_EQ(r.subscriber_count(), 1u);
}
