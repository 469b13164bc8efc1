#include "minitest.hpp"
#include "app/RenderLoop.hpp"
#include "layout/FlexLayout.hpp"
#include "reactive/Ref.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tessera;

namespace {

struct Harness {
  app::TerminalSize size{2, 4};
  std::string out;
  std::vector<app::ErrorContext> errors;
  render::PoolRegistry pools{2, 4};
  std::shared_ptr<layout::FlexLayoutEngine> engine = std::make_shared<layout::FlexLayoutEngine>();

  app::RenderLoopConfig config(std::function<view::Element()> view) {
    engine->initialize();
    app::RenderLoopConfig c;
    c.get_size = [this] { return size; };
    c.write = [this](std::string_view s) { out.append(s); };
    c.view = std::move(view);
    c.layout_engine = engine;
    c.on_error = [this](const app::ErrorContext& ctx) { errors.push_back(ctx); };
    c.pools = &pools;
    return c;
  }
};

std::string cell(const app::RenderLoop& loop, int row, int col) {
  const auto* b = loop.previous();
  return b ? b->glyph(b->index(row, col)) : std::string();
}

} // namespace

TEST(render_loop_requires_callbacks) {
  app::RenderLoopConfig c;
  bool threw = false;
  try {
    app::RenderLoop loop(c);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  ASSERT_TRUE(threw);
}

TEST(render_loop_first_frame_then_quiet) {
  Harness h;
  app::RenderLoop loop(h.config([] { return view::text("hi"); }));
  ASSERT_TRUE(loop.render_once());
  ASSERT_TRUE(!h.out.empty());
  ASSERT_EQ(cell(loop, 0, 0), std::string("h"));
  ASSERT_EQ(cell(loop, 0, 1), std::string("i"));
  ASSERT_EQ(loop.frame_count(), 1u);

  h.out.clear();
  ASSERT_TRUE(loop.render_once());
  ASSERT_TRUE(h.out.empty());
  ASSERT_EQ(loop.frame_count(), 2u);
  ASSERT_TRUE(loop.phase() == app::RenderPhase::Idle);
}

TEST(render_loop_writes_only_changed_cells) {
  Harness h;
  std::string label = "ab";
  app::RenderLoop loop(h.config([&] { return view::text(label); }));
  ASSERT_TRUE(loop.render_once());
  h.out.clear();
  label = "ax";
  ASSERT_TRUE(loop.render_once());
  ASSERT_EQ(h.out, std::string("\x1B[1;2Hx"));
}

TEST(render_loop_forced_redraw_rewrites_everything) {
  Harness h;
  app::RenderLoop loop(h.config([] { return view::text("hi"); }));
  ASSERT_TRUE(loop.render_once());
  h.out.clear();
  ASSERT_TRUE(loop.render_once(true));
  ASSERT_TRUE(h.out.find("\x1B[1;1Hh\x1B[1;2Hi") != std::string::npos);

  h.out.clear();
  loop.request_full_redraw();
  ASSERT_TRUE(loop.render_once());
  ASSERT_TRUE(h.out.find("\x1B[1;1Hh\x1B[1;2Hi") != std::string::npos);
}

TEST(render_loop_rerenders_on_state_change) {
  Harness h;
  auto label = reactive::ref(std::string("one"));
  app::RenderLoop loop(h.config([label] { return view::text(label.get()); }));
  loop.render();
  ASSERT_EQ(loop.frame_count(), 1u);
  ASSERT_EQ(cell(loop, 0, 0), std::string("o"));

  label.set("two");
  ASSERT_EQ(loop.frame_count(), 2u);
  ASSERT_EQ(cell(loop, 0, 0), std::string("t"));

  label.set("two");
  ASSERT_EQ(loop.frame_count(), 2u);

  loop.render();
  ASSERT_EQ(loop.frame_count(), 3u);
}

TEST(render_loop_resize_rebinds_pool) {
  Harness h;
  app::RenderLoop loop(h.config([] { return view::text("hi"); }));
  ASSERT_TRUE(loop.render_once());
  auto first = loop.pool();
  ASSERT_TRUE(first->matches(2, 4));

  h.size = {3, 6};
  h.out.clear();
  ASSERT_TRUE(loop.render_once());
  ASSERT_TRUE(loop.pool() != first);
  ASSERT_TRUE(loop.pool()->matches(3, 6));
  ASSERT_TRUE(loop.size() == (app::TerminalSize{3, 6}));
  ASSERT_EQ(loop.previous()->rows(), 3);
  ASSERT_EQ(loop.previous()->cols(), 6);
  ASSERT_TRUE(h.out.find("\x1B[1;1Hh\x1B[1;2Hi") != std::string::npos);
}

TEST(render_loop_view_failure_reported_as_render) {
  Harness h;
  bool fail = false;
  app::RenderLoop loop(h.config([&] {
    if (fail) throw std::runtime_error("view broke");
    return view::text("ok");
  }));
  ASSERT_TRUE(loop.render_once());
  const auto pooled = loop.pool()->size();

  fail = true;
  h.out.clear();
  ASSERT_TRUE(!loop.render_once());
  ASSERT_EQ(h.errors.size(), 1u);
  ASSERT_TRUE(h.errors[0].phase == app::ErrorPhase::Render);
  ASSERT_EQ(h.errors[0].message, std::string("view broke"));
  ASSERT_EQ(h.errors[0].metadata.at("frame"), std::string("2"));
  ASSERT_EQ(h.errors[0].metadata.at("size"), std::string("4x2"));
  ASSERT_TRUE(h.out.empty());
  ASSERT_EQ(loop.frame_count(), 1u);
  ASSERT_EQ(loop.pool()->size(), pooled);
  ASSERT_EQ(cell(loop, 0, 0), std::string("o"));

  fail = false;
  ASSERT_TRUE(loop.render_once());
  ASSERT_EQ(loop.frame_count(), 2u);
}

TEST(render_loop_uninitialized_engine_reported_as_layout) {
  Harness h;
  auto cfg = h.config([] { return view::text("x"); });
  cfg.layout_engine = std::make_shared<layout::FlexLayoutEngine>();
  app::RenderLoop loop(std::move(cfg));
  ASSERT_TRUE(!loop.render_once());
  ASSERT_EQ(h.errors.size(), 1u);
  ASSERT_TRUE(h.errors[0].phase == app::ErrorPhase::Layout);
  ASSERT_TRUE(loop.previous() == nullptr);
}

TEST(render_loop_write_failure_returns_buffer) {
  Harness h;
  auto cfg = h.config([] { return view::text("x"); });
  cfg.write = [](std::string_view) { throw std::runtime_error("closed"); };
  app::RenderLoop loop(std::move(cfg));
  ASSERT_TRUE(!loop.render_once());
  ASSERT_EQ(h.errors.size(), 1u);
  ASSERT_TRUE(h.errors[0].phase == app::ErrorPhase::Write);
  ASSERT_EQ(loop.pool()->size(), 2u);
  ASSERT_TRUE(loop.previous() == nullptr);
}

TEST(render_loop_failed_frame_keeps_full_redraw_pending) {
  Harness h;
  bool fail_write = true;
  auto cfg = h.config([] { return view::text("x"); });
  cfg.write = [&](std::string_view s) {
    if (fail_write) throw std::runtime_error("closed");
    h.out.append(s);
  };
  app::RenderLoop loop(std::move(cfg));
  ASSERT_TRUE(!loop.render_once());
  fail_write = false;
  ASSERT_TRUE(loop.render_once());
  ASSERT_TRUE(h.out.find('x') != std::string::npos);
}

TEST(render_loop_negative_size_reported_as_resize) {
  Harness h;
  h.size = {-1, 4};
  app::RenderLoop loop(h.config([] { return view::text("x"); }));
  ASSERT_TRUE(!loop.render_once());
  ASSERT_EQ(h.errors.size(), 1u);
  ASSERT_TRUE(h.errors[0].phase == app::ErrorPhase::Resize);
}

TEST(render_loop_profiler_records_frames) {
  Harness h;
  app::Profiler profiler(app::ProfilerOptions{true, {}, 10, true});
  auto cfg = h.config([] { return view::vstack({view::text("a"), view::text("b")}); });
  cfg.profiler = &profiler;
  app::RenderLoop loop(std::move(cfg));
  ASSERT_TRUE(loop.render_once());
  ASSERT_TRUE(loop.render_once());
  ASSERT_EQ(profiler.frames().size(), 2u);
  const auto& first = profiler.frames().front();
  ASSERT_EQ(first.rows, 2);
  ASSERT_EQ(first.cols, 4);
  ASSERT_TRUE(first.node_count.has_value());
  ASSERT_EQ(*first.node_count, 3u);
  ASSERT_TRUE(first.diff.full_redraw);
  ASSERT_TRUE(first.output_bytes > 0);
  ASSERT_EQ(profiler.frames().back().output_bytes, 0u);
}

TEST(render_loop_dispose_stops_rendering) {
  Harness h;
  auto n = reactive::ref(0);
  app::RenderLoop loop(h.config([n] { return view::text(std::to_string(n.get())); }));
  loop.render();
  ASSERT_EQ(loop.frame_count(), 1u);
  loop.dispose();
  ASSERT_TRUE(loop.disposed());
  ASSERT_TRUE(loop.previous() == nullptr);
  ASSERT_EQ(loop.pool()->size(), 2u);
  n.set(1);
  ASSERT_EQ(loop.frame_count(), 1u);
  ASSERT_TRUE(!loop.render_once());
  loop.dispose();
}

TEST(render_loop_update_hooks_wrap_later_frames) {
  Harness h;
  auto label = reactive::ref(std::string("a"));
  auto seen = reactive::ref(0);
  std::vector<std::string> log;
  auto cfg = h.config([&] {
    log.push_back("view");
    return view::text(label.get());
  });
  cfg.on_before_update = [&] {
    (void)seen.get();
    log.push_back("before");
  };
  cfg.on_updated = [&] { log.push_back("updated"); };
  app::RenderLoop loop(std::move(cfg));
  loop.render();
  ASSERT_EQ(log, (std::vector<std::string>{"view"}));

  label.set("b");
  ASSERT_EQ(log, (std::vector<std::string>{"view", "before", "view", "updated"}));
  ASSERT_EQ(cell(loop, 0, 0), std::string("b"));

  // Reads inside hooks are not dependencies of the frame.
  seen.set(1);
  ASSERT_EQ(loop.frame_count(), 2u);
}

TEST(render_loop_hook_failure_reported_frame_still_drawn) {
  Harness h;
  std::string label = "a";
  auto cfg = h.config([&] { return view::text(label); });
  cfg.on_before_update = [] { throw std::runtime_error("hook broke"); };
  int updated = 0;
  cfg.on_updated = [&] { ++updated; };
  app::RenderLoop loop(std::move(cfg));
  ASSERT_TRUE(loop.render_once());
  ASSERT_TRUE(h.errors.empty());

  label = "b";
  ASSERT_TRUE(loop.render_once());
  ASSERT_EQ(h.errors.size(), 1u);
  ASSERT_TRUE(h.errors[0].phase == app::ErrorPhase::Lifecycle);
  ASSERT_EQ(h.errors[0].metadata.at("frame"), std::string("2"));
  ASSERT_EQ(cell(loop, 0, 0), std::string("b"));
  ASSERT_EQ(updated, 1);
}

TEST(render_loop_failed_frame_skips_updated) {
  Harness h;
  bool fail = false;
  int before = 0;
  int updated = 0;
  auto cfg = h.config([&] {
    if (fail) throw std::runtime_error("view broke");
    return view::text("x");
  });
  cfg.on_before_update = [&] { ++before; };
  cfg.on_updated = [&] { ++updated; };
  app::RenderLoop loop(std::move(cfg));
  ASSERT_TRUE(loop.render_once());
  fail = true;
  ASSERT_TRUE(!loop.render_once());
  ASSERT_EQ(before, 1);
  ASSERT_EQ(updated, 0);
}

TEST(render_loop_keeps_focus_targets_of_last_frame) {
  Harness h;
  h.size = {3, 6};
  bool fail = false;
  auto cfg = h.config([&] {
    if (fail) throw std::runtime_error("view broke");
    return view::vstack({view::text("a"), view::text("b").focus_key("field")});
  });
  app::RenderLoop loop(std::move(cfg));
  ASSERT_TRUE(loop.focus_targets().empty());
  ASSERT_TRUE(loop.render_once());
  ASSERT_EQ(loop.focus_targets().size(), 1u);
  ASSERT_EQ(loop.focus_targets()[0].focus_key, std::string("field"));
  ASSERT_TRUE(loop.focus_targets()[0].rect == (layout::Rect{0, 1, 6, 1}));

  fail = true;
  ASSERT_TRUE(!loop.render_once());
  ASSERT_EQ(loop.focus_targets().size(), 1u);
  loop.dispose();
  ASSERT_TRUE(loop.focus_targets().empty());
}
