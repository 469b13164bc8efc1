#include "app/App.hpp"
#include "reactive/Computed.hpp"
#include "reactive/Ref.hpp"
#include "reactive/Watch.hpp"
#include "render/Color.hpp"
#include "view/Element.hpp"

#include <charconv>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>

using namespace std::chrono_literals;
using namespace tessera;

namespace {

constexpr const char* kSpinner[] = {"|", "/", "-", "\\"};

bool parse_count(const char* s, std::uint64_t& out) {
  const char* end = s + std::strlen(s);
  auto [ptr, ec] = std::from_chars(s, end, out);
  return ec == std::errc{} && ptr == end;
}

void print_help() {
  std::cout << "Usage: tessera-demo [--profile FILE] [--frames N]\n";
  std::cout << "Keys: + / up increment, - / down decrement, r reset, q quit.\n";
  std::cout << "Notes: Ctrl+C also quits. Settings are read from $XDG_CONFIG_HOME/tessera/config.toml.\n";
}

} // namespace

int main(int argc, char** argv) {
  std::string profile_path;
  std::uint64_t max_frames = 0;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--profile" && i + 1 < argc) profile_path = argv[++i];
    else if (a == "--frames" && i + 1 < argc) {
      if (!parse_count(argv[++i], max_frames)) {
        std::fprintf(stderr, "tessera-demo: --frames expects a non-negative integer\n");
        return 2;
      }
    }
    else if (a == "-h" || a == "--help") {
      print_help();
      return 0;
    } else {
      std::fprintf(stderr, "tessera-demo: unknown argument '%s'\n", a.c_str());
      print_help();
      return 2;
    }
  }

  auto count = reactive::ref(0);
  auto spin = reactive::ref(0);
  auto label = reactive::computed([count] {
    const int v = count.get();
    if (v == 0) return std::string("zero");
    return std::string(v > 0 ? "positive " : "negative ") + std::to_string(v);
  });
  auto peak = reactive::ref(0);
  auto peak_watch = reactive::watch(count, [peak](const int& v, const std::optional<int>&, const reactive::OnCleanup&) {
    if (v > peak.peek()) peak.set(v);
  });

  auto root_view = [=] {
    using namespace view;
    return vstack({
        hstack({
            text("tessera").foreground(render::Color::named(14)),
            spacer(),
            text(kSpinner[spin.get() % 4]).foreground(render::Color::named(8)),
        }).padding(Edges::symmetric(0, 1)),
        block({
            text("Count: " + std::to_string(count.get())),
            text(label.get()).foreground(count.get() < 0 ? render::Color::named(9) : render::Color::named(10)),
            text("Peak: " + std::to_string(peak.get())),
        }).border(BorderStyle::Single, render::Color::named(8)).padding(Edges::symmetric(0, 1)).gap(0),
        spacer(),
        text("+/- adjust  r reset  q quit").foreground(render::Color::named(8)),
    });
  };

  app::AppOptions options;
  options.max_frames = max_frames;
  if (!profile_path.empty()) {
    app::ProfilerOptions p;
    p.enabled = true;
    p.output_file = profile_path;
    p.node_count = true;
    options.profile = p;
  }

  try {
    app::App demo(root_view, std::move(options));
    demo.on_key([&](const ui::KeyEvent& k) {
      if (k.name == "+" || k.name == "=" || k.name == "up") count.set(count.peek() + 1);
      else if (k.name == "-" || k.name == "down") count.set(count.peek() - 1);
      else if (k.name == "r") count.set(0);
      else if (k.name == "q" || k.name == "escape") demo.exit(0);
      else return false;
      return true;
    });
    demo.on_tick(120ms, [&] { spin.set(spin.peek() + 1); });
    return demo.run();
  } catch (const std::exception& e) {
    std::fprintf(stderr, "tessera-demo: %s\n", e.what());
    return 1;
  }
}
