#include "app/Profiler.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <vector>

namespace tessera::app {

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

// Nearest-rank percentile over a sorted sample.
double percentile(const std::vector<double>& sorted, double p) {
  if (sorted.empty()) return 0.0;
  auto rank = static_cast<std::size_t>(std::ceil(p / 100.0 * static_cast<double>(sorted.size())));
  rank = std::clamp<std::size_t>(rank, 1, sorted.size());
  return sorted[rank - 1];
}

void append_ms(std::string& out, const char* name, double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "\"%s\":%.3f", name, v);
  out += buf;
}

void append_uint(std::string& out, const char* name, std::uint64_t v) {
  out += '"';
  out += name;
  out += "\":";
  out += std::to_string(v);
}

} // namespace

Profiler::PhaseTimer::PhaseTimer(Profiler& p, ProfilePhase phase)
    : profiler_(p), phase_(phase), active_(p.current_.has_value()) {
  if (active_) start_ = Clock::now();
}

Profiler::PhaseTimer::~PhaseTimer() {
  if (active_) profiler_.add_phase(phase_, elapsed_ms(start_));
}

Profiler::Profiler(ProfilerOptions options) : options_(std::move(options)) {
  if (options_.max_frames == 0) options_.max_frames = 1;
}

void Profiler::begin_frame(int rows, int cols) {
  if (!options_.enabled) return;
  FrameMetrics m;
  m.id = next_id_++;
  m.timestamp_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
  m.rows = rows;
  m.cols = cols;
  current_ = m;
  frame_start_ = Clock::now();
}

void Profiler::add_phase(ProfilePhase phase, double ms) {
  if (!current_) return;
  switch (phase) {
    case ProfilePhase::Layout: current_->layout_ms += ms; break;
    case ProfilePhase::Render: current_->render_ms += ms; break;
    case ProfilePhase::Diff: current_->diff_ms += ms; break;
    case ProfilePhase::Write: current_->write_ms += ms; break;
  }
}

void Profiler::record_output(std::size_t bytes) {
  if (current_) current_->output_bytes += bytes;
}

void Profiler::record_diff(const render::DiffStats& stats) {
  if (current_) current_->diff = stats;
}

void Profiler::record_node_count(std::size_t count) {
  if (current_ && options_.node_count) current_->node_count = count;
}

void Profiler::end_frame() {
  if (!current_) return;
  current_->frame_ms = elapsed_ms(frame_start_);
  frames_.push_back(std::move(*current_));
  current_.reset();
  while (frames_.size() > options_.max_frames) frames_.pop_front();
}

ProfileSummary Profiler::summary() const {
  ProfileSummary s;
  s.frames = frames_.size();
  if (frames_.empty()) return s;
  std::vector<double> times;
  times.reserve(frames_.size());
  double total = 0.0;
  for (const auto& f : frames_) {
    times.push_back(f.frame_ms);
    total += f.frame_ms;
    s.total_bytes += f.output_bytes;
  }
  std::sort(times.begin(), times.end());
  s.avg_ms = total / static_cast<double>(times.size());
  s.p50_ms = percentile(times, 50.0);
  s.p95_ms = percentile(times, 95.0);
  s.p99_ms = percentile(times, 99.0);
  s.max_ms = times.back();
  return s;
}

std::string Profiler::to_json() const {
  const auto s = summary();
  std::string out;
  out.reserve(256 + frames_.size() * 256);
  out += "{\"summary\":{";
  append_uint(out, "frames", s.frames);
  out += ',';
  append_ms(out, "avg_ms", s.avg_ms);
  out += ',';
  append_ms(out, "p50_ms", s.p50_ms);
  out += ',';
  append_ms(out, "p95_ms", s.p95_ms);
  out += ',';
  append_ms(out, "p99_ms", s.p99_ms);
  out += ',';
  append_ms(out, "max_ms", s.max_ms);
  out += ',';
  append_uint(out, "total_bytes", s.total_bytes);
  out += "},\"frames\":[";
  bool first = true;
  for (const auto& f : frames_) {
    if (!first) out += ',';
    first = false;
    out += '{';
    append_uint(out, "id", f.id);
    out += ",\"timestamp_ms\":" + std::to_string(f.timestamp_ms);
    out += ",\"rows\":" + std::to_string(f.rows);
    out += ",\"cols\":" + std::to_string(f.cols);
    if (f.node_count) {
      out += ',';
      append_uint(out, "node_count", *f.node_count);
    }
    out += ',';
    append_uint(out, "output_bytes", f.output_bytes);
    out += ',';
    append_ms(out, "layout_ms", f.layout_ms);
    out += ',';
    append_ms(out, "render_ms", f.render_ms);
    out += ',';
    append_ms(out, "diff_ms", f.diff_ms);
    out += ',';
    append_ms(out, "write_ms", f.write_ms);
    out += ',';
    append_ms(out, "frame_ms", f.frame_ms);
    out += ",\"diff\":{";
    out += std::string("\"full_redraw\":") + (f.diff.full_redraw ? "true" : "false");
    out += ',';
    append_uint(out, "changed_cells", f.diff.changed_cells);
    out += ',';
    append_uint(out, "cursor_moves", f.diff.cursor_moves);
    out += ',';
    append_uint(out, "fg_changes", f.diff.fg_changes);
    out += ',';
    append_uint(out, "bg_changes", f.diff.bg_changes);
    out += ',';
    append_uint(out, "resets", f.diff.resets);
    out += ',';
    append_uint(out, "ops", f.diff.ops);
    out += "}}";
  }
  out += "]}\n";
  return out;
}

bool Profiler::flush() const {
  if (!options_.enabled || options_.output_file.empty()) return false;
  std::ofstream file(options_.output_file, std::ios::trunc);
  if (!file) {
    std::fprintf(stderr, "tessera: Profiler: failed to open %s: %s\n", options_.output_file.c_str(),
                 std::strerror(errno));
    return false;
  }
  const auto json = to_json();
  file.write(json.data(), static_cast<std::streamsize>(json.size()));
  return static_cast<bool>(file);
}

} // namespace tessera::app
