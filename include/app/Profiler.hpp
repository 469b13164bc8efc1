#pragma once

#include "render/Diff.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace tessera::app {

struct ProfilerOptions {
  bool enabled{false};
  std::filesystem::path output_file;
  std::size_t max_frames{300};
  bool node_count{false};
};

struct FrameMetrics {
  std::uint64_t id{0};
  std::int64_t timestamp_ms{0};
  int rows{0};
  int cols{0};
  std::optional<std::size_t> node_count;
  std::size_t output_bytes{0};
  render::DiffStats diff;
  double layout_ms{0.0};
  double render_ms{0.0};
  double diff_ms{0.0};
  double write_ms{0.0};
  double frame_ms{0.0};
};

struct ProfileSummary {
  std::size_t frames{0};
  double avg_ms{0.0};
  double p50_ms{0.0};
  double p95_ms{0.0};
  double p99_ms{0.0};
  double max_ms{0.0};
  std::size_t total_bytes{0};
};

enum class ProfilePhase { Layout, Render, Diff, Write };

// Per-frame timing sink. A disabled profiler records nothing; measure()
// still runs the callable so call sites need no branches.
class Profiler {
public:
  explicit Profiler(ProfilerOptions options = {});

  [[nodiscard]] bool enabled() const noexcept { return options_.enabled; }
  [[nodiscard]] bool wants_node_count() const noexcept { return options_.enabled && options_.node_count; }
  [[nodiscard]] const ProfilerOptions& options() const noexcept { return options_; }

  void begin_frame(int rows, int cols);
  // Accumulates into the phase's slot of the open frame.
  template <typename F>
  decltype(auto) measure(ProfilePhase phase, F&& fn) {
    PhaseTimer timer(*this, phase);
    return std::forward<F>(fn)();
  }
  void record_output(std::size_t bytes);
  void record_diff(const render::DiffStats& stats);
  void record_node_count(std::size_t count);
  // Closes the open frame; frames past max_frames evict the oldest.
  void end_frame();
  // Drops an open frame without recording it.
  void abort_frame() noexcept { current_.reset(); }

  [[nodiscard]] const std::deque<FrameMetrics>& frames() const noexcept { return frames_; }
  [[nodiscard]] ProfileSummary summary() const;
  [[nodiscard]] std::string to_json() const;
  // Writes to_json() to output_file. False when disabled, unset, or on I/O error.
  bool flush() const;

private:
  using Clock = std::chrono::steady_clock;

  class PhaseTimer {
  public:
    PhaseTimer(Profiler& p, ProfilePhase phase);
    ~PhaseTimer();
    PhaseTimer(const PhaseTimer&) = delete;
    PhaseTimer& operator=(const PhaseTimer&) = delete;

  private:
    Profiler& profiler_;
    ProfilePhase phase_;
    bool active_;
    Clock::time_point start_;
  };

  void add_phase(ProfilePhase phase, double ms);

  ProfilerOptions options_;
  std::deque<FrameMetrics> frames_;
  std::optional<FrameMetrics> current_;
  Clock::time_point frame_start_{};
  std::uint64_t next_id_{1};
};

} // namespace tessera::app
