#pragma once

#include "app/ErrorBoundary.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace tessera::app {

using TimerId = std::uint64_t;

// Periodic callbacks driven by the host loop, which asks for the next
// deadline and then runs whatever is due. Cancelled timers never fire again,
// even when cancelled from inside another callback of the same pass.
class Ticker {
public:
  using Clock = std::chrono::steady_clock;

  explicit Ticker(ErrorHandler on_error = {}) : on_error_(std::move(on_error)) {}

  // Intervals under 1ms are raised to 1ms. First fire is one interval from `now`.
  TimerId add(std::chrono::milliseconds interval, std::function<void()> fn, Clock::time_point now = Clock::now());
  bool cancel(TimerId id);
  void cancel_all() noexcept { timers_.clear(); }

  [[nodiscard]] std::optional<Clock::time_point> next_due() const;
  // Milliseconds until the next timer, clamped to [0, cap]; cap without timers.
  [[nodiscard]] int timeout_ms(Clock::time_point now, int cap) const;
  // Fires each due timer once and schedules it one interval later. A throwing
  // callback is reported with phase Tick and stays scheduled. Returns the
  // number of callbacks run.
  std::size_t run_due(Clock::time_point now = Clock::now());

  [[nodiscard]] std::size_t size() const noexcept { return timers_.size(); }
  [[nodiscard]] bool empty() const noexcept { return timers_.empty(); }

private:
  struct Timer {
    TimerId id;
    std::chrono::milliseconds interval;
    Clock::time_point due;
    std::function<void()> fn;
  };

  std::vector<Timer> timers_;
  TimerId next_id_{1};
  ErrorHandler on_error_;
};

} // namespace tessera::app
