#include "app/Ticker.hpp"
#include <algorithm>

namespace tessera::app {

TimerId Ticker::add(std::chrono::milliseconds interval, std::function<void()> fn, Clock::time_point now) {
  if (interval < std::chrono::milliseconds(1)) interval = std::chrono::milliseconds(1);
  const TimerId id = next_id_++;
  timers_.push_back(Timer{id, interval, now + interval, std::move(fn)});
  return id;
}

bool Ticker::cancel(TimerId id) {
  auto it = std::find_if(timers_.begin(), timers_.end(), [id](const Timer& t) { return t.id == id; });
  if (it == timers_.end()) return false;
  timers_.erase(it);
  return true;
}

std::optional<Ticker::Clock::time_point> Ticker::next_due() const {
  if (timers_.empty()) return std::nullopt;
  auto it = std::min_element(timers_.begin(), timers_.end(),
                             [](const Timer& a, const Timer& b) { return a.due < b.due; });
  return it->due;
}

int Ticker::timeout_ms(Clock::time_point now, int cap) const {
  auto due = next_due();
  if (!due) return cap;
  if (*due <= now) return 0;
  auto ms = std::chrono::ceil<std::chrono::milliseconds>(*due - now).count();
  return static_cast<int>(std::min<long long>(ms, cap));
}

std::size_t Ticker::run_due(Clock::time_point now) {
  // Callbacks may add or cancel timers; work from a list of ids.
  std::vector<TimerId> due;
  for (const auto& t : timers_) {
    if (t.due <= now) due.push_back(t.id);
  }
  std::size_t ran = 0;
  for (TimerId id : due) {
    auto it = std::find_if(timers_.begin(), timers_.end(), [id](const Timer& t) { return t.id == id; });
    if (it == timers_.end()) continue;
    it->due = now + it->interval;
    auto fn = it->fn;
    ++ran;
    guarded(ErrorPhase::Tick, on_error_, fn);
  }
  return ran;
}

} // namespace tessera::app
