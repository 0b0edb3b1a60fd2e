#pragma once

#include "runtime/scheduler.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>

namespace framewatch::runtime {

// Bookkeeping for periodic timers shared by the manual and realtime
// schedulers. Time is supplied by the caller so the same queue runs on a
// virtual clock in tests and on steady_clock in the event loop.
class TimerQueue {
public:
  using TimePoint = std::chrono::steady_clock::time_point;

  TimerId Add(TimePoint now, std::chrono::milliseconds interval, Task task);
  bool Remove(TimerId id);
  bool Contains(TimerId id) const;
  std::size_t size() const;

  std::optional<TimePoint> NextDue() const;

  // Takes the earliest timer due at or before `now` (ties broken by creation
  // order), advances its deadline by one interval and hands back a copy of its
  // task. A timer that fell more than one interval behind is re-anchored on
  // `now` instead of firing a burst of catch-up ticks.
  bool PopDue(TimePoint now, TimerId& id, Task& task);

private:
  struct Entry {
    TimePoint next_due{};
    std::chrono::milliseconds interval{};
    Task task;
  };

  std::map<TimerId, Entry> entries_;
  TimerId next_id_ = 1U;
};

} // namespace framewatch::runtime
