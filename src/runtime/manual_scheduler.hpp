#pragma once

#include "runtime/scheduler.hpp"
#include "runtime/timer_queue.hpp"

#include <chrono>
#include <cstddef>
#include <deque>

namespace framewatch::runtime {

// Deterministic scheduler driven by an explicit virtual clock.
//
// Nothing runs until the owner calls `RunPending` or `AdvanceBy`, which makes
// every timer/completion interleaving reproducible in tests and lets a
// "1 second tick" cost nothing in wall time.
class ManualScheduler final : public IScheduler {
public:
  ManualScheduler() = default;

  void Post(Task task) override;
  TimerId SchedulePeriodic(std::chrono::milliseconds interval, Task task) override;
  void Cancel(TimerId id) override;
  bool IsTimerActive(TimerId id) const override;
  std::size_t ActiveTimerCount() const override;

  // Runs queued tasks, including tasks queued by the tasks themselves, until
  // the queue is empty. Returns the number of tasks executed.
  std::size_t RunPending();

  // Moves the virtual clock forward, firing every timer deadline crossed on
  // the way in time order and draining posted tasks after each fire.
  void AdvanceBy(std::chrono::milliseconds delta);

  std::chrono::milliseconds Elapsed() const;
  std::size_t pending_task_count() const;

private:
  TimerQueue::TimePoint now_{};
  TimerQueue timers_;
  std::deque<Task> tasks_;
};

} // namespace framewatch::runtime
