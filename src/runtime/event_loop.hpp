#pragma once

#include "runtime/scheduler.hpp"
#include "runtime/timer_queue.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace framewatch::runtime {

// Wall-clock scheduler that runs tasks and timers on the thread calling
// `RunUntil`/`RunFor`.
//
// `Post` and `RequestStop` may be called from any thread (backend workers,
// signal watchers); everything else is expected on the loop thread.
class EventLoop final : public IScheduler {
public:
  EventLoop() = default;

  void Post(Task task) override;
  TimerId SchedulePeriodic(std::chrono::milliseconds interval, Task task) override;
  void Cancel(TimerId id) override;
  bool IsTimerActive(TimerId id) const override;
  std::size_t ActiveTimerCount() const override;

  // Returns when `deadline` passes or `RequestStop` is called. A pending stop
  // request is consumed by the run it ends.
  void RunUntil(std::chrono::steady_clock::time_point deadline);
  void RunFor(std::chrono::milliseconds duration);

  void RequestStop();

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Task> tasks_;
  TimerQueue timers_;
  bool stop_requested_ = false;
};

} // namespace framewatch::runtime
