#include "runtime/manual_scheduler.hpp"

#include <utility>

namespace framewatch::runtime {

void ManualScheduler::Post(Task task) {
  if (task) {
    tasks_.push_back(std::move(task));
  }
}

TimerId ManualScheduler::SchedulePeriodic(const std::chrono::milliseconds interval, Task task) {
  return timers_.Add(now_, interval, std::move(task));
}

void ManualScheduler::Cancel(const TimerId id) {
  (void)timers_.Remove(id);
}

bool ManualScheduler::IsTimerActive(const TimerId id) const {
  return timers_.Contains(id);
}

std::size_t ManualScheduler::ActiveTimerCount() const {
  return timers_.size();
}

std::size_t ManualScheduler::RunPending() {
  std::size_t executed = 0U;
  while (!tasks_.empty()) {
    Task task = std::move(tasks_.front());
    tasks_.pop_front();
    task();
    ++executed;
  }
  return executed;
}

void ManualScheduler::AdvanceBy(const std::chrono::milliseconds delta) {
  const TimerQueue::TimePoint target = now_ + delta;
  (void)RunPending();

  while (true) {
    const auto next_due = timers_.NextDue();
    if (!next_due.has_value() || next_due.value() > target) {
      break;
    }
    now_ = next_due.value();

    TimerId id = kInvalidTimerId;
    Task task;
    if (!timers_.PopDue(now_, id, task)) {
      break;
    }
    task();
    (void)RunPending();
  }

  now_ = target;
  (void)RunPending();
}

std::chrono::milliseconds ManualScheduler::Elapsed() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(now_.time_since_epoch());
}

std::size_t ManualScheduler::pending_task_count() const {
  return tasks_.size();
}

} // namespace framewatch::runtime
