#include "runtime/event_loop.hpp"

#include <utility>

namespace framewatch::runtime {

void EventLoop::Post(Task task) {
  if (!task) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mu_);
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
}

TimerId EventLoop::SchedulePeriodic(const std::chrono::milliseconds interval, Task task) {
  TimerId id = kInvalidTimerId;
  {
    std::lock_guard<std::mutex> lock(mu_);
    id = timers_.Add(std::chrono::steady_clock::now(), interval, std::move(task));
  }
  cv_.notify_one();
  return id;
}

void EventLoop::Cancel(const TimerId id) {
  std::lock_guard<std::mutex> lock(mu_);
  (void)timers_.Remove(id);
}

bool EventLoop::IsTimerActive(const TimerId id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return timers_.Contains(id);
}

std::size_t EventLoop::ActiveTimerCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return timers_.size();
}

void EventLoop::RunUntil(const std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(mu_);
  while (true) {
    if (stop_requested_) {
      stop_requested_ = false;
      return;
    }

    if (!tasks_.empty()) {
      Task task = std::move(tasks_.front());
      tasks_.pop_front();
      lock.unlock();
      task();
      lock.lock();
      continue;
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return;
    }

    TimerId id = kInvalidTimerId;
    Task timer_task;
    if (timers_.PopDue(now, id, timer_task)) {
      lock.unlock();
      timer_task();
      lock.lock();
      continue;
    }

    auto wake_at = deadline;
    const auto next_due = timers_.NextDue();
    if (next_due.has_value() && next_due.value() < wake_at) {
      wake_at = next_due.value();
    }
    cv_.wait_until(lock, wake_at);
  }
}

void EventLoop::RunFor(const std::chrono::milliseconds duration) {
  RunUntil(std::chrono::steady_clock::now() + duration);
}

void EventLoop::RequestStop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = true;
  }
  cv_.notify_one();
}

} // namespace framewatch::runtime
