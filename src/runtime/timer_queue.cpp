#include "runtime/timer_queue.hpp"

#include <utility>

namespace framewatch::runtime {

TimerId TimerQueue::Add(const TimePoint now, const std::chrono::milliseconds interval, Task task) {
  if (interval <= std::chrono::milliseconds::zero() || !task) {
    return kInvalidTimerId;
  }
  const TimerId id = next_id_++;
  entries_.emplace(id, Entry{.next_due = now + interval, .interval = interval, .task = std::move(task)});
  return id;
}

bool TimerQueue::Remove(const TimerId id) {
  return entries_.erase(id) > 0U;
}

bool TimerQueue::Contains(const TimerId id) const {
  return entries_.find(id) != entries_.end();
}

std::size_t TimerQueue::size() const {
  return entries_.size();
}

std::optional<TimerQueue::TimePoint> TimerQueue::NextDue() const {
  std::optional<TimePoint> earliest;
  for (const auto& [id, entry] : entries_) {
    if (!earliest.has_value() || entry.next_due < earliest.value()) {
      earliest = entry.next_due;
    }
  }
  return earliest;
}

bool TimerQueue::PopDue(const TimePoint now, TimerId& id, Task& task) {
  auto selected = entries_.end();
  // std::map iterates in id order, so strict `<` keeps the oldest timer first
  // among equal deadlines.
  for (auto it = entries_.begin(); it != entries_.end(); ++it) {
    if (it->second.next_due > now) {
      continue;
    }
    if (selected == entries_.end() || it->second.next_due < selected->second.next_due) {
      selected = it;
    }
  }
  if (selected == entries_.end()) {
    return false;
  }

  Entry& entry = selected->second;
  entry.next_due += entry.interval;
  if (entry.next_due <= now) {
    entry.next_due = now + entry.interval;
  }
  id = selected->first;
  task = entry.task;
  return true;
}

} // namespace framewatch::runtime
