#include "runtime/scheduler.hpp"

#include <utility>

namespace framewatch::runtime {

ScopedTimer::ScopedTimer(IScheduler& scheduler, const std::chrono::milliseconds interval,
                         Task task)
    : scheduler_(&scheduler), id_(scheduler.SchedulePeriodic(interval, std::move(task))) {}

ScopedTimer::~ScopedTimer() {
  Reset();
}

ScopedTimer::ScopedTimer(ScopedTimer&& other) noexcept
    : scheduler_(std::exchange(other.scheduler_, nullptr)),
      id_(std::exchange(other.id_, kInvalidTimerId)) {}

ScopedTimer& ScopedTimer::operator=(ScopedTimer&& other) noexcept {
  if (this != &other) {
    Reset();
    scheduler_ = std::exchange(other.scheduler_, nullptr);
    id_ = std::exchange(other.id_, kInvalidTimerId);
  }
  return *this;
}

void ScopedTimer::Reset() {
  if (scheduler_ != nullptr && id_ != kInvalidTimerId) {
    scheduler_->Cancel(id_);
  }
  id_ = kInvalidTimerId;
}

bool ScopedTimer::active() const {
  return scheduler_ != nullptr && id_ != kInvalidTimerId && scheduler_->IsTimerActive(id_);
}

TimerId ScopedTimer::id() const {
  return id_;
}

} // namespace framewatch::runtime
