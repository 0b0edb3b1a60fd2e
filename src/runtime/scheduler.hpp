#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

namespace framewatch::runtime {

using Task = std::function<void()>;
using TimerId = std::uint64_t;

constexpr TimerId kInvalidTimerId = 0U;

// Single-threaded scheduling contract shared by the monitoring components.
//
// All posted tasks and timer callbacks run one at a time on the scheduler's
// thread, so a callback never observes another transition half-applied.
// Backend completions are re-posted through `Post` rather than run inline.
class IScheduler {
public:
  virtual ~IScheduler() = default;

  // Queues `task` behind everything already queued.
  virtual void Post(Task task) = 0;

  // Registers a repeating timer. The first fire happens one `interval` from
  // now; returns kInvalidTimerId when `interval` is not positive.
  virtual TimerId SchedulePeriodic(std::chrono::milliseconds interval, Task task) = 0;

  // Cancels a timer. Unknown or already-cancelled ids are ignored.
  virtual void Cancel(TimerId id) = 0;

  virtual bool IsTimerActive(TimerId id) const = 0;
  virtual std::size_t ActiveTimerCount() const = 0;
};

// Owning handle for one periodic timer; the timer is cancelled when the
// handle is reset or destroyed.
class ScopedTimer {
public:
  ScopedTimer() = default;
  ScopedTimer(IScheduler& scheduler, std::chrono::milliseconds interval, Task task);
  ~ScopedTimer();

  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;
  ScopedTimer(ScopedTimer&& other) noexcept;
  ScopedTimer& operator=(ScopedTimer&& other) noexcept;

  // Cancels the owned timer. Idempotent.
  void Reset();

  bool active() const;
  TimerId id() const;

private:
  IScheduler* scheduler_ = nullptr;
  TimerId id_ = kInvalidTimerId;
};

// Read side of a session cancellation flag. A default-constructed token is
// already cancelled so work captured before any session began is inert.
class CancellationToken {
public:
  CancellationToken() = default;

  bool IsCancelled() const {
    return state_ == nullptr || *state_;
  }

private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<const bool> state) : state_(std::move(state)) {}

  std::shared_ptr<const bool> state_;
};

// Write side of the flag. Destroying the source cancels every token it
// handed out.
class CancellationSource {
public:
  CancellationSource() : state_(std::make_shared<bool>(false)) {}
  ~CancellationSource() {
    Cancel();
  }

  CancellationSource(const CancellationSource&) = delete;
  CancellationSource& operator=(const CancellationSource&) = delete;

  CancellationToken token() const {
    return CancellationToken(state_);
  }

  void Cancel() {
    *state_ = true;
  }

  bool cancelled() const {
    return *state_;
  }

private:
  std::shared_ptr<bool> state_;
};

} // namespace framewatch::runtime
