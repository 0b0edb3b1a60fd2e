#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

namespace framewatch::runtime {

// Externally owned "operator holds device control" flag.
//
// Observers are notified synchronously, only when the value actually changes,
// on the thread that calls `Set` (the scheduler thread in this codebase).
class ControlSignal {
public:
  using Observer = std::function<void(bool active)>;

  // Unsubscribes on destruction. Must not outlive the signal it came from.
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    void Reset();

  private:
    friend class ControlSignal;
    Subscription(ControlSignal* signal, std::uint64_t id) : signal_(signal), id_(id) {}

    ControlSignal* signal_ = nullptr;
    std::uint64_t id_ = 0U;
  };

  explicit ControlSignal(bool initially_active = false) : active_(initially_active) {}

  ControlSignal(const ControlSignal&) = delete;
  ControlSignal& operator=(const ControlSignal&) = delete;

  bool active() const {
    return active_;
  }

  void Set(bool active);

  [[nodiscard]] Subscription Subscribe(Observer observer);

  std::size_t observer_count() const {
    return observers_.size();
  }

private:
  void Unsubscribe(std::uint64_t id);

  bool active_ = false;
  std::map<std::uint64_t, Observer> observers_;
  std::uint64_t next_id_ = 1U;
};

} // namespace framewatch::runtime
