#include "runtime/control_signal.hpp"

#include <utility>
#include <vector>

namespace framewatch::runtime {

ControlSignal::Subscription::~Subscription() {
  Reset();
}

ControlSignal::Subscription::Subscription(Subscription&& other) noexcept
    : signal_(std::exchange(other.signal_, nullptr)), id_(std::exchange(other.id_, 0U)) {}

ControlSignal::Subscription&
ControlSignal::Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    Reset();
    signal_ = std::exchange(other.signal_, nullptr);
    id_ = std::exchange(other.id_, 0U);
  }
  return *this;
}

void ControlSignal::Subscription::Reset() {
  if (signal_ != nullptr) {
    signal_->Unsubscribe(id_);
  }
  signal_ = nullptr;
  id_ = 0U;
}

void ControlSignal::Set(const bool active) {
  if (active == active_) {
    return;
  }
  active_ = active;

  // Observers may unsubscribe (for example by stopping a session) while being
  // notified, so iterate over a snapshot and skip entries removed meanwhile.
  std::vector<std::uint64_t> ids;
  ids.reserve(observers_.size());
  for (const auto& [id, observer] : observers_) {
    ids.push_back(id);
  }
  for (const std::uint64_t id : ids) {
    const auto it = observers_.find(id);
    if (it == observers_.end()) {
      continue;
    }
    Observer observer = it->second;
    observer(active);
  }
}

ControlSignal::Subscription ControlSignal::Subscribe(Observer observer) {
  if (!observer) {
    return Subscription();
  }
  const std::uint64_t id = next_id_++;
  observers_.emplace(id, std::move(observer));
  return Subscription(this, id);
}

void ControlSignal::Unsubscribe(const std::uint64_t id) {
  observers_.erase(id);
}

} // namespace framewatch::runtime
