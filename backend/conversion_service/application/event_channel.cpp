#include "event_channel.hpp"

namespace conversion_service {

EventChannel::EventChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool EventChannel::tryPush(StoreEvent event) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_ || events_.size() >= capacity_) {
      return false;
    }
    events_.push_back(std::move(event));
  }
  condition_.notify_one();
  return true;
}

std::optional<StoreEvent> EventChannel::tryPop() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (events_.empty()) {
    return std::nullopt;
  }
  auto event = std::move(events_.front());
  events_.pop_front();
  return event;
}

std::optional<StoreEvent> EventChannel::pop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mtx_);
  condition_.wait_for(lock, timeout, [this] {
    return closed_ || !events_.empty();
  });

  if (events_.empty()) {
    return std::nullopt;
  }
  auto event = std::move(events_.front());
  events_.pop_front();
  return event;
}

void EventChannel::close() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
  }
  condition_.notify_all();
}

bool EventChannel::isClosed() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return closed_;
}

size_t EventChannel::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return events_.size();
}

} // namespace conversion_service
