#pragma once
#include "domain/conversion.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace conversion_service {

// Bounded buffer of store events owned by one subscriber.
// Producers never block: a push into a full or closed channel is refused.
class EventChannel {
public:
  explicit EventChannel(size_t capacity);

  EventChannel(const EventChannel&) = delete;
  EventChannel& operator=(const EventChannel&) = delete;

  bool tryPush(StoreEvent event);

  std::optional<StoreEvent> tryPop();
  // Waits up to timeout. Buffered events are still returned after close.
  std::optional<StoreEvent> pop(std::chrono::milliseconds timeout);

  void close();
  bool isClosed() const;

  size_t size() const;
  size_t capacity() const { return capacity_; }

private:
  mutable std::mutex mtx_;
  std::condition_variable condition_;
  std::deque<StoreEvent> events_;
  const size_t capacity_;
  bool closed_{false};
};

} // namespace conversion_service
