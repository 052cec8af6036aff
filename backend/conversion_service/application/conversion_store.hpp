#pragma once
#include "domain/conversion.hpp"
#include "domain/process_handle.hpp"
#include "event_channel.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace conversion_service {

ConversionStatusView makeStatusView(const std::string& id, const ConversionStatus& status);

// Single source of truth for conversion status, live process handles and
// the push-event fan-out. Statuses, process handles and subscribers are each
// guarded by their own lock; no lock is held while another one is taken,
// except the fixed active -> status order in getActiveConversionsInfo().
//
// Backpressure: a subscriber whose buffer is full misses that event. Events
// carry the latest state of the record at publish time, so a subscriber that
// dropped intermediate ticks still converges on the next event for that id.
class ConversionStore {
public:
  explicit ConversionStore(size_t subscriber_buffer = 16);

  ConversionStore(const ConversionStore&) = delete;
  ConversionStore& operator=(const ConversionStore&) = delete;

  // Inserts or replaces; always publishes.
  void setStatus(const std::string& id, const ConversionStatus& status);
  std::optional<ConversionStatus> getStatus(const std::string& id) const;
  // Publishes a removal only if the entry existed.
  bool deleteStatus(const std::string& id);

  // The mutators below return whether the record changed. A complete record
  // is never changed again and nothing is published for a rejected call.
  bool updateStatusWithError(const std::string& id, const std::string& message,
                             ConversionOutcome outcome = ConversionOutcome::Failed);
  // Clamps into [0, 99]; rejected once complete or errored.
  bool setProgressPercentage(const std::string& id, double percentage);
  bool updateStatusOnSuccess(const std::string& id);

  void registerActiveCmd(const std::string& id, std::shared_ptr<ProcessHandle> handle);
  void unregisterActiveCmd(const std::string& id);
  std::shared_ptr<ProcessHandle> getActiveCmd(const std::string& id) const;

  // Registered and not complete; a finished job whose handle is still
  // registered is left out.
  std::vector<ActiveConversionInfo> getActiveConversionsInfo() const;

  std::shared_ptr<EventChannel> subscribe();
  // Closes the channel; unknown channels are ignored.
  void unsubscribe(const std::shared_ptr<EventChannel>& channel);
  size_t subscriberCount() const;

private:
  void publish(const StoreEvent& event);
  void publishStatus(const std::string& id);

  mutable std::shared_mutex status_mutex_;
  std::unordered_map<std::string, ConversionStatus> statuses_;

  mutable std::shared_mutex active_mutex_;
  std::unordered_map<std::string, std::shared_ptr<ProcessHandle>> active_cmds_;

  mutable std::mutex subscribers_mutex_;
  // the caller owns the channel, the store only keeps a weak registration
  std::map<const EventChannel*, std::weak_ptr<EventChannel>> subscribers_;
  const size_t subscriber_buffer_;
};

} // namespace conversion_service
