#include "conversion_store.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>

namespace conversion_service {

ConversionStatusView makeStatusView(const std::string& id, const ConversionStatus& status) {
  ConversionStatusView view;
  view.id = id;
  if (!status.output_path.empty()) {
    view.file_name = std::filesystem::path(status.output_path).filename().string();
  }
  view.progress = status.progress;
  view.complete = status.complete;
  view.error = status.error;
  view.format = status.format;
  view.quality = status.quality;
  view.outcome = status.outcome;
  if (status.complete && status.error.empty() && !view.file_name.empty()) {
    view.download_url = std::string(kDownloadPrefix) + view.file_name;
  }
  return view;
}

ConversionStore::ConversionStore(size_t subscriber_buffer)
  : subscriber_buffer_(subscriber_buffer) {}

void ConversionStore::setStatus(const std::string& id, const ConversionStatus& status) {
  {
    std::unique_lock<std::shared_mutex> lock(status_mutex_);
    statuses_[id] = status;
  }
  publishStatus(id);
}

std::optional<ConversionStatus> ConversionStore::getStatus(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(status_mutex_);
  auto it = statuses_.find(id);
  if (it == statuses_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool ConversionStore::deleteStatus(const std::string& id) {
  bool existed = false;
  {
    std::unique_lock<std::shared_mutex> lock(status_mutex_);
    existed = statuses_.erase(id) > 0;
  }
  if (existed) {
    publish(StoreEvent{.type = StoreEventType::Removed, .conversion_id = id, .status = std::nullopt});
  }
  return existed;
}

bool ConversionStore::updateStatusWithError(const std::string& id, const std::string& message,
                                            ConversionOutcome outcome) {
  {
    std::unique_lock<std::shared_mutex> lock(status_mutex_);
    auto it = statuses_.find(id);
    if (it == statuses_.end() || it->second.complete) {
      return false;
    }
    auto& status = it->second;
    status.complete = true;
    status.error = message;
    status.progress = 0.0;
    status.outcome = outcome == ConversionOutcome::Aborted ? ConversionOutcome::Aborted
                                                           : ConversionOutcome::Failed;
  }
  publishStatus(id);
  return true;
}

bool ConversionStore::setProgressPercentage(const std::string& id, double percentage) {
  {
    std::unique_lock<std::shared_mutex> lock(status_mutex_);
    auto it = statuses_.find(id);
    if (it == statuses_.end() || it->second.complete || !it->second.error.empty()) {
      return false;
    }
    if (std::isnan(percentage)) {
      percentage = 0.0;
    }
    it->second.progress = std::clamp(percentage, 0.0, 99.0);
  }
  publishStatus(id);
  return true;
}

bool ConversionStore::updateStatusOnSuccess(const std::string& id) {
  {
    std::unique_lock<std::shared_mutex> lock(status_mutex_);
    auto it = statuses_.find(id);
    if (it == statuses_.end() || it->second.complete) {
      return false;
    }
    auto& status = it->second;
    status.complete = true;
    status.progress = 100.0;
    status.error.clear();
    status.outcome = ConversionOutcome::Succeeded;
  }
  publishStatus(id);
  return true;
}

void ConversionStore::registerActiveCmd(const std::string& id, std::shared_ptr<ProcessHandle> handle) {
  std::unique_lock<std::shared_mutex> lock(active_mutex_);
  active_cmds_[id] = std::move(handle);
}

void ConversionStore::unregisterActiveCmd(const std::string& id) {
  std::unique_lock<std::shared_mutex> lock(active_mutex_);
  active_cmds_.erase(id);
}

std::shared_ptr<ProcessHandle> ConversionStore::getActiveCmd(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(active_mutex_);
  auto it = active_cmds_.find(id);
  if (it == active_cmds_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<ActiveConversionInfo> ConversionStore::getActiveConversionsInfo() const {
  std::vector<ActiveConversionInfo> result;

  // only place two locks are held at once, always in this order
  std::shared_lock<std::shared_mutex> active_lock(active_mutex_);
  std::shared_lock<std::shared_mutex> status_lock(status_mutex_);

  result.reserve(active_cmds_.size());
  for (const auto& [id, handle] : active_cmds_) {
    auto it = statuses_.find(id);
    if (it == statuses_.end() || it->second.complete) {
      continue;
    }
    const auto& status = it->second;
    ActiveConversionInfo info;
    info.id = id;
    info.file_name = std::filesystem::path(status.output_path).filename().string();
    info.format = status.format;
    info.quality = status.quality;
    info.progress = status.progress;
    result.push_back(std::move(info));
  }
  return result;
}

std::shared_ptr<EventChannel> ConversionStore::subscribe() {
  auto channel = std::make_shared<EventChannel>(subscriber_buffer_);
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  subscribers_[channel.get()] = channel;
  return channel;
}

void ConversionStore::unsubscribe(const std::shared_ptr<EventChannel>& channel) {
  if (!channel) {
    return;
  }
  bool found = false;
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    found = subscribers_.erase(channel.get()) > 0;
  }
  if (found) {
    channel->close();
  }
}

size_t ConversionStore::subscriberCount() const {
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  return subscribers_.size();
}

void ConversionStore::publish(const StoreEvent& event) {
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  for (auto it = subscribers_.begin(); it != subscribers_.end();) {
    auto channel = it->second.lock();
    if (!channel) {
      // owner dropped the channel without unsubscribing
      it = subscribers_.erase(it);
      continue;
    }
    // a full subscriber misses this event
    channel->tryPush(event);
    ++it;
  }
}

void ConversionStore::publishStatus(const std::string& id) {
  auto status = getStatus(id);
  if (!status) {
    // deleted concurrently; the removal event covers it
    return;
  }
  publish(StoreEvent{
    .type = StoreEventType::Status,
    .conversion_id = id,
    .status = makeStatusView(id, *status)
  });
}

} // namespace conversion_service
