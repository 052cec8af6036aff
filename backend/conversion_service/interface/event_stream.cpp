#include "event_stream.hpp"
#include "json_serialization.hpp"

namespace conversion_service {

ConversionEventStream::ConversionEventStream(ConversionStore& store)
  : store_(store), channel_(store.subscribe()) {}

ConversionEventStream::~ConversionEventStream() {
  store_.unsubscribe(channel_);
}

std::string ConversionEventStream::initialFrame() {
  nlohmann::json active = store_.getActiveConversionsInfo();
  return "event: snapshot\ndata: " + active.dump() + "\n\n";
}

std::optional<std::string> ConversionEventStream::nextFrame() {
  auto event = channel_->tryPop();
  if (!event) {
    return std::nullopt;
  }
  nlohmann::json j = *event;
  return "data: " + j.dump() + "\n\n";
}

bool ConversionEventStream::finished() const {
  return channel_->isClosed() && channel_->size() == 0;
}

} // namespace conversion_service
