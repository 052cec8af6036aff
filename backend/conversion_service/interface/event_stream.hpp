#pragma once
#include "application/conversion_store.hpp"
#include "common/restful/event_source.hpp"
#include <memory>
#include <optional>
#include <string>

namespace conversion_service {

// Store subscription rendered as SSE frames. Holds the subscription for its
// whole lifetime and unsubscribes when the HTTP session drops it.
class ConversionEventStream : public common::EventSource {
public:
  explicit ConversionEventStream(ConversionStore& store);
  ~ConversionEventStream() override;

  ConversionEventStream(const ConversionEventStream&) = delete;
  ConversionEventStream& operator=(const ConversionEventStream&) = delete;

  // "event: snapshot" with the currently active conversions
  std::string initialFrame() override;
  std::optional<std::string> nextFrame() override;
  bool finished() const override;

private:
  ConversionStore& store_;
  std::shared_ptr<EventChannel> channel_;
};

} // namespace conversion_service
