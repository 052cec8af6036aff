#pragma once
#include <optional>
#include <string>

namespace common {

// Producer side of a Server-Sent Events response. The session polls it from
// its strand, so implementations must never block.
class EventSource {
public:
  virtual ~EventSource() = default;

  // Frame written right after the response header, may be empty.
  virtual std::string initialFrame() = 0;
  // Next complete "data: ...\n\n" frame, if one is ready.
  virtual std::optional<std::string> nextFrame() = 0;
  // No more frames will ever be produced; the session closes.
  virtual bool finished() const = 0;
};

}
