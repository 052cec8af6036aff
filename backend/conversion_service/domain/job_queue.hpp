#pragma once
#include "conversion.hpp"
#include <expected>
#include <string>

namespace conversion_service {
class JobQueue {
public:
  virtual ~JobQueue() = default;
  // Non-blocking; fails immediately when the queue is saturated.
  virtual std::expected<void, std::string> queueJob(ConversionJob job) = 0;
};
}
