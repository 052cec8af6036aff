#pragma once
#include "conversion_store.hpp"
#include <expected>
#include <string>

namespace conversion_service {

enum class AbortErrorCode {
  NotFound,       // no status, or no live process for an incomplete status
  Conflict,       // already finished, failed or aborted
  InternalError   // the process could not be signalled
};

struct AbortError {
  AbortErrorCode code;
  std::string message;
};

class AbortCoordinator {
public:
  explicit AbortCoordinator(ConversionStore& store);

  // Signals the running encoder (graceful first, forceful if that fails) and
  // finalizes the status as aborted.
  std::expected<void, AbortError> abortConversion(const std::string& id);

private:
  ConversionStore& store_;
};

} // namespace conversion_service
