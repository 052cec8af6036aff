#include "abort_coordinator.hpp"
#include <iostream>

namespace conversion_service {

AbortCoordinator::AbortCoordinator(ConversionStore& store) : store_(store) {}

std::expected<void, AbortError> AbortCoordinator::abortConversion(const std::string& id) {
  auto status = store_.getStatus(id);
  if (!status) {
    return std::unexpected(AbortError{AbortErrorCode::NotFound, "Conversion not found"});
  }
  if (status->complete) {
    return std::unexpected(AbortError{AbortErrorCode::Conflict, "Conversion already completed"});
  }

  auto handle = store_.getActiveCmd(id);
  if (!handle) {
    // the worker may have finished and unregistered in between
    auto latest = store_.getStatus(id);
    if (latest && latest->complete) {
      return std::unexpected(AbortError{AbortErrorCode::Conflict,
                                        "Conversion completed before abort request processed"});
    }
    return std::unexpected(AbortError{AbortErrorCode::NotFound, "Active conversion process not found"});
  }

  std::cout << "Aborting conversion " + id + " (pid " + std::to_string(handle->pid()) + ")\n";

  auto result = handle->interrupt();
  if (result.status == SignalStatus::Failed) {
    std::cerr << "WARN [job " + id + "]: graceful termination failed (" + result.reason +
                 "), sending kill\n";
    result = handle->kill();
  }

  if (result.status == SignalStatus::Failed) {
    auto message = "Abort requested, but process termination failed: " + result.reason;
    std::cerr << "ERROR [job " + id + "]: " + message + "\n";
    if (!store_.updateStatusWithError(id, message)) {
      std::cerr << "WARN [job " + id + "]: status was already final, failure not recorded\n";
    }
    return std::unexpected(AbortError{AbortErrorCode::InternalError, message});
  }

  bool recorded = store_.updateStatusWithError(id, std::string(kAbortedMessage), ConversionOutcome::Aborted);
  store_.unregisterActiveCmd(id);
  if (!recorded) {
    auto final_status = store_.getStatus(id);
    auto outcome = final_status ? outcomeName(final_status->outcome) : std::string_view("removed");
    std::cerr << "WARN [job " + id + "]: process signalled, but the job had already finished as " +
                 std::string(outcome) + "\n";
    return {};
  }
  std::cout << "Conversion " + id + " aborted\n";
  return {};
}

} // namespace conversion_service
