#pragma once
#include <string>

namespace conversion_service {

enum class SignalStatus {
  Delivered,
  AlreadyExited,
  Failed
};

struct SignalResult {
  SignalStatus status{SignalStatus::Delivered};
  std::string reason;   // set when status is Failed

  bool ok() const { return status != SignalStatus::Failed; }
};

// Cancellable handle to a running encoder process.
class ProcessHandle {
public:
  virtual ~ProcessHandle() = default;
  virtual int pid() const = 0;
  // graceful termination request (SIGTERM on POSIX)
  virtual SignalResult interrupt() = 0;
  // forceful termination (SIGKILL on POSIX)
  virtual SignalResult kill() = 0;
};

} // namespace conversion_service
