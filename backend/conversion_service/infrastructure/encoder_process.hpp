#pragma once
#include "domain/process_handle.hpp"

#include <expected>
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/process.hpp>

namespace conversion_service {

struct ProcessExit {
  bool signaled{false};
  int signal{0};
  int code{0};
  std::string error;   // the wait itself failed

  bool success() const { return !signaled && code == 0 && error.empty(); }
};

// Resolves a bare program name through PATH; paths are used as given.
std::expected<boost::filesystem::path, std::string> resolveExecutable(const std::string& executable);

// Every child launch holds this lock while its pipes are created and the
// process is forked, and the pipes are close-on-exec, so no child inherits
// the pipes of a sibling launched by another worker.
std::mutex& processLaunchMutex();
void markCloseOnExec(boost::process::ipstream& stream);

// A running encoder with stdout exposed for progress parsing and stderr
// collected in the background.
class EncoderProcess : public ProcessHandle {
  // only launch() can construct one
  struct Passkey {
    explicit Passkey() = default;
  };

public:
  EncoderProcess(Passkey, std::string tag);

  static std::expected<std::shared_ptr<EncoderProcess>, std::string> launch(
    const std::string& executable,
    const std::vector<std::string>& args,
    const std::string& tag
  );

  ~EncoderProcess() override;

  EncoderProcess(const EncoderProcess&) = delete;
  EncoderProcess& operator=(const EncoderProcess&) = delete;

  int pid() const override;
  SignalResult interrupt() override;
  SignalResult kill() override;

  // true once interrupt() or kill() delivered a signal
  bool terminationRequested() const;

  std::istream& output() { return out_; }
  // discards the rest of stdout so the encoder never blocks on a full pipe
  void drainOutput();

  // Blocks until the process exits and reaps it. Signals sent after the
  // process has exited report AlreadyExited instead of reaching a reused pid.
  ProcessExit wait();

  // tail of stderr, complete after wait()
  std::string diagnostics() const;

private:
  SignalResult sendSignal(int signo);
  void readDiagnostics();

  std::string tag_;
  boost::process::ipstream out_;
  boost::process::ipstream err_;
  boost::process::child child_;
  std::jthread stderr_reader_;

  mutable std::mutex mtx_;
  std::string diagnostics_;
  bool exited_{false};
  bool termination_requested_{false};
};

} // namespace conversion_service
