#include "encoder_process.hpp"

#include <cerrno>
#include <csignal>
#include <iostream>
#include <limits>
#include <system_error>
#include <fcntl.h>
#include <sys/wait.h>

namespace bp = boost::process;

namespace conversion_service {

namespace {

constexpr size_t kMaxDiagnosticsBytes = 4096;

std::string errnoMessage(int err) {
  return std::error_code(err, std::system_category()).message();
}

} // namespace

std::expected<boost::filesystem::path, std::string> resolveExecutable(const std::string& executable) {
  if (executable.empty()) {
    return std::unexpected("no executable configured");
  }
  if (executable.find('/') != std::string::npos) {
    return boost::filesystem::path(executable);
  }
  auto resolved = bp::search_path(executable);
  if (resolved.empty()) {
    return std::unexpected("executable '" + executable + "' not found in PATH");
  }
  return resolved;
}

std::mutex& processLaunchMutex() {
  static std::mutex mtx;
  return mtx;
}

void markCloseOnExec(bp::ipstream& stream) {
  auto& pipe = stream.pipe();
  for (int fd : {pipe.native_source(), pipe.native_sink()}) {
    if (::fcntl(fd, F_SETFD, FD_CLOEXEC) == -1) {
      std::cerr << "WARN: cannot set FD_CLOEXEC on pipe fd " + std::to_string(fd) + ": " +
                   errnoMessage(errno) + "\n";
    }
  }
}

EncoderProcess::EncoderProcess(Passkey, std::string tag) : tag_(std::move(tag)) {}

std::expected<std::shared_ptr<EncoderProcess>, std::string> EncoderProcess::launch(
    const std::string& executable,
    const std::vector<std::string>& args,
    const std::string& tag) {

  auto exe = resolveExecutable(executable);
  if (!exe) {
    return std::unexpected(exe.error());
  }

  std::shared_ptr<EncoderProcess> process;
  {
    std::lock_guard<std::mutex> lock(processLaunchMutex());
    process = std::make_shared<EncoderProcess>(Passkey{}, tag);
    markCloseOnExec(process->out_);
    markCloseOnExec(process->err_);

    try {
      process->child_ = bp::child(bp::exe = *exe,
                                  bp::args = args,
                                  bp::std_out > process->out_,
                                  bp::std_err > process->err_,
                                  bp::std_in < bp::null);
    } catch (const bp::process_error& e) {
      return std::unexpected(std::string(e.what()));
    }
  }

  auto* raw = process.get();
  process->stderr_reader_ = std::jthread([raw] { raw->readDiagnostics(); });
  return process;
}

EncoderProcess::~EncoderProcess() {
  std::error_code ec;
  if (child_.valid() && child_.running(ec)) {
    child_.terminate(ec);
    child_.wait(ec);
  }
  if (stderr_reader_.joinable()) {
    stderr_reader_.join();
  }
}

int EncoderProcess::pid() const {
  return child_.id();
}

SignalResult EncoderProcess::interrupt() {
  return sendSignal(SIGTERM);
}

SignalResult EncoderProcess::kill() {
  return sendSignal(SIGKILL);
}

bool EncoderProcess::terminationRequested() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return termination_requested_;
}

SignalResult EncoderProcess::sendSignal(int signo) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (exited_) {
    return {SignalStatus::AlreadyExited, "process already exited"};
  }
  if (::kill(child_.id(), signo) != 0) {
    int err = errno;
    if (err == ESRCH) {
      return {SignalStatus::AlreadyExited, "process already exited"};
    }
    return {SignalStatus::Failed, errnoMessage(err)};
  }
  termination_requested_ = true;
  return {SignalStatus::Delivered, {}};
}

void EncoderProcess::drainOutput() {
  out_.ignore(std::numeric_limits<std::streamsize>::max());
}

ProcessExit EncoderProcess::wait() {
  ProcessExit result;

  // wait for termination but leave the zombie in place until exited_ is set
  siginfo_t info{};
  int rc;
  do {
    rc = ::waitid(P_PID, static_cast<id_t>(child_.id()), &info, WEXITED | WNOWAIT);
  } while (rc == -1 && errno == EINTR);
  int wait_err = rc == -1 ? errno : 0;

  {
    std::lock_guard<std::mutex> lock(mtx_);
    exited_ = true;
  }

  std::error_code ec;
  child_.wait(ec);

  if (stderr_reader_.joinable()) {
    stderr_reader_.join();
  }

  if (ec) {
    result.error = ec.message();
    result.code = -1;
    return result;
  }
  if (wait_err != 0) {
    std::cerr << "WARN [job " + tag_ + "]: waitid failed: " + errnoMessage(wait_err) + "\n";
  }

  int status = child_.native_exit_code();
  if (WIFSIGNALED(status)) {
    result.signaled = true;
    result.signal = WTERMSIG(status);
  } else if (WIFEXITED(status)) {
    result.code = WEXITSTATUS(status);
  } else {
    result.code = -1;
  }
  return result;
}

std::string EncoderProcess::diagnostics() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return diagnostics_;
}

void EncoderProcess::readDiagnostics() {
  std::string line;
  while (std::getline(err_, line)) {
    std::cerr << "Encoder stderr [" + tag_ + "]: " + line + "\n";

    std::lock_guard<std::mutex> lock(mtx_);
    diagnostics_ += line;
    diagnostics_ += '\n';
    if (diagnostics_.size() > kMaxDiagnosticsBytes) {
      diagnostics_.erase(0, diagnostics_.size() - kMaxDiagnosticsBytes);
    }
  }
}

} // namespace conversion_service
