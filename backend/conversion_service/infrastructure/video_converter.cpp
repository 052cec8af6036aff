// video_converter.cpp
#include "video_converter.hpp"
#include "application/progress_extractor.hpp"
#include "application/quality_catalog.hpp"
#include "encoder_command.hpp"
#include "encoder_process.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace conversion_service {

namespace {

// Keeps the process handle registered for exactly as long as the encoder runs.
class ActiveRegistration {
public:
  ActiveRegistration(ConversionStore& store, std::string id, std::shared_ptr<ProcessHandle> handle)
    : store_(store), id_(std::move(id)) {
    store_.registerActiveCmd(id_, std::move(handle));
  }
  ~ActiveRegistration() { store_.unregisterActiveCmd(id_); }

  ActiveRegistration(const ActiveRegistration&) = delete;
  ActiveRegistration& operator=(const ActiveRegistration&) = delete;

private:
  ConversionStore& store_;
  std::string id_;
};

std::string joinArgs(const std::vector<std::string>& args) {
  std::string joined;
  for (const auto& arg : args) {
    if (!joined.empty()) joined += ' ';
    joined += arg;
  }
  return joined;
}

void removeFile(const std::string& id, const std::string& path, const char* what) {
  if (path.empty()) {
    return;
  }
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    std::cerr << "WARN [job " + id + "]: failed to remove " + what + " " + path + ": " + ec.message() + "\n";
  }
}

} // namespace

VideoConverter::VideoConverter(size_t worker_count, ConversionStore& store, ConverterOptions options)
  : store_(store),
    options_(std::move(options)),
    metadata_copier_(options_.metadata_tool_path),
    worker_count_(worker_count == 0 ? 1 : worker_count),
    capacity_(worker_count_ * 2) {}

VideoConverter::~VideoConverter() {
  stop();
}

void VideoConverter::start() {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  if (started_ || stop_) {
    return;
  }
  started_ = true;
  for (size_t i = 0; i < worker_count_; ++i) {
    workers_.emplace_back([this, i] { workerLoop(i + 1); });
  }
  std::cout << "Started " + std::to_string(worker_count_) + " conversion workers\n";
}

void VideoConverter::stop() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    stop_ = true;
  }
  condition_.notify_all();

  bool joined = false;
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
      joined = true;
    }
  }
  workers_.clear();
  if (joined) {
    std::cout << "All conversion workers stopped\n";
  }
}

std::expected<void, std::string> VideoConverter::queueJob(ConversionJob job) {
  const auto id = job.conversion_id;
  const auto file = fs::path(job.input_path).filename().string();
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (stop_) {
      return std::unexpected("converter is stopped, cannot accept job " + id);
    }
    if (jobs_.size() >= capacity_) {
      auto message = "conversion queue is full, cannot accept job " + id;
      std::cerr << "ERROR: failed to queue job " + id + ": " + message + "\n";
      return std::unexpected(message);
    }
    jobs_.push(std::move(job));
  }
  condition_.notify_one();

  std::cout << "Job " + id + " queued (File: " + file + ")\n";
  return {};
}

size_t VideoConverter::queueSize() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return jobs_.size();
}

void VideoConverter::workerLoop(size_t worker_id) {
  const auto name = "Worker " + std::to_string(worker_id);
  std::cout << name + " started\n";

  while (true) {
    ConversionJob job;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      condition_.wait(lock, [this] {
        return stop_ || !jobs_.empty();
      });

      if (stop_ && jobs_.empty()) break;

      job = std::move(jobs_.front());
      jobs_.pop();
    }

    std::cout << name + ": processing job " + job.conversion_id + " (File: " +
                 fs::path(job.input_path).filename().string() + ")\n";
    try {
      convertVideo(job);
    } catch (const std::exception& e) {
      failJob(job, "Unexpected conversion error: " + std::string(e.what()));
    }
    std::cout << name + ": finished job " + job.conversion_id + "\n";
  }

  std::cout << name + " stopped\n";
}

void VideoConverter::convertVideo(const ConversionJob& job) {
  const auto& id = job.conversion_id;

  if (!store_.getStatus(id)) {
    std::cerr << "WARN [job " + id + "]: no status record, converting anyway\n";
  }

  std::error_code ec;
  auto output_dir = fs::path(job.output_path).parent_path();
  if (!output_dir.empty()) {
    fs::create_directories(output_dir, ec);
    if (ec) {
      failJob(job, "Failed to ensure output directory exists: " + ec.message());
      return;
    }
  }

  auto args = buildEncoderArgs(job, resolveQualitySetting(job.quality), options_.encoder_threads);
  if (!args) {
    failJob(job, args.error());
    return;
  }

  std::cout << "Executing encoder for job " + id + ": " + options_.encoder_path + " " +
               joinArgs(*args) + "\n";

  auto launched = EncoderProcess::launch(options_.encoder_path, *args, id);
  if (!launched) {
    failJob(job, "Failed to start encoder: " + launched.error());
    return;
  }
  auto process = *launched;

  ProcessExit exit;
  {
    ActiveRegistration registration(store_, id, process);

    ProgressExtractor extractor(store_, id, options_.progress_throttle, options_.progress_step);
    extractor.run(process->output());
    process->drainOutput();
    exit = process->wait();
  }

  if (process->terminationRequested()) {
    finishAborted(job);
    return;
  }

  if (!exit.success()) {
    std::string message;
    if (!exit.error.empty()) {
      message = "Encoder wait failed: " + exit.error;
    } else if (exit.signaled) {
      message = "Conversion process terminated unexpectedly (signal " + std::to_string(exit.signal) + ")";
    } else {
      message = "Encoder execution failed with exit code " + std::to_string(exit.code);
      auto diagnostics = process->diagnostics();
      if (!diagnostics.empty()) {
        message += ": " + diagnostics;
      }
    }
    failJob(job, message);
    return;
  }

  auto size = fs::file_size(job.output_path, ec);
  if (ec) {
    failJob(job, "Encoder finished but output file error: " + ec.message());
    return;
  }
  if (size == 0) {
    failJob(job, "Encoder finished but output file is empty (0 bytes)");
    return;
  }

  // the input has to stay readable until the metadata is copied
  auto copied = metadata_copier_.copy(job.input_path, job.output_path);
  if (!copied) {
    std::cerr << "WARN [job " + id + "]: metadata copy failed: " + copied.error() + "\n";
  } else {
    std::cout << "Copied metadata for job " + id + "\n";
  }

  if (!store_.updateStatusOnSuccess(id)) {
    auto current = store_.getStatus(id);
    if (current && current->outcome == ConversionOutcome::Aborted) {
      finishAborted(job);
      return;
    }
    if (current) {
      // finalized elsewhere as a failure, so the output is not kept
      std::cerr << "WARN [job " + id + "]: encoder succeeded after the job was finalized: " +
                   current->error + "\n";
      removeArtifacts(job, true);
      return;
    }
    std::cerr << "WARN [job " + id + "]: status disappeared before completion\n";
  } else {
    std::cout << "Conversion successful for job " + id + ": " +
                 fs::path(job.input_path).filename().string() + " -> " +
                 fs::path(job.output_path).filename().string() + " (" + std::to_string(size) +
                 " bytes)\n";
  }

  removeArtifacts(job, false);
}

void VideoConverter::failJob(const ConversionJob& job, const std::string& message) {
  std::cerr << "ERROR [job " + job.conversion_id + "]: " + message + "\n";
  if (!store_.updateStatusWithError(job.conversion_id, message)) {
    std::cerr << "WARN [job " + job.conversion_id + "]: status was already final, failure not recorded\n";
  }
  removeArtifacts(job, true);
}

void VideoConverter::finishAborted(const ConversionJob& job) {
  // no-op when the abort path already finalized the status
  store_.updateStatusWithError(job.conversion_id, std::string(kAbortedMessage), ConversionOutcome::Aborted);
  std::cout << "Job " + job.conversion_id + " was aborted, removing its files\n";
  removeArtifacts(job, true);
}

void VideoConverter::removeArtifacts(const ConversionJob& job, bool remove_output) {
  removeFile(job.conversion_id, job.input_path, "input file");
  if (remove_output) {
    removeFile(job.conversion_id, job.output_path, "output file");
  }
}

} // namespace conversion_service
