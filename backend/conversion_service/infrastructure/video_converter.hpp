// video_converter.hpp
#pragma once

#include "application/conversion_store.hpp"
#include "domain/conversion.hpp"
#include "domain/job_queue.hpp"
#include "metadata_copier.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <expected>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace conversion_service {

struct ConverterOptions {
  std::string encoder_path{"ffmpeg"};
  std::string metadata_tool_path{"exiftool"};
  int encoder_threads{0};   // 0 = cpu count - 2
  std::chrono::milliseconds progress_throttle{500};
  double progress_step{0.5};
};

// Bounded job queue (capacity 2 x workers) drained by a fixed set of workers,
// each driving one encoder process at a time.
class VideoConverter : public JobQueue {
public:
  VideoConverter(size_t worker_count, ConversionStore& store, ConverterOptions options = {});
  ~VideoConverter() override;

  VideoConverter(const VideoConverter&) = delete;
  VideoConverter& operator=(const VideoConverter&) = delete;

  void start();
  // Refuses new jobs, lets the workers finish everything already queued and
  // joins them.
  void stop();

  std::expected<void, std::string> queueJob(ConversionJob job) override;

  size_t queueSize() const;
  size_t queueCapacity() const { return capacity_; }
  size_t workerCount() const { return worker_count_; }

private:
  void workerLoop(size_t worker_id);
  void convertVideo(const ConversionJob& job);
  void failJob(const ConversionJob& job, const std::string& message);
  void finishAborted(const ConversionJob& job);
  void removeArtifacts(const ConversionJob& job, bool remove_output);

  ConversionStore& store_;
  ConverterOptions options_;
  MetadataCopier metadata_copier_;
  const size_t worker_count_;
  const size_t capacity_;

  mutable std::mutex queue_mutex_;
  std::condition_variable condition_;
  std::queue<ConversionJob> jobs_;
  std::vector<std::jthread> workers_;
  bool stop_{false};
  bool started_{false};
};

} // namespace conversion_service
