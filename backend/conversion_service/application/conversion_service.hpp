#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include "conversion_store.hpp"
#include "domain/job_queue.hpp"

namespace conversion_service {

struct LocalConversionRequest {
  std::string source_path;
  std::string target_format;
  std::string quality;
  bool reverse_video{false};
  bool remove_sound{false};
};

enum class SubmitErrorCode {
  InvalidRequest,
  SourceNotFound,
  Forbidden,
  TooLarge,
  StorageFailure,
  QueueFull
};

struct SubmitError {
  SubmitErrorCode code;
  std::string message;
};

class ConversionService {
public:
  ConversionService(ConversionStore& store,
                    std::shared_ptr<JobQueue> job_queue,
                    const std::filesystem::path& uploads_dir,
                    const std::filesystem::path& converted_dir,
                    const std::filesystem::path& source_root,
                    size_t max_file_size_mb);

  // Copies a file from under source_root into the uploads directory, creates
  // its status and queues the job. Relative paths are taken from source_root,
  // and anything resolving outside it is refused. Returns the new conversion
  // id. A rejected job leaves no status and no copied file behind.
  std::expected<std::string, SubmitError> submitLocalFile(const LocalConversionRequest& request);

private:
  static std::string generateConversionId();

  ConversionStore& store_;
  std::shared_ptr<JobQueue> job_queue_;
  std::filesystem::path uploads_dir_;
  std::filesystem::path converted_dir_;
  std::filesystem::path source_root_;
  size_t max_file_size_mb_;
};

} // namespace conversion_service
