#include "conversion_service.hpp"
#include "quality_catalog.hpp"
#include "infrastructure/encoder_command.hpp"
#include "infrastructure/file_store.hpp"
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <uuid/uuid.h>

namespace fs = std::filesystem;

namespace conversion_service {

ConversionService::ConversionService(ConversionStore& store,
                                     std::shared_ptr<JobQueue> job_queue,
                                     const fs::path& uploads_dir,
                                     const fs::path& converted_dir,
                                     const fs::path& source_root,
                                     size_t max_file_size_mb)
  : store_(store),
    job_queue_(job_queue),
    uploads_dir_(uploads_dir),
    converted_dir_(converted_dir),
    source_root_(source_root),
    max_file_size_mb_(max_file_size_mb) {}

namespace {

bool isWithin(const fs::path& root, const fs::path& path) {
  return std::mismatch(root.begin(), root.end(), path.begin(), path.end()).first == root.end();
}

} // namespace

std::string ConversionService::generateConversionId() {
  uuid_t uuid;
  uuid_generate(uuid);
  char uuid_str[37];
  uuid_unparse(uuid, uuid_str);
  return uuid_str;
}

std::expected<std::string, SubmitError> ConversionService::submitLocalFile(
  const LocalConversionRequest& request
) {
  if (request.source_path.empty()) {
    return std::unexpected(SubmitError{SubmitErrorCode::InvalidRequest, "Missing source path"});
  }
  if (!isSupportedFormat(request.target_format)) {
    return std::unexpected(SubmitError{SubmitErrorCode::InvalidRequest,
                                       "Unsupported target format '" + request.target_format + "'"});
  }
  // an empty quality means the default preset, anything else has to be known
  if (!request.quality.empty() && !isValidQualityName(request.quality)) {
    return std::unexpected(SubmitError{SubmitErrorCode::InvalidRequest,
                                       "Unknown quality '" + request.quality + "'"});
  }

  std::error_code ec;
  auto root = fs::canonical(source_root_, ec);
  if (ec) {
    return std::unexpected(SubmitError{SubmitErrorCode::StorageFailure,
                                       "Local source directory unavailable: " + ec.message()});
  }

  // symlinks are resolved first so a link cannot lead out of the root
  fs::path requested(request.source_path);
  auto source_path = fs::weakly_canonical(requested.is_absolute() ? requested : root / requested, ec);
  if (ec) {
    return std::unexpected(SubmitError{SubmitErrorCode::SourceNotFound,
                                       "Source file does not exist: " + request.source_path});
  }
  if (!isWithin(root, source_path)) {
    std::cerr << "WARN: refused local source outside " + root.string() + ": " + request.source_path + "\n";
    return std::unexpected(SubmitError{SubmitErrorCode::Forbidden,
                                       "Source path is outside the local source directory"});
  }
  if (!fs::is_regular_file(source_path, ec)) {
    return std::unexpected(SubmitError{SubmitErrorCode::SourceNotFound,
                                       "Source file does not exist: " + request.source_path});
  }

  auto size = fs::file_size(source_path, ec);
  if (ec) {
    return std::unexpected(SubmitError{SubmitErrorCode::StorageFailure,
                                       "Cannot read source file size: " + ec.message()});
  }
  if (size > static_cast<std::uintmax_t>(max_file_size_mb_) * 1024 * 1024) {
    return std::unexpected(SubmitError{SubmitErrorCode::TooLarge,
                                       "File exceeds maximum allowed size (" +
                                       std::to_string(max_file_size_mb_) + " MB)"});
  }

  auto dirs = ensureDirectories({uploads_dir_, converted_dir_});
  if (!dirs) {
    return std::unexpected(SubmitError{SubmitErrorCode::StorageFailure, dirs.error()});
  }

  auto conversion_id = generateConversionId();
  auto quality = resolveQualitySetting(request.quality);
  auto safe_name = sanitizeFilename(source_path.filename().string());
  auto stem = fs::path(safe_name).stem().string();

  auto input_path = uploads_dir_ / (conversion_id + "_" + safe_name);
  auto output_path = converted_dir_ /
                     (stem + "_" + conversion_id.substr(0, 8) + "." + request.target_format);

  fs::copy_file(source_path, input_path, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    return std::unexpected(SubmitError{SubmitErrorCode::StorageFailure,
                                       "Failed to copy file: " + ec.message()});
  }

  ConversionStatus status;
  status.input_path = input_path.string();
  status.output_path = output_path.string();
  status.format = request.target_format;
  status.quality = quality.name;
  store_.setStatus(conversion_id, status);

  ConversionJob job;
  job.conversion_id = conversion_id;
  job.source_ref = "local://" + source_path.filename().string();
  job.file_name = source_path.filename().string();
  job.target_format = request.target_format;
  job.quality = quality.name;
  job.input_path = status.input_path;
  job.output_path = status.output_path;
  job.reverse_video = request.reverse_video;
  job.remove_sound = request.remove_sound;

  auto queued = job_queue_->queueJob(std::move(job));
  if (!queued) {
    // roll back so the rejected job never shows up as pending
    store_.deleteStatus(conversion_id);
    fs::remove(input_path, ec);
    if (ec) {
      std::cerr << "WARN [job " + conversion_id + "]: failed to remove input after rejected submission: " +
                   ec.message() + "\n";
    }
    return std::unexpected(SubmitError{SubmitErrorCode::QueueFull, queued.error()});
  }

  std::cout << "Accepted conversion " + conversion_id + " for " + source_path.filename().string() +
               " -> " + request.target_format + " (" + quality.name + ")\n";
  return conversion_id;
}

} // namespace conversion_service
