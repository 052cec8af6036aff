#pragma once
#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "domain/conversion.hpp"

namespace conversion_service {

inline constexpr size_t kMaxFilenameLength = 100;

std::expected<void, std::string> ensureDirectories(const std::vector<std::filesystem::path>& dirs);

// Base name only, characters outside [A-Za-z0-9._-] become '_', no leading
// dots, at most kMaxFilenameLength characters with the extension
// kept. Never returns an empty name.
std::string sanitizeFilename(std::string_view name);

// Removes regular files in dir whose last write is older than max_age.
// Returns how many were removed; per-file failures are logged and skipped.
std::expected<size_t, std::string> cleanupOldFiles(const std::filesystem::path& dir,
                                                   std::chrono::seconds max_age);

enum class FileErrorCode {
  InvalidName,
  NotFound,
  NotAFile,
  IoError
};

struct FileError {
  FileErrorCode code;
  std::string message;
};

// A single path component: not empty, no separators, no "..".
bool isSafeFileName(std::string_view name);

// Path of an existing regular file named name inside dir.
std::expected<std::filesystem::path, FileError> resolveStoredFile(const std::filesystem::path& dir,
                                                                  std::string_view name);

// Regular files in dir, newest first. A missing dir is an empty list.
std::expected<std::vector<ConvertedFile>, std::string> listStoredFiles(const std::filesystem::path& dir);

std::expected<void, FileError> deleteStoredFile(const std::filesystem::path& dir, std::string_view name);

} // namespace conversion_service
