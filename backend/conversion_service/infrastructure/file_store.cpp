#include "file_store.hpp"
#include <algorithm>
#include <iostream>

namespace fs = std::filesystem;

namespace conversion_service {

std::expected<void, std::string> ensureDirectories(const std::vector<fs::path>& dirs) {
  for (const auto& dir : dirs) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
      return std::unexpected("Failed to create directory " + dir.string() + ": " + ec.message());
    }
  }
  return {};
}

std::string sanitizeFilename(std::string_view name) {
  // strip any directory part, both separators
  auto slash = name.find_last_of("/\\");
  if (slash != std::string_view::npos) {
    name.remove_prefix(slash + 1);
  }

  std::string result;
  result.reserve(name.size());
  for (unsigned char c : name) {
    bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                   (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
    result.push_back(allowed ? static_cast<char>(c) : '_');
  }

  auto first = result.find_first_not_of('.');
  if (first == std::string::npos) {
    result.clear();
  } else {
    result.erase(0, first);
  }

  if (result.size() > kMaxFilenameLength) {
    auto dot = result.rfind('.');
    std::string ext = dot == std::string::npos ? "" : result.substr(dot);
    if (ext.size() >= kMaxFilenameLength) {
      ext.clear();
    }
    result = result.substr(0, kMaxFilenameLength - ext.size()) + ext;
  }

  if (result.empty()) {
    return "file";
  }
  return result;
}

std::expected<size_t, std::string> cleanupOldFiles(const fs::path& dir, std::chrono::seconds max_age) {
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    return std::unexpected("Failed to read directory " + dir.string() + ": " + ec.message());
  }

  const auto now = fs::file_time_type::clock::now();
  size_t removed = 0;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    const auto& entry = *it;
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec)) {
      continue;
    }
    auto modified = entry.last_write_time(entry_ec);
    if (entry_ec) {
      std::cerr << "WARN: cannot stat " + entry.path().string() + ": " + entry_ec.message() + "\n";
      continue;
    }
    if (now - modified <= max_age) {
      continue;
    }
    if (!fs::remove(entry.path(), entry_ec)) {
      std::cerr << "WARN: failed to remove old file " + entry.path().string() + ": " +
                   entry_ec.message() + "\n";
      continue;
    }
    ++removed;
  }
  if (ec) {
    std::cerr << "WARN: cleanup of " + dir.string() + " stopped early: " + ec.message() + "\n";
  }

  if (removed > 0) {
    std::cout << "Cleanup removed " + std::to_string(removed) + " file(s) from " + dir.string() + "\n";
  }
  return removed;
}

bool isSafeFileName(std::string_view name) {
  return !name.empty() &&
         name.find("..") == std::string_view::npos &&
         name.find_first_of("/\\") == std::string_view::npos;
}

std::expected<fs::path, FileError> resolveStoredFile(const fs::path& dir, std::string_view name) {
  if (!isSafeFileName(name)) {
    return std::unexpected(FileError{FileErrorCode::InvalidName, "Invalid filename"});
  }

  auto path = dir / std::string(name);
  std::error_code ec;
  auto st = fs::status(path, ec);
  if (ec || !fs::exists(st)) {
    if (ec && ec != std::errc::no_such_file_or_directory) {
      return std::unexpected(FileError{FileErrorCode::IoError,
                                       "Cannot stat " + path.string() + ": " + ec.message()});
    }
    return std::unexpected(FileError{FileErrorCode::NotFound, "File not found"});
  }
  if (!fs::is_regular_file(st)) {
    return std::unexpected(FileError{FileErrorCode::NotAFile, "Invalid request (directory specified)"});
  }
  return path;
}

std::expected<std::vector<ConvertedFile>, std::string> listStoredFiles(const fs::path& dir) {
  std::vector<ConvertedFile> files;
  std::error_code ec;
  if (!fs::exists(dir, ec)) {
    return files;
  }

  fs::directory_iterator it(dir, ec);
  if (ec) {
    return std::unexpected("Failed to list files: " + ec.message());
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    const auto& entry = *it;
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec)) {
      continue;
    }
    auto size = entry.file_size(entry_ec);
    fs::file_time_type modified;
    if (!entry_ec) {
      modified = entry.last_write_time(entry_ec);
    }
    if (entry_ec) {
      std::cerr << "WARN: Could not get info for file " + entry.path().filename().string() + ": " +
                   entry_ec.message() + "\n";
      continue;
    }

    auto name = entry.path().filename().string();
    files.push_back(ConvertedFile{
      .name = name,
      .size = size,
      .modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(modified)),
      .url = std::string(kDownloadPrefix) + name
    });
  }
  if (ec) {
    return std::unexpected("Failed to list files: " + ec.message());
  }

  std::sort(files.begin(), files.end(), [](const ConvertedFile& a, const ConvertedFile& b) {
    return a.modified > b.modified;
  });
  return files;
}

std::expected<void, FileError> deleteStoredFile(const fs::path& dir, std::string_view name) {
  auto path = resolveStoredFile(dir, name);
  if (!path) {
    return std::unexpected(path.error());
  }

  std::error_code ec;
  if (!fs::remove(*path, ec)) {
    if (!ec) {
      return std::unexpected(FileError{FileErrorCode::NotFound, "File not found"});
    }
    return std::unexpected(FileError{FileErrorCode::IoError, "Failed to delete file: " + ec.message()});
  }

  std::cout << "Deleted file: " + path->string() + "\n";
  return {};
}

} // namespace conversion_service
