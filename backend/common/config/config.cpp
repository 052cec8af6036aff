#include "config.hpp"
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <thread>

namespace config {

namespace {

template <typename T>
std::optional<T> parseNumber(const std::string& text) {
  T value{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::vector<std::string> splitOrigins(const std::string& text) {
  std::vector<std::string> origins;
  size_t start = 0;
  while (start <= text.size()) {
    auto end = text.find(',', start);
    if (end == std::string::npos) end = text.size();
    auto item = text.substr(start, end - start);
    auto first = item.find_first_not_of(" \t");
    auto last = item.find_last_not_of(" \t");
    if (first != std::string::npos) {
      origins.push_back(item.substr(first, last - first + 1));
    }
    start = end + 1;
  }
  return origins;
}

const char* env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

} // namespace

  Config::Config() {
    resetDefaults();
  }

  void Config::resetDefaults() {
    auto cpus = std::thread::hardware_concurrency();

    server_ = {
      .host = "0.0.0.0",
      .port = 3000,
      .allowed_origins = {"*"},
      .sse_heartbeat = std::chrono::seconds(30),
      .sse_poll_interval = std::chrono::milliseconds(250)
    };

    conversion_ = {
      .worker_count = cpus == 0 ? 1 : cpus,
      .encoder_path = "ffmpeg",
      .metadata_tool_path = "exiftool",
      .encoder_threads = 0,
      .subscriber_buffer = 16,
      .progress_throttle = std::chrono::milliseconds(500),
      .progress_step = 0.5
    };

    storage_ = {
      .uploads_dir = "uploads",
      .converted_dir = "converted",
      .local_source_dir = "media",
      .max_file_size_mb = 2000,
      .cleanup_initial_delay = std::chrono::minutes(5),
      .cleanup_interval = std::chrono::hours(4),
      .max_file_age = std::chrono::hours(72)
    };
  }

  std::expected<void, std::string> Config::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
      return std::unexpected("Cannot open config file: " + path);
    }
    try {
      return apply(nlohmann::json::parse(in));
    } catch (const nlohmann::json::exception& e) {
      return std::unexpected("Invalid config file " + path + ": " + e.what());
    }
  }

  std::expected<void, std::string> Config::apply(const nlohmann::json& doc) {
    if (!doc.is_object()) {
      return std::unexpected("Config document must be a JSON object");
    }

    // work on copies so a bad document leaves the current values untouched
    auto server = server_;
    auto conversion = conversion_;
    auto storage = storage_;

    try {
      if (doc.contains("server")) {
        const auto& s = doc.at("server");
        server.host = s.value("host", server.host);
        auto port = s.value("port", static_cast<int>(server.port));
        if (port <= 0 || port > 65535) {
          return std::unexpected("server.port out of range: " + std::to_string(port));
        }
        server.port = static_cast<unsigned short>(port);
        server.allowed_origins = s.value("allowedOrigins", server.allowed_origins);
        server.sse_heartbeat = std::chrono::seconds(
          s.value("sseHeartbeatSeconds", server.sse_heartbeat.count()));
        server.sse_poll_interval = std::chrono::milliseconds(
          s.value("ssePollMs", server.sse_poll_interval.count()));
      }

      if (doc.contains("conversion")) {
        const auto& c = doc.at("conversion");
        conversion.worker_count = c.value("workerCount", conversion.worker_count);
        if (conversion.worker_count == 0) {
          return std::unexpected("conversion.workerCount must be at least 1");
        }
        conversion.encoder_path = c.value("encoderPath", conversion.encoder_path);
        conversion.metadata_tool_path = c.value("metadataToolPath", conversion.metadata_tool_path);
        conversion.encoder_threads = c.value("encoderThreads", conversion.encoder_threads);
        conversion.subscriber_buffer = c.value("subscriberBuffer", conversion.subscriber_buffer);
        conversion.progress_throttle = std::chrono::milliseconds(
          c.value("progressThrottleMs", conversion.progress_throttle.count()));
        conversion.progress_step = c.value("progressStep", conversion.progress_step);
      }

      if (doc.contains("storage")) {
        const auto& st = doc.at("storage");
        storage.uploads_dir = st.value("uploadsDir", storage.uploads_dir);
        storage.converted_dir = st.value("convertedDir", storage.converted_dir);
        storage.local_source_dir = st.value("localSourceDir", storage.local_source_dir);
        storage.max_file_size_mb = st.value("maxFileSizeMB", storage.max_file_size_mb);
        storage.cleanup_initial_delay = std::chrono::seconds(
          st.value("cleanupInitialDelaySeconds", storage.cleanup_initial_delay.count()));
        storage.cleanup_interval = std::chrono::seconds(
          st.value("cleanupIntervalSeconds", storage.cleanup_interval.count()));
        storage.max_file_age = std::chrono::hours(
          st.value("maxFileAgeHours",
                   std::chrono::duration_cast<std::chrono::hours>(storage.max_file_age).count()));
      }
    } catch (const nlohmann::json::exception& e) {
      return std::unexpected(std::string("Invalid config value: ") + e.what());
    }

    server_ = std::move(server);
    conversion_ = std::move(conversion);
    storage_ = std::move(storage);
    return {};
  }

  void Config::applyEnvironment() {
    if (const char* port = env("PORT")) {
      auto value = parseNumber<unsigned short>(port);
      if (value && *value != 0) {
        server_.port = *value;
      } else {
        std::cerr << "WARN: ignoring invalid PORT '" + std::string(port) + "'\n";
      }
    }

    if (const char* workers = env("WORKER_COUNT")) {
      auto value = parseNumber<size_t>(workers);
      if (value && *value > 0) {
        conversion_.worker_count = *value;
      } else {
        std::cerr << "WARN: ignoring invalid WORKER_COUNT '" + std::string(workers) + "'\n";
      }
    }

    if (const char* size = env("MAX_FILE_SIZE_MB")) {
      auto value = parseNumber<size_t>(size);
      if (value && *value > 0) {
        storage_.max_file_size_mb = *value;
      } else {
        std::cerr << "WARN: ignoring invalid MAX_FILE_SIZE_MB '" + std::string(size) + "'\n";
      }
    }

    if (const char* dir = env("UPLOADS_DIR")) storage_.uploads_dir = dir;
    if (const char* dir = env("CONVERTED_DIR")) storage_.converted_dir = dir;
    if (const char* dir = env("LOCAL_SOURCE_DIR")) storage_.local_source_dir = dir;
    if (const char* path = env("ENCODER_PATH")) conversion_.encoder_path = path;
    if (const char* path = env("METADATA_TOOL_PATH")) conversion_.metadata_tool_path = path;

    if (const char* origins = env("ALLOWED_ORIGINS")) {
      auto parsed = splitOrigins(origins);
      if (!parsed.empty()) {
        server_.allowed_origins = std::move(parsed);
      }
    }
  }
}
