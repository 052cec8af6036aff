#pragma once

#include <cstddef>
#include <string>
#include <chrono>
#include <expected>
#include <vector>
#include <nlohmann/json.hpp>

namespace config {

struct ServerConfig {
  std::string host;
  unsigned short port;
  std::vector<std::string> allowed_origins;   // "*" allows any origin
  std::chrono::seconds sse_heartbeat;
  std::chrono::milliseconds sse_poll_interval;
};

struct ConversionConfig {
  size_t worker_count;
  std::string encoder_path;
  std::string metadata_tool_path;
  int encoder_threads;                        // 0 = cpu count - 2
  size_t subscriber_buffer;
  std::chrono::milliseconds progress_throttle;
  double progress_step;
};

struct StorageConfig {
  std::string uploads_dir;
  std::string converted_dir;
  std::string local_source_dir;               // root for POST /api/convert/local paths
  size_t max_file_size_mb;
  std::chrono::seconds cleanup_initial_delay;
  std::chrono::seconds cleanup_interval;
  std::chrono::seconds max_file_age;
};

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Getters
const ServerConfig& getServer() const { return server_; }
const ConversionConfig& getConversion() const { return conversion_; }
const StorageConfig& getStorage() const { return storage_; }
std::string getListenAddress() const { return server_.host + ":" + std::to_string(server_.port); }

// Overlay values from a JSON document; keys that are absent keep their value.
std::expected<void, std::string> loadFromFile(const std::string& path);
std::expected<void, std::string> apply(const nlohmann::json& doc);
// Overlay PORT, WORKER_COUNT, UPLOADS_DIR, CONVERTED_DIR, LOCAL_SOURCE_DIR,
// MAX_FILE_SIZE_MB, ALLOWED_ORIGINS, ENCODER_PATH and METADATA_TOOL_PATH.
void applyEnvironment();
void resetDefaults();

private:
  Config();

  ServerConfig server_;
  ConversionConfig conversion_;
  StorageConfig storage_;
};

} // namespace config
