#include "application/abort_coordinator.hpp"
#include "application/conversion_service.hpp"
#include "application/conversion_store.hpp"
#include "common/config/config.hpp"
#include "common/restful/http_server.hpp"
#include "infrastructure/file_store.hpp"
#include "infrastructure/video_converter.hpp"
#include "interface/rest_api_handler.hpp"
#include <csignal>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <boost/asio.hpp>

namespace {

void runCleanup(const config::StorageConfig& storage) {
  for (const auto& dir : {storage.uploads_dir, storage.converted_dir}) {
    auto removed = conversion_service::cleanupOldFiles(dir, storage.max_file_age);
    if (!removed) {
      std::cerr << "WARN: Cleanup of " << dir << " failed: " << removed.error() << std::endl;
    } else if (*removed > 0) {
      std::cout << "Cleanup removed " << *removed << " old file(s) from " << dir << std::endl;
    }
  }
}

} // namespace

int main(int argc, char** argv) {
  try {
    auto& cfg = config::Config::getInstance();
    if (argc > 1) {
      auto loaded = cfg.loadFromFile(argv[1]);
      if (!loaded) {
        std::cerr << "Error: " << loaded.error() << std::endl;
        return 1;
      }
    }
    cfg.applyEnvironment();

    const auto& server_config = cfg.getServer();
    const auto& conversion_config = cfg.getConversion();
    const auto& storage_config = cfg.getStorage();

    auto dirs = conversion_service::ensureDirectories(
      {storage_config.uploads_dir, storage_config.converted_dir, storage_config.local_source_dir});
    if (!dirs) {
      std::cerr << "Error: " << dirs.error() << std::endl;
      return 1;
    }

    conversion_service::ConversionStore store(conversion_config.subscriber_buffer);

    conversion_service::ConverterOptions options;
    options.encoder_path = conversion_config.encoder_path;
    options.metadata_tool_path = conversion_config.metadata_tool_path;
    options.encoder_threads = conversion_config.encoder_threads;
    options.progress_throttle = conversion_config.progress_throttle;
    options.progress_step = conversion_config.progress_step;

    auto converter = std::make_shared<conversion_service::VideoConverter>(
      conversion_config.worker_count, store, options);
    converter->start();

    auto abort_coordinator = std::make_shared<conversion_service::AbortCoordinator>(store);
    auto conversion_service = std::make_shared<conversion_service::ConversionService>(
      store, converter, storage_config.uploads_dir, storage_config.converted_dir,
      storage_config.local_source_dir, storage_config.max_file_size_mb);

    auto api_handler = std::make_shared<conversion_service::RestApiHandler>(
      store, conversion_service, abort_coordinator, storage_config.converted_dir,
      server_config.allowed_origins);

    boost::asio::io_context ioc{1};
    auto http_endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(server_config.host),
      server_config.port
    };
    common::HttpServer http_server{ioc, http_endpoint, api_handler};

    boost::asio::steady_timer cleanup_timer(ioc);
    std::function<void(const boost::system::error_code&)> on_cleanup =
      [&](const boost::system::error_code& ec) {
        if (ec) {
          return;
        }
        runCleanup(storage_config);
        cleanup_timer.expires_after(storage_config.cleanup_interval);
        cleanup_timer.async_wait(on_cleanup);
      };
    cleanup_timer.expires_after(storage_config.cleanup_initial_delay);
    cleanup_timer.async_wait(on_cleanup);

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      std::cout << "Received signal " << signal_number << ", shutting down" << std::endl;
      http_server.stop();
      cleanup_timer.cancel();
      ioc.stop();
    });

    std::cout << "HTTP Server listening on " << cfg.getListenAddress() << std::endl;
    std::cout << "Conversion workers: " << converter->workerCount()
              << ", queue capacity: " << converter->queueCapacity() << std::endl;

    http_server.run();
    ioc.run();

    std::cout << "Waiting for queued conversions to finish" << std::endl;
    converter->stop();

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
