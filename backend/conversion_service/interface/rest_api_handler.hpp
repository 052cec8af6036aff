#pragma once
#include "application/abort_coordinator.hpp"
#include "application/conversion_service.hpp"
#include "application/conversion_store.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include "infrastructure/file_store.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace conversion_service {

class RestApiHandler : public common::RestApiHandlerBase {
public:
  RestApiHandler(ConversionStore& store,
                 std::shared_ptr<ConversionService> conversion_service,
                 std::shared_ptr<AbortCoordinator> abort_coordinator,
                 std::filesystem::path converted_dir,
                 std::vector<std::string> allowed_origins = {"*"});

  std::shared_ptr<common::EventSource> openEventStream(
      const http::request<http::string_body> &req) override;

protected:
  std::optional<common::FileReply> serveFile(
      const http::request<http::string_body> &req) override;

  http::response<http::string_body> doHandleRequest(
      http::request<http::string_body,
                    http::basic_fields<std::allocator<char>>> &&req) override;

private:
  ConversionStore& store_;
  std::shared_ptr<ConversionService> conversion_service_;
  std::shared_ptr<AbortCoordinator> abort_coordinator_;
  std::filesystem::path converted_dir_;

  http::response<http::string_body> handleGetStatus(const std::string &id);
  http::response<http::string_body> handleGetActive();
  http::response<http::string_body> handleAbort(const std::string &id);
  http::response<http::string_body> handleConvertLocal(const nlohmann::json &body);
  http::response<http::string_body> handleGetConfig();
  http::response<http::string_body> handleListFiles();
  http::response<http::string_body> handleDeleteFile(const std::string &name);
  http::response<http::string_body> fileErrorResponse(const FileError &error);
};

} // namespace conversion_service
