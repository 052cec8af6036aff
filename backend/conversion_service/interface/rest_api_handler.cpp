#include "rest_api_handler.hpp"
#include "application/quality_catalog.hpp"
#include "common/config/config.hpp"
#include "event_stream.hpp"
#include "infrastructure/encoder_command.hpp"
#include "infrastructure/file_store.hpp"
#include "json_serialization.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <string_view>

namespace conversion_service {

namespace {

constexpr std::string_view kStatusPrefix = "/api/conversion/status/";
constexpr std::string_view kAbortPrefix = "/api/conversion/abort/";
constexpr std::string_view kStreamPath = "/api/conversions/stream";
constexpr std::string_view kDeletePrefix = "/api/file/delete/";

std::string_view stripQuery(beast::string_view target) {
  std::string_view path(target.data(), target.size());
  auto pos = path.find('?');
  return pos == std::string_view::npos ? path : path.substr(0, pos);
}

// %XX escapes in a path segment; malformed escapes are kept as they are
std::string decodePathSegment(std::string_view segment) {
  auto hex = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
  };

  std::string decoded;
  decoded.reserve(segment.size());
  for (size_t i = 0; i < segment.size(); ++i) {
    if (segment[i] == '%' && i + 2 < segment.size()) {
      int hi = hex(segment[i + 1]);
      int lo = hex(segment[i + 2]);
      if (hi >= 0 && lo >= 0) {
        decoded.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    decoded.push_back(segment[i]);
  }
  return decoded;
}

std::string contentTypeFor(const std::filesystem::path &path) {
  auto ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (ext == ".mov") return "video/quicktime";
  if (ext == ".mp4") return "video/mp4";
  if (ext == ".avi") return "video/x-msvideo";
  return "application/octet-stream";
}

} // namespace

RestApiHandler::RestApiHandler(ConversionStore& store,
                               std::shared_ptr<ConversionService> conversion_service,
                               std::shared_ptr<AbortCoordinator> abort_coordinator,
                               std::filesystem::path converted_dir,
                               std::vector<std::string> allowed_origins)
    : common::RestApiHandlerBase(std::move(allowed_origins)),
      store_(store),
      conversion_service_(conversion_service),
      abort_coordinator_(abort_coordinator),
      converted_dir_(std::move(converted_dir)) {}

std::shared_ptr<common::EventSource> RestApiHandler::openEventStream(
    const http::request<http::string_body> &req) {
  if (req.method() == http::verb::get && stripQuery(req.target()) == kStreamPath) {
    return std::make_shared<ConversionEventStream>(store_);
  }
  return nullptr;
}

std::optional<common::FileReply> RestApiHandler::serveFile(
    const http::request<http::string_body> &req) {
  auto target = stripQuery(req.target());
  if (req.method() != http::verb::get || !target.starts_with(kDownloadPrefix)) {
    return std::nullopt;
  }

  auto name = decodePathSegment(target.substr(kDownloadPrefix.size()));
  auto path = resolveStoredFile(converted_dir_, name);
  if (!path) {
    std::cerr << "WARN: Download of '" + name + "' refused: " + path.error().message + "\n";
    return fileErrorResponse(path.error());
  }

  beast::error_code ec;
  http::file_body::value_type body;
  body.open(path->c_str(), beast::file_mode::scan, ec);
  if (ec == beast::errc::no_such_file_or_directory) {
    return createErrorResponse(http::status::not_found, "File not found");
  }
  if (ec) {
    std::cerr << "ERROR: Cannot open " + path->string() + " for download: " + ec.message() + "\n";
    return createErrorResponse(http::status::internal_server_error, "Internal server error");
  }

  http::response<http::file_body> res{std::piecewise_construct,
                                      std::make_tuple(std::move(body)),
                                      std::make_tuple(http::status::ok, req.version())};
  res.set(http::field::content_type, contentTypeFor(*path));
  res.set(http::field::content_disposition, "attachment; filename=\"" + name + "\"");
  res.keep_alive(req.keep_alive());
  res.prepare_payload();
  return res;
}

http::response<http::string_body> RestApiHandler::doHandleRequest(
    http::request<http::string_body,
                  http::basic_fields<std::allocator<char>>> &&req) {
  std::string target(stripQuery(req.target()));
  auto method = req.method();

  if (method == http::verb::get && target.starts_with(kStatusPrefix)) {
    return handleGetStatus(target.substr(kStatusPrefix.size()));
  } else if (method == http::verb::get && target == "/api/conversions/active") {
    return handleGetActive();
  } else if (method == http::verb::post && target.starts_with(kAbortPrefix)) {
    return handleAbort(target.substr(kAbortPrefix.size()));
  } else if (method == http::verb::post && target == "/api/convert/local") {
    nlohmann::json body;
    try {
      body = parseRequestBody(std::string(req.body()));
    } catch (const std::invalid_argument &e) {
      return createErrorResponse(http::status::bad_request, e.what());
    }
    return handleConvertLocal(body);
  } else if (method == http::verb::get && target == "/api/config") {
    return handleGetConfig();
  } else if (method == http::verb::get && target == "/api/files") {
    return handleListFiles();
  } else if (method == http::verb::delete_ && target.starts_with(kDeletePrefix)) {
    return handleDeleteFile(decodePathSegment(target.substr(kDeletePrefix.size())));
  } else {
    return createErrorResponse(http::status::not_found, "Endpoint not found");
  }
}

http::response<http::string_body>
RestApiHandler::handleGetStatus(const std::string &id) {
  if (id.empty()) {
    return createErrorResponse(http::status::bad_request, "Missing conversion ID");
  }
  auto status = store_.getStatus(id);
  if (!status) {
    return createErrorResponse(http::status::not_found, "Conversion not found");
  }

  nlohmann::json response_json = makeStatusView(id, *status);
  response_json["success"] = true;
  return createJsonResponse(http::status::ok, response_json);
}

http::response<http::string_body> RestApiHandler::handleGetActive() {
  nlohmann::json response_json = store_.getActiveConversionsInfo();
  return createJsonResponse(http::status::ok, response_json);
}

http::response<http::string_body>
RestApiHandler::handleAbort(const std::string &id) {
  if (id.empty()) {
    return createErrorResponse(http::status::bad_request, "Missing conversion ID");
  }

  auto result = abort_coordinator_->abortConversion(id);
  if (!result) {
    switch (result.error().code) {
      case AbortErrorCode::NotFound:
        return createErrorResponse(http::status::not_found, result.error().message);
      case AbortErrorCode::Conflict:
        return createErrorResponse(http::status::conflict, result.error().message);
      case AbortErrorCode::InternalError:
        return createErrorResponse(http::status::internal_server_error, result.error().message);
    }
  }

  nlohmann::json response_json = {{"success", true},
                                  {"message", "Conversion aborted"},
                                  {"conversionId", id}};
  return createJsonResponse(http::status::ok, response_json);
}

http::response<http::string_body>
RestApiHandler::handleConvertLocal(const nlohmann::json &body) {
  if (!body.is_object()) {
    return createErrorResponse(http::status::bad_request, "Request body must be a JSON object");
  }

  LocalConversionRequest request;
  try {
    request.source_path = body.value("path", "");
    request.target_format = body.value("targetFormat", "");
    request.quality = body.value("quality", "");
    request.reverse_video = body.value("reverseVideo", false);
    request.remove_sound = body.value("removeSound", false);
  } catch (const nlohmann::json::exception &e) {
    return createErrorResponse(http::status::bad_request,
                               "Invalid request field: " + std::string(e.what()));
  }

  auto result = conversion_service_->submitLocalFile(request);
  if (!result) {
    switch (result.error().code) {
      case SubmitErrorCode::InvalidRequest:
        return createErrorResponse(http::status::bad_request, result.error().message);
      case SubmitErrorCode::SourceNotFound:
        return createErrorResponse(http::status::not_found, result.error().message);
      case SubmitErrorCode::Forbidden:
        return createErrorResponse(http::status::forbidden, result.error().message);
      case SubmitErrorCode::TooLarge:
        return createErrorResponse(http::status::payload_too_large, result.error().message);
      case SubmitErrorCode::StorageFailure:
        return createErrorResponse(http::status::internal_server_error, result.error().message);
      case SubmitErrorCode::QueueFull:
        return createErrorResponse(http::status::service_unavailable, result.error().message);
    }
  }

  nlohmann::json response_json = {{"success", true},
                                  {"message", "Conversion started"},
                                  {"conversionId", *result}};
  return createJsonResponse(http::status::accepted, response_json);
}

http::response<http::string_body> RestApiHandler::handleGetConfig() {
  const auto &cfg = config::Config::getInstance();

  nlohmann::json response_json = {
    {"maxFileSizeMB", cfg.getStorage().max_file_size_mb},
    {"workerCount", cfg.getConversion().worker_count},
    {"formats", supportedFormats()},
    {"qualities", availableQualitySettings()},
    {"defaultQuality", std::string(kDefaultQuality)}
  };
  return createJsonResponse(http::status::ok, response_json);
}

http::response<http::string_body> RestApiHandler::handleListFiles() {
  auto files = listStoredFiles(converted_dir_);
  if (!files) {
    std::cerr << "ERROR: " + files.error() + "\n";
    return createErrorResponse(http::status::internal_server_error, files.error());
  }

  nlohmann::json response_json = *files;
  return createJsonResponse(http::status::ok, response_json);
}

http::response<http::string_body>
RestApiHandler::handleDeleteFile(const std::string &name) {
  auto deleted = deleteStoredFile(converted_dir_, name);
  if (!deleted) {
    std::cerr << "WARN: Delete of '" + name + "' failed: " + deleted.error().message + "\n";
    return fileErrorResponse(deleted.error());
  }

  nlohmann::json response_json = {{"success", true},
                                  {"message", "File '" + name + "' deleted successfully"}};
  return createJsonResponse(http::status::ok, response_json);
}

http::response<http::string_body>
RestApiHandler::fileErrorResponse(const FileError &error) {
  switch (error.code) {
    case FileErrorCode::InvalidName:
    case FileErrorCode::NotAFile:
      return createErrorResponse(http::status::bad_request, error.message);
    case FileErrorCode::NotFound:
      return createErrorResponse(http::status::not_found, error.message);
    case FileErrorCode::IoError:
      break;
  }
  return createErrorResponse(http::status::internal_server_error, error.message);
}

} // namespace conversion_service
