#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include "common/restful/event_source.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

// A file streamed from disk, or the JSON error sent instead of it.
using FileReply = std::variant<http::response<http::file_body>, http::response<http::string_body>>;

class RestApiHandlerBase {
public:
  explicit RestApiHandlerBase(std::vector<std::string> allowed_origins = {"*"});
  virtual ~RestApiHandlerBase() = default;

  template<class Body, class Allocator>
  http::response<http::string_body> handleRequest(
    http::request<Body, http::basic_fields<Allocator>>&& req) {

    const auto origin = std::string(req[http::field::origin]);

    if (req.method() == http::verb::options) {
      http::response<http::string_body> res{http::status::no_content, req.version()};
      addCorsHeaders(res, origin);
      res.prepare_payload();
      return res;
    }

    try {
      auto response = doHandleRequest(std::move(req));
      addCorsHeaders(response, origin);
      return response;
    } catch (const std::exception& e) {
      auto response = createErrorResponse(http::status::internal_server_error,
                                        "Internal server error: " + std::string(e.what()));
      addCorsHeaders(response, origin);
      return response;
    }
  }

  // Non-empty when the request names a file this handler serves from disk;
  // anything else goes through handleRequest.
  std::optional<FileReply> handleFileRequest(const http::request<http::string_body>& req) {
    const auto origin = std::string(req[http::field::origin]);

    std::optional<FileReply> reply;
    try {
      reply = serveFile(req);
    } catch (const std::exception& e) {
      reply = createErrorResponse(http::status::internal_server_error,
                                  "Internal server error: " + std::string(e.what()));
    }
    if (reply) {
      std::visit([&](auto& res) { addCorsHeaders(res, origin); }, *reply);
    }
    return reply;
  }

  // Returns a source when the request asks for an event stream this handler
  // serves; the session then switches to streaming instead of a single reply.
  virtual std::shared_ptr<EventSource> openEventStream(
    const http::request<http::string_body>& /* req */) {
    return nullptr;
  }

  template<class Fields>
  void addCorsHeaders(http::header<false, Fields>& res, const std::string& origin) const {
    auto allowed = allowedOrigin(origin);
    if (!allowed.empty()) {
      res.set(http::field::access_control_allow_origin, allowed);
      if (allowed != "*") {
        res.set(http::field::vary, "Origin");
      }
    }
    res.set(http::field::access_control_allow_methods, "GET, POST, PUT, DELETE, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type, Authorization");
  }

protected:
  virtual http::response<http::string_body> doHandleRequest(
    http::request<http::string_body, http::basic_fields<std::allocator<char>>>&& req) = 0;

  virtual std::optional<FileReply> serveFile(const http::request<http::string_body>& /* req */) {
    return std::nullopt;
  }

  http::response<http::string_body> createJsonResponse(
    http::status status, const nlohmann::json& json);

  http::response<http::string_body> createErrorResponse(
    http::status status, const std::string& message);

  nlohmann::json parseRequestBody(const std::string& body);

  // "*" when any origin is allowed, the origin itself when listed, else empty
  std::string allowedOrigin(const std::string& origin) const;

private:
  std::vector<std::string> allowed_origins_;
};

}
