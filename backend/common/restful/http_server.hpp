#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include "common/restful/event_source.hpp"
#include "common/restful/rest_api_handler_base.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace common {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket&& socket, std::shared_ptr<RestApiHandlerBase> api_handler);

  void run();

private:
  void doRead();
  void onRead(beast::error_code ec, std::size_t bytes_transferred);
  template <class Body>
  void sendResponse(http::response<Body>&& response);
  void onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred);
  void doClose();

  // Server-Sent Events: chunked response kept open and fed from an EventSource
  void startEventStream(std::shared_ptr<EventSource> source);
  void onEventHeaderWritten(beast::error_code ec, std::size_t bytes_transferred);
  void pollEvents();
  void scheduleEventPoll();
  void onEventPoll(beast::error_code ec);
  void onEventWrite(beast::error_code ec, std::size_t bytes_transferred);

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  std::shared_ptr<void> res_;
  std::shared_ptr<RestApiHandlerBase> api_handler_;

  std::shared_ptr<EventSource> event_source_;
  std::shared_ptr<http::response<http::empty_body>> event_header_;
  std::shared_ptr<http::response_serializer<http::empty_body>> event_serializer_;
  net::steady_timer event_timer_;
  std::string pending_frames_;
  std::string in_flight_frames_;
  std::chrono::steady_clock::time_point last_event_write_;
  std::chrono::milliseconds poll_interval_;
  std::chrono::seconds heartbeat_interval_;
};

class HttpServer {
public:
  HttpServer(net::io_context& ioc, tcp::endpoint endpoint,
             std::shared_ptr<RestApiHandlerBase> api_handler);

  void run();
  // stops accepting; open sessions end when the io_context stops
  void stop();

private:
  void doAccept();
  void onAccept(beast::error_code ec, tcp::socket socket);

  net::io_context& ioc_;
  tcp::acceptor acceptor_;
  std::shared_ptr<RestApiHandlerBase> api_handler_;
};

}
