#include "http_server.hpp"
#include "common/config/config.hpp"
#include <iostream>

namespace common {

// HttpServer implementation
HttpServer::HttpServer(net::io_context& ioc, tcp::endpoint endpoint,
                       std::shared_ptr<RestApiHandlerBase> api_handler)
  : ioc_(ioc), acceptor_(ioc), api_handler_(api_handler) {

  beast::error_code ec;

  acceptor_.open(endpoint.protocol(), ec);
  if (ec) {
    throw std::runtime_error("Failed to open acceptor: " + ec.message());
  }

  acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (ec) {
    throw std::runtime_error("Failed to set reuse_address: " + ec.message());
  }

  acceptor_.bind(endpoint, ec);
  if (ec) {
    throw std::runtime_error("Failed to bind: " + ec.message());
  }

  acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    throw std::runtime_error("Failed to listen: " + ec.message());
  }
}

void HttpServer::run() {
  doAccept();
}

void HttpServer::stop() {
  beast::error_code ec;
  acceptor_.close(ec);
  if (ec) {
    std::cerr << "Acceptor close error: " << ec.message() << std::endl;
  }
}

void HttpServer::doAccept() {
  acceptor_.async_accept(
    net::make_strand(ioc_),
    beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (ec == net::error::operation_aborted) {
    return;
  }
  if (ec) {
    std::cerr << "Accept error: " << ec.message() << std::endl;
  } else {
    std::make_shared<HttpSession>(std::move(socket), api_handler_)->run();
  }

  doAccept();
}

// HttpSession implementation
HttpSession::HttpSession(tcp::socket&& socket, std::shared_ptr<RestApiHandlerBase> api_handler)
  : stream_(std::move(socket)),
    api_handler_(api_handler),
    event_timer_(stream_.get_executor()),
    poll_interval_(config::Config::getInstance().getServer().sse_poll_interval),
    heartbeat_interval_(config::Config::getInstance().getServer().sse_heartbeat) {}

void HttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
  req_ = {};

  stream_.expires_after(std::chrono::seconds(30));

  http::async_read(stream_, buffer_, req_,
                   beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec == http::error::end_of_stream) {
    return doClose();
  }

  if (ec) {
    if (ec != beast::error::timeout) {
      std::cerr << "Read error: " << ec.message() << std::endl;
    }
    return;
  }

  if (auto source = api_handler_->openEventStream(req_)) {
    return startEventStream(std::move(source));
  }

  if (auto file_reply = api_handler_->handleFileRequest(req_)) {
    return std::visit([this](auto& res) { sendResponse(std::move(res)); }, *file_reply);
  }

  sendResponse(api_handler_->handleRequest(std::move(req_)));
}

template <class Body>
void HttpSession::sendResponse(http::response<Body>&& response) {
  auto res = std::make_shared<http::response<Body>>(std::move(response));

  // keep the message alive until the write completes
  res_ = res;

  http::async_write(stream_, *res,
                    beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(),
                                            res->need_eof()));
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec) {
    std::cerr << "Write error: " << ec.message() << std::endl;
    return;
  }

  if (close) {
    return doClose();
  }

  res_ = nullptr;
  doRead();
}

void HttpSession::doClose() {
  beast::error_code ec;
  event_timer_.cancel();
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

void HttpSession::startEventStream(std::shared_ptr<EventSource> source) {
  event_source_ = std::move(source);

  event_header_ = std::make_shared<http::response<http::empty_body>>(http::status::ok, req_.version());
  auto& res = *event_header_;
  res.set(http::field::content_type, "text/event-stream");
  res.set(http::field::cache_control, "no-cache");
  res.keep_alive(true);
  res.chunked(true);
  api_handler_->addCorsHeaders(res, std::string(req_[http::field::origin]));

  // the stream stays open until the client goes away
  stream_.expires_never();

  event_serializer_ = std::make_shared<http::response_serializer<http::empty_body>>(res);
  http::async_write_header(stream_, *event_serializer_,
                           beast::bind_front_handler(&HttpSession::onEventHeaderWritten,
                                                     shared_from_this()));
}

void HttpSession::onEventHeaderWritten(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec) {
    std::cerr << "Event stream header error: " << ec.message() << std::endl;
    return doClose();
  }

  pending_frames_ = event_source_->initialFrame();
  last_event_write_ = std::chrono::steady_clock::now();
  pollEvents();
}

void HttpSession::pollEvents() {
  while (auto frame = event_source_->nextFrame()) {
    pending_frames_ += *frame;
  }

  if (std::chrono::steady_clock::now() - last_event_write_ >= heartbeat_interval_) {
    pending_frames_ += ": heartbeat\n\n";
  }

  if (pending_frames_.empty()) {
    if (event_source_->finished()) {
      return doClose();
    }
    return scheduleEventPoll();
  }

  in_flight_frames_ = std::move(pending_frames_);
  pending_frames_.clear();
  net::async_write(stream_, http::make_chunk(net::buffer(in_flight_frames_)),
                   beast::bind_front_handler(&HttpSession::onEventWrite, shared_from_this()));
}

void HttpSession::scheduleEventPoll() {
  event_timer_.expires_after(poll_interval_);
  event_timer_.async_wait(beast::bind_front_handler(&HttpSession::onEventPoll, shared_from_this()));
}

void HttpSession::onEventPoll(beast::error_code ec) {
  if (ec) {
    return;
  }
  pollEvents();
}

void HttpSession::onEventWrite(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec) {
    // client disconnected
    return doClose();
  }

  last_event_write_ = std::chrono::steady_clock::now();
  if (event_source_->finished()) {
    return doClose();
  }
  scheduleEventPoll();
}

}
