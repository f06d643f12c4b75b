#include "http_server.hpp"
#include <iostream>
#include <string>

namespace common {

// HttpServer implementation
HttpServer::HttpServer(net::io_context& ioc, tcp::endpoint endpoint,
                       std::shared_ptr<RestApiHandlerBase> api_handler,
                       std::chrono::seconds idle_timeout)
  : ioc_(ioc), acceptor_(ioc), api_handler_(std::move(api_handler)), idle_timeout_(idle_timeout) {

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
    std::cerr << "[http] close acceptor error: " << ec.message() << std::endl;
  }
}

void HttpServer::doAccept() {
  acceptor_.async_accept(
    net::make_strand(ioc_),
    beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (ec == net::error::operation_aborted) {
    // acceptor 已关闭, 停止接收新连接
    return;
  }

  if (ec) {
    std::cerr << "[http] accept error: " << ec.message() << std::endl;
  } else {
    std::make_shared<HttpSession>(std::move(socket), api_handler_, idle_timeout_)->run();
  }

  doAccept();
}

// HttpSession implementation
HttpSession::HttpSession(tcp::socket&& socket, std::shared_ptr<RestApiHandlerBase> api_handler,
                         std::chrono::seconds idle_timeout)
  : stream_(std::move(socket)), api_handler_(std::move(api_handler)), idle_timeout_(idle_timeout) {}

void HttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
  // 每个请求使用新的 parser, 以便重新设置 body 上限
  parser_ = std::make_unique<http::request_parser<http::string_body>>();
  parser_->body_limit(kBodyLimit);

  stream_.expires_after(idle_timeout_);

  http::async_read(stream_, buffer_, *parser_,
                   beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec == http::error::end_of_stream || ec == beast::error::timeout) {
    return doClose();
  }

  if (ec == http::error::body_limit) {
    // 头部已解析, 回复 413 后关闭连接
    res_ = std::make_shared<http::response<http::string_body>>(
      api_handler_->rejectRequest(http::status::payload_too_large, "Request body too large",
                                  "Request bodies are limited to " +
                                  std::to_string(kBodyLimit) + " bytes"));
    res_->version(parser_->get().version());
    res_->prepare_payload();
    http::async_write(stream_, *res_,
                      beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(), true));
    return;
  }

  if (ec) {
    std::cerr << "[http] read error: " << ec.message() << std::endl;
    return doClose();
  }

  res_ = std::make_shared<http::response<http::string_body>>(
    api_handler_->handleRequest(parser_->release()));

  http::async_write(stream_, *res_,
                    beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(),
                                              res_->need_eof()));
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec) {
    std::cerr << "[http] write error: " << ec.message() << std::endl;
    return doClose();
  }

  if (close) {
    return doClose();
  }

  res_ = nullptr;
  doRead();
}

void HttpSession::doClose() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

}
