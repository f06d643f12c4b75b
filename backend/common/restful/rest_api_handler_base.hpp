#pragma once
#include <expected>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

// Path and query split out of a request target ("/contacts/search?searchTerm=x").
struct RequestTarget {
  std::string path;
  std::string query;
};

class RestApiHandlerBase {
public:
  explicit RestApiHandlerBase(std::string allowed_origin = "*")
    : allowed_origin_(std::move(allowed_origin)) {}
  virtual ~RestApiHandlerBase() = default;

  template<class Body, class Allocator>
  http::response<http::string_body> handleRequest(
    http::request<Body, http::basic_fields<Allocator>>&& req) {

    const unsigned version = req.version();
    const bool keep_alive = req.keep_alive();
    const std::string method(req.method_string().data(), req.method_string().size());
    const std::string target(req.target().data(), req.target().size());

    if (req.method() == http::verb::options) {
      http::response<http::string_body> res{http::status::ok, version};
      addCorsHeaders(res);
      res.keep_alive(keep_alive);
      res.prepare_payload();
      return res;
    }

    http::response<http::string_body> response;
    try {
      response = doHandleRequest(std::move(req));
    } catch (const std::exception& e) {
      // 异常细节只写日志, 不返回给客户端
      std::cerr << "[http] unhandled error on " << method << " " << target
                << ": " << e.what() << std::endl;
      response = createErrorResponse(http::status::internal_server_error,
                                     "Internal server error",
                                     kInternalErrorDetail);
    }
    response.version(version);
    response.keep_alive(keep_alive);
    addCorsHeaders(response);
    return response;
  }

  // 请求在到达路由之前就被拒绝 (例如 body 超过上限)
  http::response<http::string_body> rejectRequest(http::status status, const std::string& message,
                                                  const std::string& detailed_message = "");

  static constexpr const char* kInternalErrorDetail =
    "An unexpected error occurred while processing the request";

protected:
  virtual http::response<http::string_body> doHandleRequest(
    http::request<http::string_body, http::basic_fields<std::allocator<char>>>&& req) = 0;

  http::response<http::string_body> createJsonResponse(
    http::status status, const nlohmann::json& json);

  // {status, message, detailedMessage}
  http::response<http::string_body> createErrorResponse(
    http::status status, const std::string& message,
    const std::string& detailed_message = "");

  http::response<http::string_body> createEmptyResponse(http::status status);

  std::expected<nlohmann::json, std::string> parseRequestBody(const std::string& body);

  static RequestTarget splitTarget(std::string_view target);
  static std::optional<std::string> getQueryParam(std::string_view query, std::string_view name);
  static std::string urlDecode(std::string_view encoded);

private:
  void addCorsHeaders(http::response<http::string_body>& res) const;

  std::string allowed_origin_;
};

}
