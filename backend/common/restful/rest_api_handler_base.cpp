#include "rest_api_handler_base.hpp"
#include <cctype>

namespace common {

http::response<http::string_body> RestApiHandlerBase::createJsonResponse(
  http::status status, const nlohmann::json& json) {

  http::response<http::string_body> res{status, 11};
  res.set(http::field::content_type, "application/json");
  // 非法 UTF-8 (例如 URL 解码出的原始字节) 用 U+FFFD 替换, 不抛异常
  res.body() = json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  res.prepare_payload();
  return res;
}

http::response<http::string_body> RestApiHandlerBase::createErrorResponse(
  http::status status, const std::string& message, const std::string& detailed_message) {

  nlohmann::json error_json = {
    {"status", static_cast<int>(status)},
    {"message", message},
    {"detailedMessage", detailed_message}
  };
  return createJsonResponse(status, error_json);
}

http::response<http::string_body> RestApiHandlerBase::rejectRequest(
  http::status status, const std::string& message, const std::string& detailed_message) {

  auto res = createErrorResponse(status, message, detailed_message);
  res.keep_alive(false);
  addCorsHeaders(res);
  return res;
}

void RestApiHandlerBase::addCorsHeaders(http::response<http::string_body>& res) const {
  res.set(http::field::access_control_allow_origin, allowed_origin_);
  res.set(http::field::access_control_allow_methods, "GET, POST, PUT, DELETE, OPTIONS");
  res.set(http::field::access_control_allow_headers, "Content-Type, Authorization");
}

http::response<http::string_body> RestApiHandlerBase::createEmptyResponse(http::status status) {
  http::response<http::string_body> res{status, 11};
  res.prepare_payload();
  return res;
}

std::expected<nlohmann::json, std::string> RestApiHandlerBase::parseRequestBody(const std::string& body) {
  if (body.empty()) {
    return std::unexpected("Request body is empty");
  }
  try {
    return nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error& e) {
    return std::unexpected("Invalid JSON in request body: " + std::string(e.what()));
  }
}

RequestTarget RestApiHandlerBase::splitTarget(std::string_view target) {
  RequestTarget result;
  auto pos = target.find('?');
  if (pos == std::string_view::npos) {
    result.path = std::string(target);
  } else {
    result.path = std::string(target.substr(0, pos));
    result.query = std::string(target.substr(pos + 1));
  }
  // "/contacts/" 与 "/contacts" 等价
  while (result.path.size() > 1 && result.path.back() == '/') {
    result.path.pop_back();
  }
  return result;
}

std::optional<std::string> RestApiHandlerBase::getQueryParam(std::string_view query, std::string_view name) {
  while (!query.empty()) {
    auto amp = query.find('&');
    std::string_view pair = query.substr(0, amp);
    query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

    auto eq = pair.find('=');
    std::string key = urlDecode(pair.substr(0, eq));
    if (key != name) {
      continue;
    }
    if (eq == std::string_view::npos) {
      return std::string{};
    }
    return urlDecode(pair.substr(eq + 1));
  }
  return std::nullopt;
}

std::string RestApiHandlerBase::urlDecode(std::string_view encoded) {
  auto hexValue = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
  };

  std::string decoded;
  decoded.reserve(encoded.size());
  for (size_t i = 0; i < encoded.size(); ++i) {
    char c = encoded[i];
    if (c == '+') {
      decoded += ' ';
    } else if (c == '%' && i + 2 < encoded.size()) {
      int hi = hexValue(encoded[i + 1]);
      int lo = hexValue(encoded[i + 2]);
      if (hi < 0 || lo < 0) {
        decoded += c;
        continue;
      }
      decoded += static_cast<char>((hi << 4) | lo);
      i += 2;
    } else {
      decoded += c;
    }
  }
  return decoded;
}

}
