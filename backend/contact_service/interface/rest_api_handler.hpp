#pragma once
#include "application/contact_service.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include "interface/contact_validator.hpp"
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace contact_service {

class RestApiHandler : public common::RestApiHandlerBase {
public:
  RestApiHandler(std::shared_ptr<ContactService> contact_service,
                 std::string allowed_origin = "*");

  // {id, name, phoneNumber, email, createdAt, updatedAt}
  static nlohmann::json toJson(const Contact &contact);

protected:
  http::response<http::string_body> doHandleRequest(
      http::request<http::string_body,
                    http::basic_fields<std::allocator<char>>> &&req) override;

private:
  std::shared_ptr<ContactService> contact_service_;
  ContactValidator validator_;

  http::response<http::string_body> handleListContacts();
  http::response<http::string_body> handleGetContact(const std::string &id);
  http::response<http::string_body>
  handleCreateContact(const std::string &body, const std::string &location_prefix);
  http::response<http::string_body>
  handleUpdateContact(const std::string &id, const std::string &body);
  http::response<http::string_body> handleDeleteContact(const std::string &id);
  http::response<http::string_body>
  handleSearchContacts(const std::optional<std::string> &search_term);

  // 解析并校验请求体; 失败时 response 已经生成
  std::expected<ContactDetails, http::response<http::string_body>>
  readContactDetails(const std::string &body);

  http::response<http::string_body> createServiceErrorResponse(const ServiceError &error);
  http::response<http::string_body> createMethodNotAllowedResponse(const std::string &allow);
  http::response<http::string_body> createInvalidIdResponse(const std::string &id);
};

} // namespace contact_service
