#include "rest_api_handler.hpp"

namespace contact_service {

namespace {

constexpr std::string_view kCollection = "/contacts";
constexpr std::string_view kApiPrefix = "/api";

nlohmann::json toJsonArray(const std::vector<Contact> &contacts) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto &contact : contacts) {
    array.push_back(RestApiHandler::toJson(contact));
  }
  return array;
}

} // namespace

RestApiHandler::RestApiHandler(std::shared_ptr<ContactService> contact_service,
                               std::string allowed_origin)
    : common::RestApiHandlerBase(std::move(allowed_origin)),
      contact_service_(std::move(contact_service)) {}

nlohmann::json RestApiHandler::toJson(const Contact &contact) {
  nlohmann::json json = {
      {"id", contact.id()},
      {"name", contact.name()},
      {"phoneNumber", contact.phone_number()},
      {"email", nullptr},
      {"createdAt", common::toIso8601(contact.created_at())},
      {"updatedAt", nullptr}};
  if (auto email = contact.email()) {
    json["email"] = *email;
  }
  if (auto updated_at = contact.updated_at()) {
    json["updatedAt"] = common::toIso8601(*updated_at);
  }
  return json;
}

http::response<http::string_body> RestApiHandler::doHandleRequest(
    http::request<http::string_body,
                  http::basic_fields<std::allocator<char>>> &&req) {
  auto target = splitTarget(std::string_view(req.target().data(), req.target().size()));

  // /api/contacts 与 /contacts 都可以访问
  std::string_view path = target.path;
  std::string prefix;
  if (path.starts_with(kApiPrefix) && path.substr(kApiPrefix.size()).starts_with(kCollection)) {
    prefix = std::string(kApiPrefix);
    path.remove_prefix(kApiPrefix.size());
  }

  if (!path.starts_with(kCollection)) {
    return createErrorResponse(http::status::not_found, "Endpoint not found", target.path);
  }
  std::string_view rest = path.substr(kCollection.size());

  if (rest.empty()) {
    if (req.method() == http::verb::get) {
      return handleListContacts();
    } else if (req.method() == http::verb::post) {
      return handleCreateContact(req.body(), prefix + std::string(kCollection));
    }
    return createMethodNotAllowedResponse("GET, POST, OPTIONS");
  }

  if (rest.front() != '/' || rest.find('/', 1) != std::string_view::npos) {
    return createErrorResponse(http::status::not_found, "Endpoint not found", target.path);
  }
  std::string segment = urlDecode(rest.substr(1));

  if (segment == "search" && req.method() == http::verb::get) {
    return handleSearchContacts(getQueryParam(target.query, "searchTerm"));
  }

  if (req.method() != http::verb::get && req.method() != http::verb::put &&
      req.method() != http::verb::delete_) {
    return createMethodNotAllowedResponse("GET, PUT, DELETE, OPTIONS");
  }

  auto id = ContactValidator::normalizeContactId(segment);
  if (!id) {
    return createInvalidIdResponse(segment);
  }

  if (req.method() == http::verb::get) {
    return handleGetContact(*id);
  } else if (req.method() == http::verb::put) {
    return handleUpdateContact(*id, req.body());
  }
  return handleDeleteContact(*id);
}

http::response<http::string_body> RestApiHandler::handleListContacts() {
  auto result = contact_service_->listContacts();
  if (!result) {
    return createServiceErrorResponse(result.error());
  }
  return createJsonResponse(http::status::ok, toJsonArray(result.value()));
}

http::response<http::string_body>
RestApiHandler::handleGetContact(const std::string &id) {
  auto result = contact_service_->getContact(id);
  if (!result) {
    return createServiceErrorResponse(result.error());
  }
  return createJsonResponse(http::status::ok, toJson(result.value()));
}

http::response<http::string_body>
RestApiHandler::handleCreateContact(const std::string &body,
                                    const std::string &location_prefix) {
  auto details = readContactDetails(body);
  if (!details) {
    return std::move(details.error());
  }

  auto result = contact_service_->createContact(details.value());
  if (!result) {
    return createServiceErrorResponse(result.error());
  }

  auto response = createJsonResponse(http::status::created, toJson(result.value()));
  response.set(http::field::location, location_prefix + "/" + result->id());
  return response;
}

http::response<http::string_body>
RestApiHandler::handleUpdateContact(const std::string &id, const std::string &body) {
  auto details = readContactDetails(body);
  if (!details) {
    return std::move(details.error());
  }

  auto result = contact_service_->updateContact(id, details.value());
  if (!result) {
    return createServiceErrorResponse(result.error());
  }
  return createJsonResponse(http::status::ok, toJson(result.value()));
}

http::response<http::string_body>
RestApiHandler::handleDeleteContact(const std::string &id) {
  auto result = contact_service_->deleteContact(id);
  if (!result) {
    return createServiceErrorResponse(result.error());
  }
  return createEmptyResponse(http::status::no_content);
}

http::response<http::string_body>
RestApiHandler::handleSearchContacts(const std::optional<std::string> &search_term) {
  auto result = contact_service_->searchContacts(search_term);
  if (!result) {
    return createServiceErrorResponse(result.error());
  }
  return createJsonResponse(http::status::ok, toJsonArray(result.value()));
}

std::expected<ContactDetails, http::response<http::string_body>>
RestApiHandler::readContactDetails(const std::string &body) {
  auto json = parseRequestBody(body);
  if (!json) {
    return std::unexpected(createErrorResponse(http::status::bad_request,
                                               "Invalid request body", json.error()));
  }

  auto details = validator_.validate(json.value());
  if (!details) {
    return std::unexpected(createErrorResponse(http::status::bad_request,
                                               "Validation failed",
                                               ContactValidator::describe(details.error())));
  }
  return std::move(details.value());
}

http::response<http::string_body>
RestApiHandler::createServiceErrorResponse(const ServiceError &error) {
  switch (error.code) {
  case ServiceErrc::not_found:
    return createErrorResponse(http::status::not_found, error.message,
                               error.detailed_message);
  case ServiceErrc::conflict:
    return createErrorResponse(http::status::bad_request, error.message,
                               error.detailed_message);
  case ServiceErrc::internal:
    break;
  }
  return createErrorResponse(http::status::internal_server_error, error.message,
                             error.detailed_message);
}

http::response<http::string_body>
RestApiHandler::createMethodNotAllowedResponse(const std::string &allow) {
  auto response = createErrorResponse(http::status::method_not_allowed,
                                      "Method not allowed", "Allowed: " + allow);
  response.set(http::field::allow, allow);
  return response;
}

http::response<http::string_body>
RestApiHandler::createInvalidIdResponse(const std::string &id) {
  return createErrorResponse(http::status::bad_request, "Validation failed",
                             ContactValidator::describe(
                                 std::vector<FieldError>{{"id", "'" + id + "' is not a valid contact id"}}));
}

} // namespace contact_service
