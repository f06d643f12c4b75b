#include "contact_validator.hpp"
#include <algorithm>
#include <cctype>
#include <uuid/uuid.h>

namespace contact_service {

namespace {

// 按 UTF-8 字符计数, 而不是字节
size_t characterCount(const std::string& value) {
  return static_cast<size_t>(std::count_if(value.begin(), value.end(), [](char c) {
    return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
  }));
}

bool isBlank(const std::string& value) {
  return std::all_of(value.begin(), value.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  });
}

} // namespace

std::expected<ContactDetails, std::vector<FieldError>> ContactValidator::validate(
  const nlohmann::json& body) const {

  std::vector<FieldError> errors;
  if (!body.is_object()) {
    errors.push_back({"body", "must be a JSON object"});
    return std::unexpected(std::move(errors));
  }

  auto name = readString(body, "name", true, kMaxNameLength, errors);
  auto phone_number = readString(body, "phoneNumber", true, kMaxPhoneNumberLength, errors);
  auto email = readString(body, "email", false, kMaxEmailLength, errors);

  if (phone_number && !std::regex_match(*phone_number, phone_pattern_)) {
    errors.push_back({"phoneNumber", "Invalid phone number format"});
  }
  if (email && !std::regex_match(*email, email_pattern_)) {
    errors.push_back({"email", "is not a valid email address"});
  }

  if (!errors.empty()) {
    return std::unexpected(std::move(errors));
  }
  return ContactDetails{*name, *phone_number, email};
}

std::optional<std::string> ContactValidator::readString(const nlohmann::json& body, const char* field,
                                                        bool required, size_t max_length,
                                                        std::vector<FieldError>& errors) const {
  auto it = body.find(field);
  if (it == body.end() || it->is_null()) {
    if (required) {
      errors.push_back({field, "is required"});
    }
    return std::nullopt;
  }
  if (!it->is_string()) {
    errors.push_back({field, "must be a string"});
    return std::nullopt;
  }

  std::string value = it->get<std::string>();
  if (required && isBlank(value)) {
    errors.push_back({field, "is required"});
    return std::nullopt;
  }
  if (characterCount(value) > max_length) {
    errors.push_back({field, "must be at most " + std::to_string(max_length) + " characters"});
    return std::nullopt;
  }
  return value;
}

std::optional<std::string> ContactValidator::normalizeContactId(const std::string& id) {
  uuid_t uuid;
  if (id.size() != 36 || uuid_parse(id.c_str(), uuid) != 0) {
    return std::nullopt;
  }
  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);
  return std::string(uuid_str);
}

std::string ContactValidator::describe(const std::vector<FieldError>& errors) {
  std::string result;
  for (const auto& error : errors) {
    if (!result.empty()) {
      result += "; ";
    }
    result += error.field + ": " + error.message;
  }
  return result;
}

}
