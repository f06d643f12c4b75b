#pragma once
#include <expected>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/contact.hpp"

namespace contact_service {

struct FieldError {
  std::string field;
  std::string message;
};

// Shape and format checks for contact request bodies, run before the service sees them.
class ContactValidator {
public:
  static constexpr size_t kMaxNameLength = 100;
  static constexpr size_t kMaxPhoneNumberLength = 20;
  static constexpr size_t kMaxEmailLength = 100;

  ContactValidator()
    : phone_pattern_("^\\+?[1-9][0-9]{1,14}$"),
      // 只要求恰好一个 '@' 且两侧非空, 不限制顶级域名
      email_pattern_("^[^@\\s]+@[^@\\s]+$") {}

  // {name, phoneNumber, email?}; every failing field is reported, not only the first
  std::expected<ContactDetails, std::vector<FieldError>> validate(const nlohmann::json& body) const;

  // 返回规范化 (小写) 的 UUID, 非法时返回 nullopt
  static std::optional<std::string> normalizeContactId(const std::string& id);

  // "field: message; field: message"
  static std::string describe(const std::vector<FieldError>& errors);

private:
  std::optional<std::string> readString(const nlohmann::json& body, const char* field,
                                        bool required, size_t max_length,
                                        std::vector<FieldError>& errors) const;

  std::regex phone_pattern_;
  std::regex email_pattern_;
};

}
