#pragma once
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/contact.hpp"
#include "domain/contact_repository.hpp"

namespace contact_service {

enum class ServiceErrc {
  not_found,
  conflict,
  internal
};

struct ServiceError {
  ServiceErrc code;
  std::string message;         // safe to show to the caller
  std::string detailed_message;
};

class ContactService {
public:
  explicit ContactService(std::shared_ptr<ContactRepository> repository)
    : repository_(std::move(repository)) {}

  std::expected<std::vector<Contact>, ServiceError> listContacts();

  std::expected<Contact, ServiceError> getContact(const std::string& id);

  // 电话号码必须未被任何联系人使用
  std::expected<Contact, ServiceError> createContact(const ContactDetails& details);

  // 电话号码可以保持不变, 但不能与其他联系人重复
  std::expected<Contact, ServiceError> updateContact(const std::string& id,
                                                     const ContactDetails& details);

  std::expected<void, ServiceError> deleteContact(const std::string& id);

  // empty or missing term returns every contact
  std::expected<std::vector<Contact>, ServiceError> searchContacts(
    const std::optional<std::string>& term);

  static constexpr const char* kInternalErrorDetail =
    "The request could not be completed. Please try again later";

private:
  std::expected<bool, ServiceError> phoneNumberTaken(const std::string& operation,
                                                     const std::string& phone_number,
                                                     const std::optional<std::string>& exclude_id);

  ServiceError internalError(const std::string& operation, const std::string& context,
                             const StorageError& error, const std::string& message);

  static ServiceError notFound(const std::string& id);
  static std::string generateContactId();

  std::shared_ptr<ContactRepository> repository_;
};
}
