#include "contact_service.hpp"
#include <iostream>
#include <uuid/uuid.h>

namespace contact_service {

namespace {

constexpr const char* kCreateConflict = "Phone number already exists";
constexpr const char* kUpdateConflict = "Phone number already exists for another contact";

ServiceError conflict(const char* message, const std::string& phone_number) {
  return ServiceError{ServiceErrc::conflict, message,
                      "Phone number " + phone_number + " is already in use"};
}

} // namespace

std::expected<std::vector<Contact>, ServiceError> ContactService::listContacts() {
  auto contacts = repository_->getAll();
  if (!contacts) {
    return std::unexpected(internalError("listContacts", "all", contacts.error(),
                                         "An error occurred while retrieving contacts"));
  }
  return std::move(contacts.value());
}

std::expected<Contact, ServiceError> ContactService::getContact(const std::string& id) {
  auto contact = repository_->getById(id);
  if (!contact) {
    return std::unexpected(internalError("getContact", "id=" + id, contact.error(),
                                         "An error occurred while retrieving the contact"));
  }
  if (!contact->has_value()) {
    return std::unexpected(notFound(id));
  }
  return std::move(**contact);
}

std::expected<Contact, ServiceError> ContactService::createContact(const ContactDetails& details) {
  const std::string failure = "An error occurred while creating the contact";

  auto taken = phoneNumberTaken("createContact", details.phone_number, std::nullopt);
  if (!taken) {
    return std::unexpected(ServiceError{ServiceErrc::internal, failure, kInternalErrorDetail});
  }
  if (taken.value()) {
    return std::unexpected(conflict(kCreateConflict, details.phone_number));
  }

  Contact contact(generateContactId(), details.name, details.phone_number, details.email,
                  common::nowMillis());

  auto created = repository_->add(contact);
  if (!created) {
    if (created.error().code == StorageErrc::conflict) {
      // 并发创建时预检查可能都通过, 由唯一索引兜底
      std::cerr << "[contact_service] createContact lost race on phone=" << details.phone_number
                << ", err=" << created.error().message << std::endl;
      return std::unexpected(conflict(kCreateConflict, details.phone_number));
    }
    return std::unexpected(internalError("createContact", "phone=" + details.phone_number,
                                         created.error(), failure));
  }
  return std::move(created.value());
}

std::expected<Contact, ServiceError> ContactService::updateContact(const std::string& id,
                                                                   const ContactDetails& details) {
  const std::string failure = "An error occurred while updating the contact";

  auto existing = repository_->getById(id);
  if (!existing) {
    return std::unexpected(internalError("updateContact", "id=" + id, existing.error(), failure));
  }
  if (!existing->has_value()) {
    return std::unexpected(notFound(id));
  }

  auto taken = phoneNumberTaken("updateContact", details.phone_number, id);
  if (!taken) {
    return std::unexpected(ServiceError{ServiceErrc::internal, failure, kInternalErrorDetail});
  }
  if (taken.value()) {
    return std::unexpected(conflict(kUpdateConflict, details.phone_number));
  }

  Contact contact = std::move(**existing);
  contact.applyDetails(details, common::nowMillis());

  auto updated = repository_->update(contact);
  if (!updated) {
    switch (updated.error().code) {
      case StorageErrc::not_found:
        // 检查之后被并发删除
        return std::unexpected(notFound(id));
      case StorageErrc::conflict:
        std::cerr << "[contact_service] updateContact lost race on phone=" << details.phone_number
                  << ", id=" << id << ", err=" << updated.error().message << std::endl;
        return std::unexpected(conflict(kUpdateConflict, details.phone_number));
      case StorageErrc::storage:
        break;
    }
    return std::unexpected(internalError("updateContact", "id=" + id, updated.error(), failure));
  }
  return std::move(updated.value());
}

std::expected<void, ServiceError> ContactService::deleteContact(const std::string& id) {
  const std::string failure = "An error occurred while deleting the contact";

  auto existing = repository_->getById(id);
  if (!existing) {
    return std::unexpected(internalError("deleteContact", "id=" + id, existing.error(), failure));
  }
  if (!existing->has_value()) {
    return std::unexpected(notFound(id));
  }

  auto removed = repository_->remove(id);
  if (!removed) {
    if (removed.error().code == StorageErrc::not_found) {
      return std::unexpected(notFound(id));
    }
    return std::unexpected(internalError("deleteContact", "id=" + id, removed.error(), failure));
  }
  return {};
}

std::expected<std::vector<Contact>, ServiceError> ContactService::searchContacts(
  const std::optional<std::string>& term) {

  ContactQuery query;
  if (term && !term->empty()) {
    query.term = term;
  }

  auto contacts = repository_->search(query);
  if (!contacts) {
    return std::unexpected(internalError("searchContacts", "term=" + term.value_or(""),
                                         contacts.error(),
                                         "An error occurred while searching contacts"));
  }
  return std::move(contacts.value());
}

std::expected<bool, ServiceError> ContactService::phoneNumberTaken(
  const std::string& operation, const std::string& phone_number,
  const std::optional<std::string>& exclude_id) {

  ContactQuery query;
  query.phone_number = phone_number;
  query.exclude_id = exclude_id;

  auto matches = repository_->search(query);
  if (!matches) {
    return std::unexpected(internalError(operation, "phone=" + phone_number, matches.error(),
                                         "phone number check failed"));
  }
  return !matches->empty();
}

ServiceError ContactService::internalError(const std::string& operation, const std::string& context,
                                           const StorageError& error, const std::string& message) {
  // 存储层细节只进日志
  std::cerr << "[contact_service] " << operation << " failed, " << context
            << ", err=" << error.message << std::endl;
  return ServiceError{ServiceErrc::internal, message, kInternalErrorDetail};
}

ServiceError ContactService::notFound(const std::string& id) {
  return ServiceError{ServiceErrc::not_found, "Contact with ID " + id + " not found", ""};
}

std::string ContactService::generateContactId() {
  uuid_t uuid;
  uuid_generate_random(uuid);
  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);
  return uuid_str;
}

}
