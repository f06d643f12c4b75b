#pragma once
#include <optional>
#include <string>
#include "domain/contact.hpp"
#include "domain/repository.hpp"

namespace contact_service {

// All set options must hold for a contact to match.
struct ContactQuery {
  // name 或 phone_number 包含该子串; 空串不做限制
  std::optional<std::string> term;
  std::optional<std::string> phone_number;
  std::optional<std::string> exclude_id;
};

using ContactRepository = Repository<Contact, ContactQuery>;

}
