#pragma once
#include <optional>
#include <string>
#include "common/time_util.hpp"

namespace contact_service {

// Fields a client may set; everything else on Contact is owned by the service.
struct ContactDetails {
  std::string name;
  std::string phone_number;
  std::optional<std::string> email;
};

class Contact {
public:
  Contact(const std::string& id, const std::string& name, const std::string& phone_number,
          const std::optional<std::string>& email, common::Timestamp created_at,
          const std::optional<common::Timestamp>& updated_at = std::nullopt)
    : id_(id), name_(name), phone_number_(phone_number), email_(email),
      created_at_(created_at), updated_at_(updated_at) {}

  Contact(){}

  std::string id() const { return id_; }
  std::string name() const { return name_; }
  std::string phone_number() const { return phone_number_; }
  std::optional<std::string> email() const { return email_; }
  common::Timestamp created_at() const { return created_at_; }
  std::optional<common::Timestamp> updated_at() const { return updated_at_; }

  // id 与 created_at 不可变; 修改只能通过这里进行
  void applyDetails(const ContactDetails& details, common::Timestamp updated_at) {
    name_ = details.name;
    phone_number_ = details.phone_number;
    email_ = details.email;
    updated_at_ = updated_at;
  }

  bool operator==(const Contact&) const = default;

private:
  std::string id_;
  std::string name_;
  std::string phone_number_;
  std::optional<std::string> email_;
  common::Timestamp created_at_{};
  std::optional<common::Timestamp> updated_at_;
};
}
