#include "config.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace config {

namespace {

const char* readEnv(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

void overrideInt(const char* name, int& target) {
  const char* value = readEnv(name);
  if (!value) return;
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != std::string(value).size() || parsed <= 0) {
      throw std::invalid_argument("not a positive integer");
    }
    target = parsed;
  } catch (const std::exception& e) {
    std::cerr << "[config] ignoring " << name << "=" << value << ": " << e.what() << std::endl;
  }
}

void overrideString(const char* name, std::string& target) {
  if (const char* value = readEnv(name)) {
    target = value;
  }
}

} // namespace

  Config::Config() {
    db_cp_ = {
      .min_connections = 2,
      .max_connections = 8,
      .timeout = std::chrono::milliseconds(5000)
    };

    database_ = {
      .path = "phonebook.db",
      .busy_timeout = std::chrono::milliseconds(5000)
    };

    contact_service_ = {
      .host = "0.0.0.0",
      .port = 8080,
      .threads = 4
    };

    cors_ = {
      .allowed_origin = "http://localhost:3000"
    };

    applyEnvironment();
  }

  void Config::applyEnvironment() {
    overrideString("PHONEBOOK_HOST", contact_service_.host);
    overrideInt("PHONEBOOK_PORT", contact_service_.port);
    overrideInt("PHONEBOOK_THREADS", contact_service_.threads);
    overrideString("PHONEBOOK_DB_PATH", database_.path);
    overrideString("PHONEBOOK_CORS_ORIGIN", cors_.allowed_origin);
  }
}
