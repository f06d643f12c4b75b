#pragma once

#include <cstddef>
#include <string>
#include <chrono>

namespace config {

struct ConnectionPoolConfig{
  size_t min_connections;
  size_t max_connections;
  std::chrono::milliseconds timeout;
};

struct DatabaseConfig {
  std::string path;
  std::chrono::milliseconds busy_timeout;
};

struct HttpServiceConfig {
  std::string host;
  int port;
  int threads;
};

struct CorsConfig {
  std::string allowed_origin;
};

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Getters
const DatabaseConfig& getDatabase() const { return database_; }
const HttpServiceConfig& getContactService() const { return contact_service_; }
const ConnectionPoolConfig& getDBCntPool() const { return db_cp_; }
const CorsConfig& getCors() const { return cors_; }
std::string getContactServiceIpPort() const { return contact_service_.host+":"+std::to_string(contact_service_.port);}

private:
  Config();

  // 环境变量覆盖默认值
  void applyEnvironment();

  DatabaseConfig database_;
  HttpServiceConfig contact_service_;
  ConnectionPoolConfig db_cp_;
  CorsConfig cors_;
};

} // namespace config
