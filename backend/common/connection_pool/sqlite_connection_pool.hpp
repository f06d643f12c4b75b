#pragma once

#include "common/config/config.hpp"
#include "common/connection_pool/connection_pool.hpp"
#include <sqlite3.h>
#include <memory>
#include <string>

namespace common {

// RAII: 构造建立一个sqlite连接, 析构时自动结束连接
class SqliteConnection : public Connection {
public:
  SqliteConnection(sqlite3* conn): conn_(conn) {}
  ~SqliteConnection() override { if (conn_) sqlite3_close_v2(conn_); }

  sqlite3* get() const { return conn_; }
  bool isValid() const override;

private:
  sqlite3* conn_ = nullptr;
};


class SqliteConnectionPool final : public ConnectionPool {
public:
  SqliteConnectionPool(const config::ConnectionPoolConfig& cp_config,
                       const config::DatabaseConfig& db_config);

protected:
  std::unique_ptr<Connection> createConnection() override;

private:
  config::DatabaseConfig db_config_;
  std::string open_path_;
  bool in_memory_ = false;
};

class SqliteConnectionGuard final : public ConnectionGuard {
  using ConnectionGuard::ConnectionGuard;
public:
  sqlite3* get() const {
    return static_cast<SqliteConnection*>(conn_.get())->get();
  }
};

} // namespace common
