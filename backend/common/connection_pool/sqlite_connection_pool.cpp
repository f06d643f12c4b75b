#include "sqlite_connection_pool.hpp"
#include <atomic>
#include <iostream>
#include <string>

namespace common {

bool SqliteConnection::isValid() const {
  // 嵌入式数据库没有网络连接, 句柄存在即可用
  return conn_ != nullptr;
}

SqliteConnectionPool::SqliteConnectionPool(const config::ConnectionPoolConfig& cp_config,
                                           const config::DatabaseConfig& db_config)
  : ConnectionPool(cp_config), db_config_(db_config), open_path_(db_config.path) {
  if (db_config_.path == ":memory:") {
    // 每个 ":memory:" 连接都是独立的库; 改为本池专用的共享缓存内存库,
    // 且至少常驻一个连接, 否则最后一个连接关闭时库随之消失
    static std::atomic<unsigned> memory_db_counter{0};
    open_path_ = "file:phonebook_memdb_" + std::to_string(memory_db_counter.fetch_add(1)) +
                 "?mode=memory&cache=shared";
    in_memory_ = true;
    if (cp_config_.min_connections == 0) {
      cp_config_.min_connections = 1;
    }
  }

  for (size_t i = 0; i < cp_config_.min_connections; ++i) {
    auto conn = createConnection();
    if (conn) {
      pool_.push(std::move(conn));
    }
  }
}

std::unique_ptr<Connection> SqliteConnectionPool::createConnection() {
  sqlite3* conn = nullptr;
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX | SQLITE_OPEN_URI;
  if (sqlite3_open_v2(open_path_.c_str(), &conn, flags, nullptr) != SQLITE_OK) {
    std::cerr << "[sqlite] failed to open " << db_config_.path << ": "
              << (conn ? sqlite3_errmsg(conn) : "out of memory") << std::endl;
    sqlite3_close_v2(conn);
    return nullptr;
  }

  sqlite3_extended_result_codes(conn, 1);
  sqlite3_busy_timeout(conn, static_cast<int>(db_config_.busy_timeout.count()));

  if (!in_memory_) {
    char* err = nullptr;
    if (sqlite3_exec(conn, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &err) != SQLITE_OK) {
      std::cerr << "[sqlite] failed to enable WAL on " << db_config_.path << ": "
                << (err ? err : "unknown error") << std::endl;
      sqlite3_free(err);
      sqlite3_close_v2(conn);
      return nullptr;
    }
  }

  return std::make_unique<SqliteConnection>(conn);
}

} // namespace common
