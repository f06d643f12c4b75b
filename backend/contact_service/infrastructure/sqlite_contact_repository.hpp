#pragma once
#include "domain/contact_repository.hpp"
#include "common/connection_pool/sqlite_connection_pool.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace contact_service {
class SqliteContactRepository : public ContactRepository {
public:
  explicit SqliteContactRepository(std::shared_ptr<common::SqliteConnectionPool> pool);
  ~SqliteContactRepository() override = default;

  // 建表及电话号码唯一索引 (已存在则跳过)
  std::expected<void, StorageError> ensureSchema();

  std::expected<std::vector<Contact>, StorageError> getAll() override;
  std::expected<std::optional<Contact>, StorageError> getById(const std::string& id) override;
  std::expected<Contact, StorageError> add(const Contact& contact) override;
  std::expected<Contact, StorageError> update(const Contact& contact) override;
  std::expected<void, StorageError> remove(const std::string& id) override;
  std::expected<std::vector<Contact>, StorageError> search(const ContactQuery& query) override;

private:
  // 执行查询并获取所有联系人结果
  std::expected<std::vector<Contact>, StorageError> executeSelectQuery(
    const std::string& sql, const std::vector<std::string>& params);

  template <typename T, typename Fn>
  std::expected<T, StorageError> withConnection(Fn&& fn);

  std::shared_ptr<common::SqliteConnectionPool> pool_;
};



// RAII wrapper for a prepared statement and its parameter bindings
class SqliteStatement {
public:
  SqliteStatement(sqlite3* db, const std::string& sql) {
    prepare_rc_ = sqlite3_prepare_v2(db, sql.c_str(), static_cast<int>(sql.size()), &stmt_, nullptr);
  }
  ~SqliteStatement() { sqlite3_finalize(stmt_); }

  SqliteStatement(const SqliteStatement&) = delete;
  SqliteStatement& operator=(const SqliteStatement&) = delete;

  int prepareResult() const { return prepare_rc_; }

  // sqlite 参数下标从 1 开始; 绑定失败记录下来, 由 step() 返回
  void bindText(int pos, const std::string& str) {
    track(sqlite3_bind_text(stmt_, pos, str.data(), static_cast<int>(str.size()), SQLITE_TRANSIENT));
  }

  void bindText(int pos, const std::optional<std::string>& str) {
    if (str) {
      bindText(pos, *str);
    } else {
      track(sqlite3_bind_null(stmt_, pos));
    }
  }

  void bindInt64(int pos, int64_t value) {
    track(sqlite3_bind_int64(stmt_, pos, value));
  }

  void bindInt64(int pos, const std::optional<int64_t>& value) {
    if (value) {
      bindInt64(pos, *value);
    } else {
      track(sqlite3_bind_null(stmt_, pos));
    }
  }

  int step() {
    if (bind_rc_ != SQLITE_OK) return bind_rc_;
    return sqlite3_step(stmt_);
  }

  std::string columnText(int col) const {
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
    return text ? std::string(text, sqlite3_column_bytes(stmt_, col)) : std::string{};
  }

  std::optional<std::string> columnOptionalText(int col) const {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
    return columnText(col);
  }

  int64_t columnInt64(int col) const { return sqlite3_column_int64(stmt_, col); }

  std::optional<int64_t> columnOptionalInt64(int col) const {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
    return columnInt64(col);
  }

private:
  void track(int rc) {
    if (bind_rc_ == SQLITE_OK) bind_rc_ = rc;
  }

  sqlite3_stmt* stmt_ = nullptr;
  int prepare_rc_ = SQLITE_OK;
  int bind_rc_ = SQLITE_OK;
};
}
