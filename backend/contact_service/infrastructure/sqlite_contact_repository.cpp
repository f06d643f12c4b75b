#include "sqlite_contact_repository.hpp"
#include <stdexcept>
#include <utility>

namespace contact_service {

namespace {

constexpr const char* kSelectColumns =
  "SELECT id, name, phone_number, email, created_at, updated_at FROM contacts";

StorageError makeError(sqlite3* db, int rc, const std::string& context) {
  std::string message = context + ": " + sqlite3_errmsg(db) + " (code " + std::to_string(rc) + ")";
  if (rc == SQLITE_CONSTRAINT_UNIQUE) {
    return StorageError{StorageErrc::conflict, message};
  }
  return StorageError{StorageErrc::storage, message};
}

Contact readContact(const SqliteStatement& stmt) {
  std::optional<common::Timestamp> updated_at;
  if (auto ms = stmt.columnOptionalInt64(5)) {
    updated_at = common::fromUnixMillis(*ms);
  }
  return Contact(
    stmt.columnText(0),
    stmt.columnText(1),
    stmt.columnText(2),
    stmt.columnOptionalText(3),
    common::fromUnixMillis(stmt.columnInt64(4)),
    updated_at
  );
}

std::optional<int64_t> toOptionalMillis(const std::optional<common::Timestamp>& ts) {
  if (!ts) return std::nullopt;
  return common::toUnixMillis(*ts);
}

} // namespace

SqliteContactRepository::SqliteContactRepository(std::shared_ptr<common::SqliteConnectionPool> pool)
  : pool_(std::move(pool)) {}

template <typename T, typename Fn>
std::expected<T, StorageError> SqliteContactRepository::withConnection(Fn&& fn) {
  try {
    common::SqliteConnectionGuard conn_guard(*pool_);
    return fn(conn_guard.get());
  } catch (const std::runtime_error& e) {
    // 连接池超时 / 关闭 / 无法打开数据库
    return std::unexpected(StorageError{StorageErrc::storage, e.what()});
  }
}

std::expected<void, StorageError> SqliteContactRepository::ensureSchema() {
  const char* ddl =
    "CREATE TABLE IF NOT EXISTS contacts ("
    "  id           TEXT PRIMARY KEY NOT NULL,"
    "  name         TEXT NOT NULL,"
    "  phone_number TEXT NOT NULL,"
    "  email        TEXT,"
    "  created_at   INTEGER NOT NULL,"
    "  updated_at   INTEGER"
    ");"
    "CREATE UNIQUE INDEX IF NOT EXISTS ix_contacts_phone_number ON contacts(phone_number);";

  return withConnection<void>([ddl](sqlite3* db) -> std::expected<void, StorageError> {
    char* err = nullptr;
    int rc = sqlite3_exec(db, ddl, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
      std::string message = "create schema: " + std::string(err ? err : sqlite3_errmsg(db));
      sqlite3_free(err);
      return std::unexpected(StorageError{StorageErrc::storage, message});
    }
    return {};
  });
}

std::expected<std::vector<Contact>, StorageError> SqliteContactRepository::getAll() {
  return executeSelectQuery(std::string(kSelectColumns) + " ORDER BY rowid", {});
}

std::expected<std::optional<Contact>, StorageError> SqliteContactRepository::getById(const std::string& id) {
  auto rows = executeSelectQuery(std::string(kSelectColumns) + " WHERE id = ?", {id});
  if (!rows) {
    return std::unexpected(rows.error());
  }
  if (rows->empty()) {
    return std::optional<Contact>{};
  }
  return std::optional<Contact>{std::move(rows->front())};
}

std::expected<Contact, StorageError> SqliteContactRepository::add(const Contact& contact) {
  const std::string query =
    "INSERT INTO contacts (id, name, phone_number, email, created_at, updated_at) "
    "VALUES (?, ?, ?, ?, ?, ?)";

  return withConnection<Contact>([&](sqlite3* db) -> std::expected<Contact, StorageError> {
    SqliteStatement stmt(db, query);
    if (stmt.prepareResult() != SQLITE_OK) {
      return std::unexpected(makeError(db, stmt.prepareResult(), "prepare insert"));
    }

    stmt.bindText(1, contact.id());
    stmt.bindText(2, contact.name());
    stmt.bindText(3, contact.phone_number());
    stmt.bindText(4, contact.email());
    stmt.bindInt64(5, common::toUnixMillis(contact.created_at()));
    stmt.bindInt64(6, toOptionalMillis(contact.updated_at()));

    int rc = stmt.step();
    if (rc != SQLITE_DONE) {
      return std::unexpected(makeError(db, rc, "insert contact " + contact.id()));
    }
    return contact;
  });
}

std::expected<Contact, StorageError> SqliteContactRepository::update(const Contact& contact) {
  // created_at 不随更新改变
  const std::string query =
    "UPDATE contacts SET name = ?, phone_number = ?, email = ?, updated_at = ? WHERE id = ?";

  return withConnection<Contact>([&](sqlite3* db) -> std::expected<Contact, StorageError> {
    SqliteStatement stmt(db, query);
    if (stmt.prepareResult() != SQLITE_OK) {
      return std::unexpected(makeError(db, stmt.prepareResult(), "prepare update"));
    }

    stmt.bindText(1, contact.name());
    stmt.bindText(2, contact.phone_number());
    stmt.bindText(3, contact.email());
    stmt.bindInt64(4, toOptionalMillis(contact.updated_at()));
    stmt.bindText(5, contact.id());

    int rc = stmt.step();
    if (rc != SQLITE_DONE) {
      return std::unexpected(makeError(db, rc, "update contact " + contact.id()));
    }
    if (sqlite3_changes(db) == 0) {
      return std::unexpected(StorageError{StorageErrc::not_found, "no contact with id " + contact.id()});
    }
    return contact;
  });
}

std::expected<void, StorageError> SqliteContactRepository::remove(const std::string& id) {
  const std::string query = "DELETE FROM contacts WHERE id = ?";

  return withConnection<void>([&](sqlite3* db) -> std::expected<void, StorageError> {
    SqliteStatement stmt(db, query);
    if (stmt.prepareResult() != SQLITE_OK) {
      return std::unexpected(makeError(db, stmt.prepareResult(), "prepare delete"));
    }

    stmt.bindText(1, id);

    int rc = stmt.step();
    if (rc != SQLITE_DONE) {
      return std::unexpected(makeError(db, rc, "delete contact " + id));
    }
    if (sqlite3_changes(db) == 0) {
      return std::unexpected(StorageError{StorageErrc::not_found, "no contact with id " + id});
    }
    return {};
  });
}

std::expected<std::vector<Contact>, StorageError> SqliteContactRepository::search(const ContactQuery& query) {
  std::string sql = std::string(kSelectColumns) + " WHERE 1 = 1";
  std::vector<std::string> params;

  if (query.term && !query.term->empty()) {
    // instr 区分大小写, 与 LIKE 不同
    sql += " AND (instr(name, ?) > 0 OR instr(phone_number, ?) > 0)";
    params.push_back(*query.term);
    params.push_back(*query.term);
  }
  if (query.phone_number) {
    sql += " AND phone_number = ?";
    params.push_back(*query.phone_number);
  }
  if (query.exclude_id) {
    sql += " AND id <> ?";
    params.push_back(*query.exclude_id);
  }
  sql += " ORDER BY rowid";

  return executeSelectQuery(sql, params);
}

std::expected<std::vector<Contact>, StorageError> SqliteContactRepository::executeSelectQuery(
  const std::string& sql, const std::vector<std::string>& params) {

  return withConnection<std::vector<Contact>>(
    [&](sqlite3* db) -> std::expected<std::vector<Contact>, StorageError> {
      SqliteStatement stmt(db, sql);
      if (stmt.prepareResult() != SQLITE_OK) {
        return std::unexpected(makeError(db, stmt.prepareResult(), "prepare select"));
      }

      for (size_t i = 0; i < params.size(); ++i) {
        stmt.bindText(static_cast<int>(i + 1), params[i]);
      }

      std::vector<Contact> contacts;
      int rc;
      while ((rc = stmt.step()) == SQLITE_ROW) {
        contacts.push_back(readContact(stmt));
      }
      if (rc != SQLITE_DONE) {
        return std::unexpected(makeError(db, rc, "select contacts"));
      }
      return contacts;
    });
}

}
