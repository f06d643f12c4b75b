#pragma once

// std
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace contact_service {

enum class StorageErrc {
  not_found,   // update/remove on an id that is not stored
  conflict,    // unique constraint rejected the write
  storage      // anything else the driver reported
};

struct StorageError {
  StorageErrc code;
  std::string message;
};

// Generic persistence gateway. Each mutating call commits on its own.
template <typename Entity, typename Query>
class Repository {
public:
  virtual ~Repository() = default;

  virtual std::expected<std::vector<Entity>, StorageError> getAll() = 0;
  virtual std::expected<std::optional<Entity>, StorageError> getById(const std::string& id) = 0;
  virtual std::expected<Entity, StorageError> add(const Entity& entity) = 0;
  virtual std::expected<Entity, StorageError> update(const Entity& entity) = 0;
  virtual std::expected<void, StorageError> remove(const std::string& id) = 0;
  virtual std::expected<std::vector<Entity>, StorageError> search(const Query& query) = 0;
};

} // namespace contact_service
