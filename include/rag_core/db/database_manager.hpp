#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "rag_core/db/connection_pool.hpp"

namespace rag_core {

/**
 * Owns the connection pool of one database file and creates the `vectors` table.
 * Each persisted store holds its own manager, so two stores can point at different files.
 */
class DatabaseManager {
 public:
  DatabaseManager() = default;
  ~DatabaseManager();

  // No-op when already initialized. Creates the parent directory and the schema.
  void initialize(const std::filesystem::path &db_path, const std::string &db_key, int pool_size);

  // These methods are used by the PooledConnection guard
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();

  bool is_initialized() const {
    return is_initialized_;
  }

  DatabaseManager(const DatabaseManager &) = delete;
  DatabaseManager &operator=(const DatabaseManager &) = delete;

 private:
  void setup_schema(const std::filesystem::path &db_path, const std::string &db_key);

  std::unique_ptr<ConnectionPool> pool_;
  bool is_initialized_ = false;
};

}  // namespace rag_core
