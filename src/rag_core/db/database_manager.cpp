#include "rag_core/db/database_manager.hpp"

#include <stdexcept>

namespace rag_core {

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::initialize(const std::filesystem::path &db_path,
                                 const std::string &db_key,
                                 int pool_size) {
  if (is_initialized_) {
    return;
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // 1. One-time schema setup before creating the pool
  setup_schema(db_path, db_key);

  // 2. Connection pool for the store to use
  pool_ = std::make_unique<ConnectionPool>(db_path.string(), db_key, pool_size);

  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  pool_.reset();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has not been initialized.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::filesystem::path &db_path,
                                   const std::string &db_key) {
  // Single-use connection so table creation happens once, outside the pool
  sqlite::database db(db_path.string());
  configure_connection(db, db_key);

  // Column names and types are the on-disk contract of persisted stores
  db << R"(
      CREATE TABLE IF NOT EXISTS vectors (
          id TEXT PRIMARY KEY,
          document TEXT,
          embedding BLOB NOT NULL,
          metadata TEXT DEFAULT NULL
      )
    )";
}

}  // namespace rag_core
