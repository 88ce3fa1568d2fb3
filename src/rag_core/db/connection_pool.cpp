#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>

#include "rag_core/db/connection_pool.hpp"

#include <stdexcept>

namespace rag_core {

void configure_connection(sqlite::database &db, const std::string &db_key) {
  sqlite3 *handle = db.connection().get();
  if (!handle) {
    throw std::runtime_error("Failed to get native database handle.");
  }

  if (!db_key.empty()) {
    if (sqlite3_key(handle, db_key.c_str(), static_cast<int>(db_key.length())) != SQLITE_OK) {
      throw std::runtime_error("Failed to key database: " + std::string(sqlite3_errmsg(handle)));
    }
  }

  // Fails here, not on first use, when the key is wrong
  db << "SELECT count(*) FROM sqlite_master;";

  db << "PRAGMA foreign_keys = ON;";
  db << "PRAGMA journal_mode = WAL;";
  db << "PRAGMA busy_timeout = 5000;";
}

ConnectionPool::ConnectionPool(const std::string &db_path, const std::string &db_key, int pool_size)
    : db_path_(db_path), db_key_(db_key) {
  if (pool_size <= 0) {
    throw std::invalid_argument("Connection pool size must be positive, got " +
                                std::to_string(pool_size));
  }
  for (int i = 0; i < pool_size; ++i) {
    auto db = std::make_unique<sqlite::database>(db_path_);
    configure_connection(*db, db_key_);
    pool_.push(std::move(db));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this] { return shutting_down_ || !pool_.empty(); });

  if (shutting_down_) {
    throw std::runtime_error("Connection pool is shut down");
  }

  std::unique_ptr<sqlite::database> conn = std::move(pool_.front());
  pool_.pop();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!shutting_down_) {
    pool_.push(std::move(conn));
  }
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  std::lock_guard<std::mutex> lock(mtx_);
  shutting_down_ = true;
  while (!pool_.empty()) {
    pool_.pop();
  }
  cv_.notify_all();
}

}  // namespace rag_core
