#pragma once
#include <sqlite_modern_cpp.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace rag_core {

// Keys the connection when db_key is non-empty, verifies it can read, and applies the
// pragmas every connection shares.
void configure_connection(sqlite::database &db, const std::string &db_key);

class ConnectionPool {
 public:
  ConnectionPool(const std::string &db_path, const std::string &db_key, int pool_size);

  // Blocks until a connection is free. Throws once the pool is shut down.
  std::unique_ptr<sqlite::database> get_connection();

  // Returns a connection to the pool.
  void return_connection(std::unique_ptr<sqlite::database> conn);
  void shutdown();

 private:
  bool shutting_down_ = false;
  std::string db_path_;
  std::string db_key_;
  std::queue<std::unique_ptr<sqlite::database>> pool_;
  std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace rag_core
