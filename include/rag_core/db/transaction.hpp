#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>
#include <string>

namespace rag_core {

/**
 * @class WriteTransaction
 * @brief Scope guard around one batch write to the `vectors` table.
 *
 * Starts with BEGIN IMMEDIATE so the write lock is taken before the first row is touched and
 * a second writer waits on busy_timeout instead of failing halfway through the batch. Every
 * row of the batch is committed together or rolled back together when the guard leaves scope
 * without commit().
 */
class WriteTransaction {
 public:
  WriteTransaction(sqlite::database &db, std::string operation)
      : db_(db), operation_(std::move(operation)) {
    db_ << "BEGIN IMMEDIATE;";
    open_ = true;
  }

  WriteTransaction(const WriteTransaction &) = delete;
  WriteTransaction &operator=(const WriteTransaction &) = delete;

  void commit() {
    if (!open_) {
      return;
    }
    db_ << "COMMIT;";
    open_ = false;
  }

  bool is_open() const {
    return open_;
  }

  ~WriteTransaction() noexcept {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
      std::cerr << "Warning: " << operation_ << " rolled back" << std::endl;
    } catch (const sqlite::sqlite_exception &e) {
      // The exception that triggered the rollback is already on its way to the caller
      std::cerr << "Warning: rollback of " << operation_ << " failed: " << e.get_code() << " "
                << e.what() << std::endl;
    }
  }

 private:
  sqlite::database &db_;
  std::string operation_;
  bool open_ = false;
};

}  // namespace rag_core
