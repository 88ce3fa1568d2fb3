#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

#include "rag_core/errors.hpp"

namespace rag_core {

enum class DbErrorKind {
  BusyOrLocked,
  Constraint,
  Readonly,
  Io,
  CantOpen,
  Full,
  NotADb,
  Schema,
  Generic
};

inline DbErrorKind classify_sqlite_code(int primary_code) {
  switch (primary_code) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbErrorKind::BusyOrLocked;
    case SQLITE_CONSTRAINT:
      return DbErrorKind::Constraint;
    case SQLITE_READONLY:
      return DbErrorKind::Readonly;
    case SQLITE_IOERR:
      return DbErrorKind::Io;
    case SQLITE_CANTOPEN:
      return DbErrorKind::CantOpen;
    case SQLITE_FULL:
      return DbErrorKind::Full;
    case SQLITE_NOTADB:
      return DbErrorKind::NotADb;
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return DbErrorKind::Schema;
    default:
      return DbErrorKind::Generic;
  }
}

inline std::string kind_to_string(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::BusyOrLocked:
      return "busy_or_locked";
    case DbErrorKind::Constraint:
      return "constraint";
    case DbErrorKind::Readonly:
      return "readonly";
    case DbErrorKind::Io:
      return "io";
    case DbErrorKind::CantOpen:
      return "cantopen";
    case DbErrorKind::Full:
      return "full";
    case DbErrorKind::NotADb:
      return "notadb";
    case DbErrorKind::Schema:
      return "schema";
    default:
      return "generic";
  }
}

inline std::string format_db_error(const std::string &operation,
                                   const sqlite::sqlite_exception &e) {
  const int code = e.get_code();
  const int xcode = e.get_extended_code();
  const DbErrorKind kind = classify_sqlite_code(code);
  std::string msg = operation + " failed: (" + kind_to_string(kind) + ") " + e.errstr();
  if (!e.get_sql().empty()) {
    msg += " in \"" + e.get_sql() + "\"";
  }
  msg += " [code=" + std::to_string(code) + ", xcode=" + std::to_string(xcode) + "]";
  return msg;
}

// Hint shown after the SQLite message for the failures a user can act on
inline std::string kind_hint(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::NotADb:
      return "the database key is wrong or the file is not a vector store";
    case DbErrorKind::BusyOrLocked:
      return "another writer holds the database";
    case DbErrorKind::Readonly:
    case DbErrorKind::CantOpen:
      return "check the permissions of the database path";
    case DbErrorKind::Full:
      return "the disk is full";
    default:
      return "";
  }
}

inline VectorStoreError to_vector_store_error(const std::string &operation,
                                              const sqlite::sqlite_exception &e) {
  const DbErrorKind kind = classify_sqlite_code(e.get_code());
  std::string msg = format_db_error(operation, e);
  const std::string hint = kind_hint(kind);
  if (!hint.empty()) {
    msg += ": " + hint;
  }
  return VectorStoreError(msg, kind == DbErrorKind::BusyOrLocked);
}

}  // namespace rag_core
