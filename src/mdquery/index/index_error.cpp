#include "mdquery/index/index_error.hpp"

#include <iostream>
#include <utility>

#include <sqlite3.h>

namespace mdquery {

std::string to_string(IndexErrorKind kind) {
  switch (kind) {
    case IndexErrorKind::InvalidArgument: return "invalid_argument";
    case IndexErrorKind::PathConflict: return "path_conflict";
    case IndexErrorKind::Busy: return "busy";
    case IndexErrorKind::ReadOnly: return "readonly";
    case IndexErrorKind::Storage: return "storage";
    case IndexErrorKind::Schema: return "schema";
    case IndexErrorKind::Other: return "other";
  }
  return "other";
}

IndexErrorKind classify_sqlite_error(const sqlite::sqlite_exception& e) {
  switch (e.get_code()) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return IndexErrorKind::Busy;
    case SQLITE_CONSTRAINT:
      // items.path is the only unique column.
      return e.get_extended_code() == SQLITE_CONSTRAINT_UNIQUE ? IndexErrorKind::PathConflict
                                                               : IndexErrorKind::Other;
    case SQLITE_READONLY:
      return IndexErrorKind::ReadOnly;
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
    case SQLITE_NOTADB:
    case SQLITE_CORRUPT:
      return IndexErrorKind::Storage;
    case SQLITE_SCHEMA:
    case SQLITE_ERROR:
      return IndexErrorKind::Schema;
    default:
      return IndexErrorKind::Other;
  }
}

IndexBackendError make_index_error(const std::string& operation,
                                   const sqlite::sqlite_exception& e) {
  const IndexErrorKind kind = classify_sqlite_error(e);
  std::string message = operation + " failed: (" + to_string(kind) + ") " + e.errstr();
  if (!e.get_sql().empty()) {
    message += " in \"" + e.get_sql() + "\"";
  }
  message += " [code=" + std::to_string(e.get_code()) +
             ", xcode=" + std::to_string(e.get_extended_code()) + "]";
  return IndexBackendError(kind, message);
}

WriteTransaction::WriteTransaction(sqlite::database& db, std::string operation)
    : db_(db), operation_(std::move(operation)), open_(false) {
  db_ << "BEGIN IMMEDIATE;";
  open_ = true;
}

WriteTransaction::~WriteTransaction() noexcept {
  if (!open_) {
    return;
  }
  try {
    db_ << "ROLLBACK;";
  } catch (const sqlite::sqlite_exception& e) {
    std::cerr << "[IndexBackend] ERROR rolling back " << operation_ << ": " << e.errstr()
              << std::endl;
  }
}

void WriteTransaction::commit() {
  if (open_) {
    db_ << "COMMIT;";
    open_ = false;
  }
}

}  // namespace mdquery
