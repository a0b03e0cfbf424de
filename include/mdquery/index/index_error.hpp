#pragma once

#include <exception>
#include <string>

#include <sqlite_modern_cpp.h>

namespace mdquery {

enum class IndexErrorKind {
  // Rejected before the database was touched.
  InvalidArgument,
  // Another item already has the path.
  PathConflict,
  Busy,
  ReadOnly,
  // I/O error, full disk or unopenable database file.
  Storage,
  Schema,
  Other
};

std::string to_string(IndexErrorKind kind);

class IndexBackendError : public std::exception {
 public:
  IndexBackendError(IndexErrorKind kind, const std::string& message)
      : kind_(kind), message_(message) {}

  explicit IndexBackendError(const std::string& message)
      : IndexBackendError(IndexErrorKind::Other, message) {}

  IndexErrorKind kind() const { return kind_; }

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  IndexErrorKind kind_;
  std::string message_;
};

IndexErrorKind classify_sqlite_error(const sqlite::sqlite_exception& e);

// "upsert /a.txt failed: (path_conflict) UNIQUE constraint failed: items.path [code=19, xcode=2067]"
IndexBackendError make_index_error(const std::string& operation,
                                   const sqlite::sqlite_exception& e);

/**
 * @class WriteTransaction
 * @brief Holds the index write lock for one mutation; rolls back unless committed.
 *
 * Starts with BEGIN IMMEDIATE so a concurrent writer fails fast with
 * IndexErrorKind::Busy instead of deadlocking on lock upgrade.
 */
class WriteTransaction {
 public:
  WriteTransaction(sqlite::database& db, std::string operation);
  ~WriteTransaction() noexcept;

  WriteTransaction(const WriteTransaction&) = delete;
  WriteTransaction& operator=(const WriteTransaction&) = delete;

  void commit();

 private:
  sqlite::database& db_;
  std::string operation_;
  bool open_;
};

}  // namespace mdquery
