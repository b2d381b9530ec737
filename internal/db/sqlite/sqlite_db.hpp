#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace jobguard::db::sqlite {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

/*
  Thin RAII wrapper around one shared sqlite3* connection.

  A connection can only run one transaction at a time, so transactions
  on the same SqliteDB are serialized through LockForTransaction().
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control).
  // Throws util::TransactionConflict on SQLITE_BUSY / SQLITE_LOCKED.
  void Exec(const std::string& sql);

  StatementPtr Prepare(const char* sql);

  // Held by SqliteTransaction for its whole lifetime.
  std::unique_lock<std::mutex> LockForTransaction() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

  const std::string& Path() const {
    return path_;
  }

 private:
  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace jobguard::db::sqlite
