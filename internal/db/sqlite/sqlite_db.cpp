#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace jobguard::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc == SQLITE_OK) return;

  std::string msg = std::string(what) + ": " + sqlite3_errmsg(db);
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    throw util::TransactionConflict(msg);
  }
  throw std::runtime_error(msg);
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
      throw util::TransactionConflict(msg);
    }
    throw std::runtime_error(msg);
  }
}

StatementPtr SqliteDB::Prepare(const char* sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return StatementPtr(stmt, &sqlite3_finalize);
}

void SqliteDB::Configure() {
  // WAL lets other processes read while this one writes
  Exec("PRAGMA journal_mode=WAL;");

  // checkpoint files are fsynced separately; the ledger rows are small
  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks held by other processes instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace jobguard::db::sqlite
