#include "sqlite_db.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mvtracker::state {

using mvtracker::util::StateError;

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw StateError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw StateError("cannot open state database " + path_ + ": " + msg);
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
    throw StateError(msg);
  }
}

std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)> SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return {stmt, &sqlite3_finalize};
}

void SqliteDB::Configure() {
  // readers never see a half-applied Save
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=FULL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
}

SqliteTransaction::SqliteTransaction(SqliteDB& db) : db_(db) {
  db_.Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_.Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      MVTRACKER_LOG_ERROR("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_.Exec("COMMIT;");
  committed_ = true;
}

} // namespace mvtracker::state
