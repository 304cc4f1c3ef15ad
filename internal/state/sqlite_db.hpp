#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace mvtracker::state {

/*
  Thin RAII wrapper around sqlite3*.
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

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement, finalized when the returned handle goes away
  std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)> Prepare(const std::string& sql);

  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless Commit()
  was called.
*/
class SqliteTransaction {
 public:
  explicit SqliteTransaction(SqliteDB& db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit();

 private:
  SqliteDB& db_;
  bool      committed_ = false;
};

} // namespace mvtracker::state
