#include "sqlite_state_store.hpp"

#include "internal/state/sqlite_db.hpp"
#include "internal/util/errors.hpp"

namespace mvtracker::state {

using mvtracker::util::StateError;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

} // namespace

SqliteStateStore::SqliteStateStore(std::string path) : db_(std::make_unique<SqliteDB>(std::move(path))) {
  db_->Exec(
      "CREATE TABLE IF NOT EXISTS group_state ("
      "group_id TEXT PRIMARY KEY, video_id TEXT NOT NULL, last_view INTEGER NOT NULL, title TEXT);");
}

SqliteStateStore::~SqliteStateStore() = default;

StateMap SqliteStateStore::Load() {
  auto st = db_->Prepare("SELECT group_id, video_id, last_view, title FROM group_state;");

  StateMap state;
  int      rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    GroupState entry;
    entry.video_id  = ColText(st.get(), 1);
    entry.last_view = sqlite3_column_int64(st.get(), 2);
    if (sqlite3_column_type(st.get(), 3) != SQLITE_NULL) {
      entry.title = ColText(st.get(), 3);
    }
    state.emplace(ColText(st.get(), 0), std::move(entry));
  }
  if (rc != SQLITE_DONE) {
    throw StateError(std::string("sqlite load failed: ") + sqlite3_errmsg(db_->Handle()));
  }
  return state;
}

void SqliteStateStore::Save(const StateMap& state) {
  SqliteTransaction tx(*db_);

  db_->Exec("DELETE FROM group_state;");

  auto st = db_->Prepare("INSERT INTO group_state(group_id, video_id, last_view, title) VALUES(?,?,?,?);");
  for (const auto& [group_id, entry] : state) {
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());

    BindText(st.get(), 1, group_id);
    BindText(st.get(), 2, entry.video_id);
    sqlite3_bind_int64(st.get(), 3, static_cast<sqlite3_int64>(entry.last_view));
    if (entry.title) {
      BindText(st.get(), 4, *entry.title);
    } else {
      sqlite3_bind_null(st.get(), 4);
    }

    if (sqlite3_step(st.get()) != SQLITE_DONE) {
      throw StateError(std::string("sqlite save failed: ") + sqlite3_errmsg(db_->Handle()));
    }
  }
  st.reset();

  tx.Commit();
}

} // namespace mvtracker::state
