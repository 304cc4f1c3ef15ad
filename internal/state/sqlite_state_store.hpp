#pragma once

#include <memory>
#include <string>

#include "internal/state/state_store.hpp"

namespace mvtracker::state {

class SqliteDB;

/*
  State in a single SQLite table:

    group_state(group_id TEXT PRIMARY KEY, video_id TEXT NOT NULL,
                last_view INTEGER NOT NULL, title TEXT)

  Save() replaces every row inside one transaction.
*/
class SqliteStateStore final : public StateStore {
 public:
  explicit SqliteStateStore(std::string path);
  ~SqliteStateStore() override;

  StateMap Load() override;

  void Save(const StateMap& state) override;

 private:
  std::unique_ptr<SqliteDB> db_;
};

} // namespace mvtracker::state
