#pragma once

#include <filesystem>
#include <string>

#include "internal/state/state_store.hpp"

namespace mvtracker::state {

/*
  State as a pretty-printed JSON object:

    {
      "ive": { "video_id": "abc123", "last_view": 123456, "title": "..." }
    }

  Encoded through google.protobuf.Struct. Save() writes a sibling
  temporary file and renames it over the target.
*/
class JsonFileStateStore final : public StateStore {
 public:
  explicit JsonFileStateStore(std::filesystem::path path);

  StateMap Load() override;

  void Save(const StateMap& state) override;

  static StateMap    Decode(const std::string& json);
  static std::string Encode(const StateMap& state);

 private:
  std::filesystem::path path_;
};

} // namespace mvtracker::state
