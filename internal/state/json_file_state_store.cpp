#include "json_file_state_store.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include "internal/util/errors.hpp"

namespace mvtracker::state {

using google::protobuf::Struct;
using google::protobuf::Value;
using mvtracker::util::StateError;

namespace {

// Largest count a JSON number carries exactly (2^53).
constexpr double kMaxExactViewCount = 9007199254740992.0;

int64_t ReadViewCount(const std::string& group_id, const Value& value) {
  switch (value.kind_case()) {
    case Value::kNumberValue: {
      const double number = value.number_value();
      if (!(number >= 0 && number <= kMaxExactViewCount) || std::floor(number) != number) {
        throw StateError("state entry '" + group_id + "' has an invalid last_view");
      }
      return static_cast<int64_t>(number);
    }
    case Value::kStringValue: {
      const auto& text   = value.string_value();
      char*       endptr = nullptr;
      errno              = 0;
      const long long parsed = std::strtoll(text.c_str(), &endptr, 10);
      if (text.empty() || *endptr != '\0' || errno == ERANGE || parsed < 0) {
        throw StateError("state entry '" + group_id + "' has an invalid last_view");
      }
      return parsed;
    }
    case Value::kNullValue:
      return 0;
    default:
      throw StateError("state entry '" + group_id + "' has an invalid last_view");
  }
}

GroupState DecodeEntry(const std::string& group_id, const Value& value) {
  if (value.kind_case() != Value::kStructValue) {
    throw StateError("state entry '" + group_id + "' is not an object");
  }

  const auto& fields = value.struct_value().fields();

  GroupState entry;
  auto video_id = fields.find("video_id");
  if (video_id == fields.end() || video_id->second.kind_case() != Value::kStringValue || video_id->second.string_value().empty()) {
    throw StateError("state entry '" + group_id + "' has no video_id");
  }
  entry.video_id = video_id->second.string_value();

  if (auto last_view = fields.find("last_view"); last_view != fields.end()) {
    entry.last_view = ReadViewCount(group_id, last_view->second);
  }

  if (auto title = fields.find("title"); title != fields.end() && title->second.kind_case() == Value::kStringValue &&
                                          !title->second.string_value().empty()) {
    entry.title = title->second.string_value();
  }
  return entry;
}

} // namespace

JsonFileStateStore::JsonFileStateStore(std::filesystem::path path) : path_(std::move(path)) {
}

StateMap JsonFileStateStore::Decode(const std::string& json) {
  Struct root;
  auto   status = google::protobuf::util::JsonStringToMessage(json, &root);
  if (!status.ok()) {
    throw StateError("state is not a JSON object: " + std::string(status.message()));
  }

  StateMap state;
  for (const auto& [group_id, value] : root.fields()) {
    state.emplace(group_id, DecodeEntry(group_id, value));
  }
  return state;
}

std::string JsonFileStateStore::Encode(const StateMap& state) {
  Struct root;
  for (const auto& [group_id, entry] : state) {
    auto& fields = *(*root.mutable_fields())[group_id].mutable_struct_value()->mutable_fields();
    fields["video_id"].set_string_value(entry.video_id);
    // exact for any count below 2^53
    fields["last_view"].set_number_value(static_cast<double>(entry.last_view));
    if (entry.title) {
      fields["title"].set_string_value(*entry.title);
    }
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(root, &json, options);
  if (!status.ok()) {
    throw StateError("failed to encode state: " + std::string(status.message()));
  }
  return json;
}

StateMap JsonFileStateStore::Load() {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return {};
  }

  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    throw StateError("cannot open state file " + path_.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  const auto text = buffer.str();
  if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
    return {};
  }
  return Decode(text);
}

void JsonFileStateStore::Save(const StateMap& state) {
  const auto json = Encode(state);

  auto tmp_path = path_;
  tmp_path += ".tmp";

  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw StateError("cannot write state file " + tmp_path.string() + ": " + std::strerror(errno));
    }
    out << json;
    out.flush();
    if (!out) {
      throw StateError("failed writing state file " + tmp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    std::filesystem::remove(tmp_path, ec);
    throw StateError("cannot replace state file " + path_.string());
  }
}

} // namespace mvtracker::state
