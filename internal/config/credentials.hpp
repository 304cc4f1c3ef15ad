#pragma once

#include <string>

namespace mvtracker::config {

inline constexpr const char* kCatalogApiKeyEnv = "YOUTUBE_API_KEY";
inline constexpr const char* kSinkApiKeyEnv    = "MACKEREL_API_KEY";

struct Credentials {
  std::string catalog_api_key;
  std::string sink_api_key;
};

// Reads both API keys from the environment. Throws util::ConfigError naming
// the first variable that is unset or empty.
Credentials LoadCredentialsFromEnv();

} // namespace mvtracker::config
