#include "credentials.hpp"

#include <cstdlib>

#include "internal/util/errors.hpp"

namespace mvtracker::config {

namespace {

std::string RequireEnv(const char* name) {
  const char* value = std::getenv(name);
  if (!value || *value == '\0') {
    throw util::ConfigError(std::string("environment variable ") + name + " is not set");
  }
  return value;
}

} // namespace

Credentials LoadCredentialsFromEnv() {
  Credentials credentials;
  credentials.catalog_api_key = RequireEnv(kCatalogApiKeyEnv);
  credentials.sink_api_key    = RequireEnv(kSinkApiKeyEnv);
  return credentials;
}

} // namespace mvtracker::config
