#pragma once

#include <stdexcept>
#include <string>

namespace mvtracker::util {

/*
  Central error types.

  Only QuotaExceeded escalates to a whole-run abort; the orchestrator
  catches every other CatalogError and SinkError at the group boundary.
*/

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CatalogError : public std::runtime_error {
 public:
  enum class Kind {
    kNotFound,
    kQuotaExceeded,
    kOther,
  };

  CatalogError(Kind kind, long status, std::string reason, const std::string& msg)
      : std::runtime_error(msg), kind_(kind), status_(status), reason_(std::move(reason)) {
  }

  Kind kind() const {
    return kind_;
  }

  // HTTP status, 0 when the request never produced a response.
  long status() const {
    return status_;
  }

  const std::string& reason() const {
    return reason_;
  }

 private:
  Kind        kind_;
  long        status_;
  std::string reason_;
};

class QuotaExceeded final : public CatalogError {
 public:
  QuotaExceeded(long status, std::string reason, const std::string& msg)
      : CatalogError(Kind::kQuotaExceeded, status, std::move(reason), msg) {
  }
};

class SinkError : public std::runtime_error {
 public:
  SinkError(long status, const std::string& msg) : std::runtime_error(msg), status_(status) {
  }

  long status() const {
    return status_;
  }

 private:
  long status_;
};

class StateError : public std::runtime_error {
 public:
  explicit StateError(const std::string& msg) : std::runtime_error(msg) {
  }
};

const char* ToString(CatalogError::Kind kind);

} // namespace mvtracker::util
