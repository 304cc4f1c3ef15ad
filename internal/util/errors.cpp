#include "errors.hpp"

namespace mvtracker::util {

const char* ToString(CatalogError::Kind kind) {
  switch (kind) {
    case CatalogError::Kind::kNotFound:
      return "not_found";
    case CatalogError::Kind::kQuotaExceeded:
      return "quota_exceeded";
    case CatalogError::Kind::kOther:
      return "other";
  }
  return "unknown";
}

} // namespace mvtracker::util
