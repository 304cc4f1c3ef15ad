#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace mvtracker::http {

using QueryParams = std::vector<std::pair<std::string, std::string>>;
using Headers     = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
  long        status = 0;
  std::string body;

  bool Ok() const {
    return status >= 200 && status < 300;
  }
};

/*
  Synchronous HTTP transport.

  Non-2xx statuses are returned to the caller as-is. Connection failures
  and timeouts throw util::TransportError.
*/
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse Get(const std::string& url, const QueryParams& params, const Headers& headers) = 0;

  virtual HttpResponse Post(const std::string& url, const std::string& body, const Headers& headers) = 0;
};

} // namespace mvtracker::http
