#pragma once

#include <chrono>

#include "internal/http/http_client.hpp"

namespace mvtracker::http {

/*
  libcurl backed HttpClient. One easy handle per request; the global
  curl state is initialized once per process.
*/
class CurlHttpClient final : public HttpClient {
 public:
  explicit CurlHttpClient(std::chrono::seconds timeout);

  HttpResponse Get(const std::string& url, const QueryParams& params, const Headers& headers) override;

  HttpResponse Post(const std::string& url, const std::string& body, const Headers& headers) override;

  // Exposed for tests.
  static std::string BuildUrl(const std::string& url, const QueryParams& params);

 private:
  HttpResponse Perform(const std::string& url, const std::string* post_body, const Headers& headers);

  std::chrono::seconds timeout_;
};

} // namespace mvtracker::http
