#include "curl_http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <sstream>

#include "internal/util/errors.hpp"

namespace mvtracker::http {

namespace {

void EnsureGlobalInit() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw util::TransportError("curl_global_init failed");
    }
  });
}

size_t WriteToOStringStream(void* buffer, size_t size, size_t nmemb, void* ctx) {
  auto& oss = *reinterpret_cast<std::ostringstream*>(ctx);
  oss.write(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(size * nmemb));
  return size * nmemb;
}

struct EasyDeleter {
  void operator()(CURL* curl) const {
    curl_easy_cleanup(curl);
  }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

std::string Escape(CURL* curl, const std::string& value) {
  char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
  if (!escaped) {
    throw util::TransportError("curl_easy_escape failed");
  }
  std::string out(escaped);
  curl_free(escaped);
  return out;
}

} // namespace

CurlHttpClient::CurlHttpClient(std::chrono::seconds timeout) : timeout_(timeout) {
  EnsureGlobalInit();
}

std::string CurlHttpClient::BuildUrl(const std::string& url, const QueryParams& params) {
  if (params.empty()) {
    return url;
  }

  EnsureGlobalInit();
  std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
  if (!curl) {
    throw util::TransportError("curl_easy_init failed");
  }

  std::string out = url;
  out.push_back(url.find('?') == std::string::npos ? '?' : '&');
  bool first = true;
  for (const auto& [key, value] : params) {
    if (!first) out.push_back('&');
    first = false;
    out += Escape(curl.get(), key);
    out.push_back('=');
    out += Escape(curl.get(), value);
  }
  return out;
}

HttpResponse CurlHttpClient::Get(const std::string& url, const QueryParams& params, const Headers& headers) {
  return Perform(BuildUrl(url, params), nullptr, headers);
}

HttpResponse CurlHttpClient::Post(const std::string& url, const std::string& body, const Headers& headers) {
  return Perform(url, &body, headers);
}

HttpResponse CurlHttpClient::Perform(const std::string& url, const std::string* post_body, const Headers& headers) {
  std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
  if (!curl) {
    throw util::TransportError("curl_easy_init failed");
  }

  std::unique_ptr<curl_slist, SlistDeleter> header_list;
  for (const auto& [name, value] : headers) {
    curl_slist* appended = curl_slist_append(header_list.get(), (name + ": " + value).c_str());
    if (!appended) {
      throw util::TransportError("curl_slist_append failed");
    }
    header_list.release();
    header_list.reset(appended);
  }

  std::ostringstream body;
  char               error_buffer[CURL_ERROR_SIZE] = {0};

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteToOStringStream);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  if (header_list) {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
  }
  if (post_body) {
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, post_body->c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
  }

  const CURLcode rc = curl_easy_perform(curl.get());
  if (rc != CURLE_OK) {
    const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(rc);
    throw util::TransportError("HTTP request failed: " + detail);
  }

  HttpResponse response;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  response.body = body.str();
  return response;
}

} // namespace mvtracker::http
