#pragma once

#include <memory>
#include <string>

#include "internal/sink/metric_sink.hpp"

namespace mvtracker::http {
class HttpClient;
}

namespace mvtracker::sink {

struct MackerelSinkOptions {
  std::string base_url = "https://api.mackerelio.com/api/v0";
  std::string service_name;
  std::string api_key;
};

/*
  Posts service metrics to Mackerel:

    POST <base_url>/services/<service_name>/tsdb
    X-Api-Key: <api_key>
    [{"name": ..., "time": ..., "value": ...}]
*/
class MackerelSink final : public MetricSink {
 public:
  MackerelSink(MackerelSinkOptions options, std::shared_ptr<http::HttpClient> http);

  void Post(const MetricPoint& point) override;

  static std::string EncodeBody(const MetricPoint& point);

 private:
  MackerelSinkOptions               options_;
  std::shared_ptr<http::HttpClient> http_;
};

} // namespace mvtracker::sink
