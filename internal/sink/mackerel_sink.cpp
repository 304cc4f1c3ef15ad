#include "mackerel_sink.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/http/http_client.hpp"
#include "internal/util/errors.hpp"

namespace mvtracker::sink {

using mvtracker::util::SinkError;

MackerelSink::MackerelSink(MackerelSinkOptions options, std::shared_ptr<http::HttpClient> http)
    : options_(std::move(options)), http_(std::move(http)) {
}

std::string MackerelSink::EncodeBody(const MetricPoint& point) {
  google::protobuf::ListValue body;
  auto& fields = *body.add_values()->mutable_struct_value()->mutable_fields();
  fields["name"].set_string_value(point.name);
  fields["time"].set_number_value(static_cast<double>(point.time));
  fields["value"].set_number_value(point.value);

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(body, &json);
  if (!status.ok()) {
    throw SinkError(0, "failed to encode metric " + point.name + ": " + std::string(status.message()));
  }
  return json;
}

void MackerelSink::Post(const MetricPoint& point) {
  const auto url = options_.base_url + "/services/" + options_.service_name + "/tsdb";

  http::HttpResponse response;
  try {
    response = http_->Post(url, EncodeBody(point), {{"X-Api-Key", options_.api_key}, {"Content-Type", "application/json"}});
  } catch (const util::TransportError& e) {
    throw SinkError(0, "posting metric " + point.name + " failed: " + e.what());
  }

  if (!response.Ok()) {
    throw SinkError(response.status,
                    "posting metric " + point.name + " failed (status=" + std::to_string(response.status) + "): " + response.body);
  }
}

} // namespace mvtracker::sink
