#pragma once

#include <cstdint>
#include <string>

namespace mvtracker::sink {

struct MetricPoint {
  std::string name;
  int64_t     time = 0; // unix seconds
  double      value = 0.0;
};

/*
  Receives one named, timestamped data point per call. Throws
  util::SinkError when the point was not accepted.
*/
class MetricSink {
 public:
  virtual ~MetricSink() = default;

  virtual void Post(const MetricPoint& point) = 0;
};

} // namespace mvtracker::sink
