#pragma once

// stressrig/metrics.hpp - Live stress metrics.
//
// StressMetricsExporter is created per invocation and fed every output line
// of the running stress tool. Interval lines ("total, ...") update gauges in
// a MetricsRegistry, labelled so concurrent invocations never overwrite each
// other:
//   name   stressrig_cql_stress_cassandra_stress_<operation>_gauge
//   labels instance, loader_idx, cpu_idx, type
//
// Interval line columns (comma separated, whitespace padded):
//   0 "total"  1 total ops  2 op/s  3 pk/s  4 row/s  5 mean  6 med
//   7 .95      8 .99        9 .999  10 max  11 time  12 stderr  13 errors

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "stressrig/types.hpp"

namespace stressrig {

using MetricLabels = std::map<std::string, std::string>;

struct GaugeSample {
  std::string name;
  MetricLabels labels;
  double value{0.0};
};

// Thread-safe gauge store.
class MetricsRegistry {
 public:
  void set_gauge(const std::string& name, const MetricLabels& labels, double value);
  std::optional<double> gauge(const std::string& name, const MetricLabels& labels) const;
  std::vector<GaugeSample> snapshot() const;
  void clear();

  // Prometheus text exposition format, one sample per line.
  std::string to_text() const;

 private:
  mutable std::mutex mu_;
  std::map<std::pair<std::string, MetricLabels>, double> gauges_;
};

MetricsRegistry& global_metrics();

class StressMetricsExporter {
 public:
  StressMetricsExporter(std::string instance_name, MetricsRegistry& metrics,
                        std::string stress_operation, std::string log_file,
                        uint32_t loader_idx, uint32_t cpu_idx);

  StressMetricsExporter(const StressMetricsExporter&) = delete;
  StressMetricsExporter& operator=(const StressMetricsExporter&) = delete;

  void consume_line(const std::string& line);

  const std::string& gauge_name() const { return gauge_name_; }
  const std::string& log_file() const { return log_file_; }
  uint64_t intervals_seen() const { return intervals_seen_; }

  MetricLabels labels_for(const std::string& type) const;

 private:
  std::string instance_name_;
  MetricsRegistry& metrics_;
  std::string stress_operation_;
  std::string log_file_;
  uint32_t loader_idx_;
  uint32_t cpu_idx_;
  std::string gauge_name_;
  uint64_t intervals_seen_{0};
};

// Parses the last "Results:" block of the stress tool output.
StressSummary parse_stress_summary(const std::string& output);

}  // namespace stressrig
