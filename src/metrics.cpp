#include "stressrig/metrics.hpp"

#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace stressrig {

namespace {

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r");
  if (b == std::string::npos) return "";
  const auto e = s.find_last_not_of(" \t\r");
  return s.substr(b, e - b + 1);
}

std::optional<double> parse_number(const std::string& token) {
  std::string digits;
  for (char c : token) {
    if (c != ',') digits += c;
  }
  if (digits.empty()) return std::nullopt;
  char* end = nullptr;
  const double v = std::strtod(digits.c_str(), &end);
  if (end == digits.c_str()) return std::nullopt;
  return v;
}

// First whitespace-delimited token after the ':' separator.
std::string first_token(const std::string& value) {
  std::istringstream in(value);
  std::string tok;
  in >> tok;
  return tok;
}

struct IntervalColumn {
  const char* type;
  size_t index;
};

constexpr IntervalColumn kIntervalColumns[] = {
    {"op_rate", 2},     {"lat_mean", 5},     {"lat_med", 6}, {"lat_perc_95", 7},
    {"lat_perc_99", 8}, {"lat_perc_999", 9}, {"lat_max", 10}, {"errors", 13},
};

}  // namespace

// ---------------------------------------------------------------------------
// MetricsRegistry
// ---------------------------------------------------------------------------

void MetricsRegistry::set_gauge(const std::string& name, const MetricLabels& labels,
                                double value) {
  std::lock_guard<std::mutex> lk(mu_);
  gauges_[{name, labels}] = value;
}

std::optional<double> MetricsRegistry::gauge(const std::string& name,
                                             const MetricLabels& labels) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = gauges_.find({name, labels});
  if (it == gauges_.end()) return std::nullopt;
  return it->second;
}

std::vector<GaugeSample> MetricsRegistry::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<GaugeSample> out;
  out.reserve(gauges_.size());
  for (const auto& [key, value] : gauges_) out.push_back({key.first, key.second, value});
  return out;
}

void MetricsRegistry::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  gauges_.clear();
}

namespace {

// Prometheus text format: backslash, double quote and newline are escaped.
std::string escape_label_value(const std::string& v) {
  std::string out;
  out.reserve(v.size());
  for (char c : v) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"': out += "\\\""; break;
      case '\n': out += "\\n"; break;
      default: out += c;
    }
  }
  return out;
}

}  // namespace

std::string MetricsRegistry::to_text() const {
  std::string out;
  char buf[64];
  for (const auto& s : snapshot()) {
    out += s.name;
    if (!s.labels.empty()) {
      out += '{';
      bool first = true;
      for (const auto& [k, v] : s.labels) {
        if (!first) out += ',';
        first = false;
        out += k + "=\"" + escape_label_value(v) + "\"";
      }
      out += '}';
    }
    std::snprintf(buf, sizeof(buf), " %.6g\n", s.value);
    out += buf;
  }
  return out;
}

MetricsRegistry& global_metrics() {
  static MetricsRegistry inst;
  return inst;
}

// ---------------------------------------------------------------------------
// StressMetricsExporter
// ---------------------------------------------------------------------------

StressMetricsExporter::StressMetricsExporter(std::string instance_name, MetricsRegistry& metrics,
                                             std::string stress_operation, std::string log_file,
                                             uint32_t loader_idx, uint32_t cpu_idx)
    : instance_name_(std::move(instance_name)),
      metrics_(metrics),
      stress_operation_(std::move(stress_operation)),
      log_file_(std::move(log_file)),
      loader_idx_(loader_idx),
      cpu_idx_(cpu_idx),
      gauge_name_("stressrig_cql_stress_cassandra_stress_" + stress_operation_ + "_gauge") {}

MetricLabels StressMetricsExporter::labels_for(const std::string& type) const {
  return {{"instance", instance_name_},
          {"loader_idx", std::to_string(loader_idx_)},
          {"cpu_idx", std::to_string(cpu_idx_)},
          {"type", type}};
}

void StressMetricsExporter::consume_line(const std::string& line) {
  if (line.rfind("total,", 0) != 0) return;

  std::vector<std::string> cols;
  std::string cell;
  std::istringstream in(line);
  while (std::getline(in, cell, ',')) cols.push_back(trim(cell));

  bool any = false;
  for (const auto& c : kIntervalColumns) {
    if (c.index >= cols.size()) continue;
    if (auto v = parse_number(cols[c.index])) {
      metrics_.set_gauge(gauge_name_, labels_for(c.type), *v);
      any = true;
    }
  }
  if (any) ++intervals_seen_;
}

// ---------------------------------------------------------------------------
// Summary parsing
// ---------------------------------------------------------------------------

StressSummary parse_stress_summary(const std::string& output) {
  StressSummary summary;
  const auto pos = output.rfind("Results:");
  if (pos == std::string::npos) return summary;

  std::istringstream in(output.substr(pos + 8));
  std::string line;
  while (std::getline(in, line)) {
    const auto colon = line.find(':');
    if (colon == std::string::npos) continue;
    const std::string key = trim(line.substr(0, colon));
    const std::string value = trim(line.substr(colon + 1));
    const std::string tok = first_token(value);

    if (key == "Op rate") summary.op_rate = parse_number(tok);
    else if (key == "Partition rate") summary.partition_rate = parse_number(tok);
    else if (key == "Row rate") summary.row_rate = parse_number(tok);
    else if (key == "Latency mean") summary.latency_mean_ms = parse_number(tok);
    else if (key == "Latency median") summary.latency_median_ms = parse_number(tok);
    else if (key == "Latency 95th percentile") summary.latency_95th_ms = parse_number(tok);
    else if (key == "Latency 99th percentile") summary.latency_99th_ms = parse_number(tok);
    else if (key == "Latency 99.9th percentile") summary.latency_999th_ms = parse_number(tok);
    else if (key == "Latency max") summary.latency_max_ms = parse_number(tok);
    else if (key == "Total errors") {
      if (auto v = parse_number(tok)) summary.total_errors = static_cast<uint64_t>(*v);
    } else if (key == "Total operation time") {
      if (!tok.empty()) summary.total_operation_time = tok;
    }
  }
  return summary;
}

}  // namespace stressrig
