#include "stressrig/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <utility>

#include "stressrig/jsonlite.hpp"
#include "stressrig/log.hpp"

namespace stressrig {

namespace {

// Equivalent to floor(log2(x)) + 1 for x > 0.
inline size_t bucket_for_ms(uint64_t duration_ms) {
  if (duration_ms == 0) return 0;
  const size_t b = static_cast<size_t>(std::bit_width(duration_ms));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::atomic<StressEventHook> g_event_hook{nullptr};

}  // namespace

std::string to_string(EventSeverity s) {
  switch (s) {
    case EventSeverity::normal: return "NORMAL";
    case EventSeverity::warning: return "WARNING";
    case EventSeverity::error: return "ERROR";
    case EventSeverity::critical: return "CRITICAL";
  }
  return "NORMAL";
}

std::string to_string(EventKind k) {
  switch (k) {
    case EventKind::finish: return "finish";
    case EventKind::failure: return "failure";
    case EventKind::soft_timeout: return "soft_timeout";
  }
  return "finish";
}

// ---------------------------------------------------------------------------
// StressEvent
// ---------------------------------------------------------------------------

std::string StressEvent::to_json() const {
  std::ostringstream o;
  o << "{\"type\":\"" << to_string(kind) << "\""
    << ",\"severity\":\"" << to_string(severity) << "\""
    << ",\"node\":\"" << jsonlite::escape(node) << "\""
    << ",\"loader_idx\":" << identity.loader_index
    << ",\"cpu_idx\":" << identity.cpu_index
    << ",\"keyspace_idx\":" << identity.keyspace_index
    << ",\"stress_cmd\":\"" << jsonlite::escape(stress_cmd) << "\""
    << ",\"translated_cmd\":\"" << jsonlite::escape(translated_cmd) << "\""
    << ",\"log_file_name\":\"" << jsonlite::escape(log_file_name) << "\""
    << ",\"error_code\":\"" << to_string(error_code) << "\""
    << ",\"exit_code\":" << exit_code
    << ",\"duration_ms\":" << duration_ms
    << ",\"errors\":[";
  for (size_t i = 0; i < errors.size(); ++i) {
    if (i > 0) o << ',';
    o << "\"" << jsonlite::escape(errors[i]) << "\"";
  }
  o << "]";
  if (cause) o << ",\"cause\":\"" << jsonlite::escape(describe(cause)) << "\"";
  o << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// StressEventScope
// ---------------------------------------------------------------------------

StressEventScope::StressEventScope(EventSink& sink, std::string node, std::string stress_cmd,
                                   std::string log_file_name)
    : sink_(sink) {
  event_.node = std::move(node);
  event_.stress_cmd = std::move(stress_cmd);
  event_.log_file_name = std::move(log_file_name);
}

StressEventScope::~StressEventScope() {
  if (!published_) publish();
}

void StressEventScope::record_failure(const ExecutionFailure& failure, EventSeverity severity) {
  event_.kind = EventKind::failure;
  event_.severity = severity;
  event_.error_code = failure.code;
  event_.errors.push_back(failure.message);
  event_.cause = failure.cause;
  event_.exit_code = failure.exit_code;
  event_.duration_ms = failure.duration_ms;
}

void StressEventScope::record_success(const RunResult& result) {
  event_.kind = EventKind::finish;
  event_.severity = EventSeverity::normal;
  event_.error_code = ErrorCode::none;
  event_.exit_code = result.exit_code;
  event_.duration_ms = result.duration_ms;
}

const StressEvent& StressEventScope::publish() {
  if (published_) return event_;
  published_ = true;
  // A sink failure is logged; the outcome stays with the caller.
  try {
    sink_.publish(event_);
  } catch (const std::exception& e) {
    Logger::error("events", "failed to publish stress event for " + event_.node + " (" +
                                event_.identity.short_id() + "): " + e.what());
  } catch (...) {
    Logger::error("events", "failed to publish stress event for " + event_.node + " (" +
                                event_.identity.short_id() + "): non-standard exception");
  }
  return event_;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ms) {
  buckets_[bucket_for_ms(duration_ms)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_ms_.fetch_add(duration_ms, std::memory_order_relaxed);
}

double LatencyHistogram::mean_ms() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_ms_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target && cumulative > 0) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_ms());
  out += buf;
  out += ",\"p50_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.50));
  out += buf;
  out += ",\"p95_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.95));
  out += buf;
  out += ",\"p99_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.99));
  out += buf;
  out += '}';
  return out;
}

void LatencyHistogram::reset() {
  for (auto& b : buckets_) b.store(0, std::memory_order_relaxed);
  count_.store(0, std::memory_order_relaxed);
  sum_ms_.store(0, std::memory_order_relaxed);
}

// ---------------------------------------------------------------------------
// StressStats
// ---------------------------------------------------------------------------

void StressStats::record(const StressEvent& ev) {
  if (ev.kind == EventKind::soft_timeout) {
    soft_timeouts.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  total_invocations.fetch_add(1, std::memory_order_relaxed);
  if (ev.ok()) {
    successful_invocations.fetch_add(1, std::memory_order_relaxed);
  } else {
    failed_invocations.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(failure_mu_);
    failure_categories_.record(ev.error_code);
  }
  duration_histogram.record(ev.duration_ms);
}

FailureCategoryStats StressStats::failure_categories() const {
  std::lock_guard<std::mutex> lk(failure_mu_);
  return failure_categories_;
}

std::string StressStats::to_json() const {
  std::string out;
  out.reserve(512);
  out += "{\"total_invocations\":";
  out += std::to_string(total_invocations.load(std::memory_order_relaxed));
  out += ",\"successful_invocations\":";
  out += std::to_string(successful_invocations.load(std::memory_order_relaxed));
  out += ",\"failed_invocations\":";
  out += std::to_string(failed_invocations.load(std::memory_order_relaxed));
  out += ",\"soft_timeouts\":";
  out += std::to_string(soft_timeouts.load(std::memory_order_relaxed));
  out += ",\"duration\":";
  out += duration_histogram.to_json();
  out += ",\"failure_categories\":";
  out += failure_categories().to_json();
  out += '}';
  return out;
}

void StressStats::reset() {
  total_invocations.store(0, std::memory_order_relaxed);
  successful_invocations.store(0, std::memory_order_relaxed);
  failed_invocations.store(0, std::memory_order_relaxed);
  soft_timeouts.store(0, std::memory_order_relaxed);
  duration_histogram.reset();
  std::lock_guard<std::mutex> lk(failure_mu_);
  failure_categories_ = FailureCategoryStats{};
}

StressStats& global_stress_stats() {
  static StressStats inst;
  return inst;
}

void set_stress_event_hook(StressEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

// ---------------------------------------------------------------------------
// DefaultEventSink
// ---------------------------------------------------------------------------

DefaultEventSink::DefaultEventSink(std::string event_log_path)
    : event_log_path_(std::move(event_log_path)) {
  if (event_log_path_.empty()) {
    const char* e = std::getenv("STRESSRIG_EVENT_LOG");
    if (e && e[0]) event_log_path_ = e;
  }
}

void DefaultEventSink::publish(const StressEvent& ev) {
  global_stress_stats().record(ev);

  if (StressEventHook hook = g_event_hook.load(std::memory_order_acquire)) hook(ev);

  if (ev.kind == EventKind::failure) {
    Logger::error("events", "stress failed on " + ev.node + " (" + ev.identity.short_id() +
                                "): " + (ev.errors.empty() ? to_string(ev.error_code)
                                                           : ev.errors.back()));
  } else if (ev.kind == EventKind::soft_timeout) {
    Logger::warning("events", "soft timeout on " + ev.node + " (" + ev.identity.short_id() + ")");
  }

  if (event_log_path_.empty()) return;
  std::string line = ev.to_json();
  line += '\n';
  std::lock_guard<std::mutex> lk(write_mu_);
  if (FILE* f = std::fopen(event_log_path_.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  } else {
    Logger::error("events", "cannot append to event log " + event_log_path_);
  }
}

}  // namespace stressrig
