#pragma once

// stressrig/observability.hpp - Stress events and run statistics.
//
// DESIGN:
//   StressEvent is the observable unit of one invocation. StressEventScope is
//   created per invocation with (node, original command, log file) and
//   publishes exactly one outcome event to an EventSink: a failure event if
//   record_failure() was called, a finish event otherwise. Publishing happens
//   on publish() or, at the latest, in the destructor.
//
//   Soft-timeout checkpoints publish their own warning event; they are not
//   outcome events and do not count against the one-outcome rule.
//
//   DefaultEventSink feeds global StressStats and, when an event log path is
//   configured (STRESSRIG_EVENT_LOG), appends one JSON line per event.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <mutex>
#include <string>
#include <vector>

#include "stressrig/types.hpp"

namespace stressrig {

enum class EventSeverity { normal, warning, error, critical };
enum class EventKind { finish, failure, soft_timeout };

std::string to_string(EventSeverity s);
std::string to_string(EventKind k);

struct StressEvent {
  EventKind kind{EventKind::finish};
  EventSeverity severity{EventSeverity::normal};
  std::string node;
  std::string stress_cmd;          // command as configured, before translation
  std::string translated_cmd;
  std::string log_file_name;
  InvocationIdentity identity;
  ErrorCode error_code{ErrorCode::none};
  std::vector<std::string> errors;
  std::exception_ptr cause;        // original error, preserved as thrown
  int exit_code{0};
  uint64_t duration_ms{0};

  bool ok() const { return kind != EventKind::failure; }
  std::string to_json() const;
};

class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual void publish(const StressEvent& ev) = 0;
};

// ---------------------------------------------------------------------------
// StressEventScope - one outcome event per invocation.
// ---------------------------------------------------------------------------
class StressEventScope {
 public:
  StressEventScope(EventSink& sink, std::string node, std::string stress_cmd,
                   std::string log_file_name);
  ~StressEventScope();

  StressEventScope(const StressEventScope&) = delete;
  StressEventScope& operator=(const StressEventScope&) = delete;

  void set_identity(const InvocationIdentity& id) { event_.identity = id; }
  void set_translated_cmd(const std::string& cmd) { event_.translated_cmd = cmd; }

  void record_failure(const ExecutionFailure& failure, EventSeverity severity);
  void record_success(const RunResult& result);

  // Publishes the outcome once; later calls return the same event. Never
  // throws: a failing sink is logged and the event is still returned.
  const StressEvent& publish();

  bool published() const { return published_; }
  const StressEvent& event() const { return event_; }

 private:
  EventSink& sink_;
  StressEvent event_;
  bool published_{false};
};

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two bucket histogram of invocation durations.
// ---------------------------------------------------------------------------
// Bucket i covers [2^(i-1), 2^i) ms; bucket 0 covers [0, 1) ms.
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ms);

  // p in [0.0, 1.0]. Bucket midpoint in ms; 0.0 with no samples.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_ms() const { return sum_ms_.load(std::memory_order_relaxed); }
  double mean_ms() const;

  std::string to_json() const;
  void reset();

 private:
  std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  std::atomic<uint64_t> count_{0};
  std::atomic<uint64_t> sum_ms_{0};
};

// ---------------------------------------------------------------------------
// StressStats - process-wide aggregation of outcome events.
// ---------------------------------------------------------------------------
class StressStats {
 public:
  void record(const StressEvent& ev);
  std::string to_json() const;
  void reset();

  std::atomic<uint64_t> total_invocations{0};
  std::atomic<uint64_t> successful_invocations{0};
  std::atomic<uint64_t> failed_invocations{0};
  std::atomic<uint64_t> soft_timeouts{0};

  LatencyHistogram duration_histogram;

  FailureCategoryStats failure_categories() const;

 private:
  mutable std::mutex failure_mu_;
  FailureCategoryStats failure_categories_;
};

StressStats& global_stress_stats();

// Optional interception of every event published through DefaultEventSink.
using StressEventHook = void (*)(const StressEvent&);
void set_stress_event_hook(StressEventHook hook);

// Records into global_stress_stats() and appends JSON lines to event_log_path
// (falls back to STRESSRIG_EVENT_LOG when empty). Thread-safe.
class DefaultEventSink : public EventSink {
 public:
  explicit DefaultEventSink(std::string event_log_path = "");
  void publish(const StressEvent& ev) override;
  const std::string& event_log_path() const { return event_log_path_; }

 private:
  std::string event_log_path_;
  std::mutex write_mu_;
};

}  // namespace stressrig
