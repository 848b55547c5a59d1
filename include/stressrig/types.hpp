#pragma once

// stressrig/types.hpp - Core data structures shared by every stressrig layer.
//
// OWNERSHIP:
//   - All public types are value types with value-owned strings.
//   - An invocation never shares mutable state with another invocation; each
//     one owns its RunResult / ExecutionFailure and its event.
//
// ERROR MODEL:
//   - Collaborators (sandbox, topology) may throw SandboxError.
//   - The Runner never throws. It returns Outcome, a variant of RunResult and
//     ExecutionFailure. ExecutionFailure keeps the original exception_ptr so the
//     cause survives all the way to the event sink.
//   - Translation never fails: conflicting flags resolve by precedence.

#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace stressrig {

enum class ErrorCode {
  none,
  config_invalid,
  provisioning_failed,
  execution_timeout,
  execution_error,
  spawn_failed,
  unexpected_exit,
};

std::string to_string(ErrorCode code);

// Thrown by collaborator implementations (docker CLI, ssh transport, ...).
class SandboxError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Cause attached to failures that originate in stressrig itself (hard
// timeout, unexpected exit status) rather than in a collaborator.
class StressError : public std::runtime_error {
 public:
  StressError(ErrorCode code, const std::string& what)
      : std::runtime_error(what), code_(code) {}
  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

// ---------------------------------------------------------------------------
// FailureCategoryStats - per-category failure counters.
// ---------------------------------------------------------------------------
struct FailureCategoryStats {
  uint64_t config_invalid{0};
  uint64_t provisioning_failed{0};
  uint64_t execution_timeout{0};
  uint64_t execution_error{0};
  uint64_t spawn_failed{0};
  uint64_t unexpected_exit{0};

  void record(ErrorCode code);
  uint64_t total() const;
  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// InvocationIdentity - one concurrent stress execution among many.
// ---------------------------------------------------------------------------
// Immutable once assigned. keyspace_index is 1-based like the generated
// keyspace names (keyspace1, keyspace2, ...).
struct InvocationIdentity {
  uint32_t loader_index{0};
  uint32_t cpu_index{0};
  uint32_t keyspace_index{1};

  // "TAG: loader_idx:<l>-cpu_idx:<c>-keyspace_idx:<k>", echoed by the remote
  // shell so the process can be found in container output.
  std::string tag() const;

  // "l<l>-c<c>-k<k>"
  std::string short_id() const;

  bool operator==(const InvocationIdentity&) const = default;
};

// ---------------------------------------------------------------------------
// TimeoutPolicy - soft cooperative timeout plus derived hard kill timeout.
// ---------------------------------------------------------------------------
// Invariant: hard() == soft + ceil(soft * 5%) >= soft. The hard timeout is
// never configured independently.
class TimeoutPolicy {
 public:
  explicit TimeoutPolicy(std::chrono::milliseconds soft) : soft_(soft) {}

  static TimeoutPolicy from_seconds(uint64_t seconds) {
    return TimeoutPolicy(std::chrono::milliseconds(seconds * 1000));
  }

  std::chrono::milliseconds soft() const { return soft_; }
  std::chrono::milliseconds hard() const;

 private:
  std::chrono::milliseconds soft_;
};

// ---------------------------------------------------------------------------
// StressSummary - the final "Results:" block printed by the stress tool.
// ---------------------------------------------------------------------------
// Every field is optional: the tool omits the block when it is killed.
struct StressSummary {
  std::optional<double> op_rate;
  std::optional<double> partition_rate;
  std::optional<double> row_rate;
  std::optional<double> latency_mean_ms;
  std::optional<double> latency_median_ms;
  std::optional<double> latency_95th_ms;
  std::optional<double> latency_99th_ms;
  std::optional<double> latency_999th_ms;
  std::optional<double> latency_max_ms;
  std::optional<uint64_t> total_errors;
  std::optional<std::string> total_operation_time;

  bool empty() const;
  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// RunResult / ExecutionFailure - what the Runner hands to the Reporter.
// ---------------------------------------------------------------------------
struct RunResult {
  int exit_code{0};
  std::string output_tail;        // last bytes of combined output; full text is in log_file
  bool output_truncated{false};
  std::string log_file;
  uint64_t duration_ms{0};
  bool soft_timeout_exceeded{false};
  StressSummary summary;
};

struct ExecutionFailure {
  ErrorCode code{ErrorCode::execution_error};
  std::string message;
  std::exception_ptr cause;       // original error; null when the failure is a status
  int exit_code{-1};
  uint64_t duration_ms{0};
  std::string log_file;
};

using Outcome = std::variant<RunResult, ExecutionFailure>;

// Renders the message of an exception_ptr without rethrowing past the caller.
std::string describe(const std::exception_ptr& cause);

// ---------------------------------------------------------------------------
// InvocationState - per-invocation orchestration state machine.
// ---------------------------------------------------------------------------
// idle -> translating -> provisioning -> running -> reporting -> done
// provisioning|running -> failed -> reporting -> done
enum class InvocationState {
  idle,
  translating,
  provisioning,
  running,
  failed,
  reporting,
  done,
};

std::string to_string(InvocationState state);

}  // namespace stressrig
