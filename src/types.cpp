#include "stressrig/types.hpp"

#include <cstdio>
#include <sstream>

#include "stressrig/jsonlite.hpp"

namespace stressrig {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::provisioning_failed: return "provisioning_failed";
    case ErrorCode::execution_timeout: return "execution_timeout";
    case ErrorCode::execution_error: return "execution_error";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::unexpected_exit: return "unexpected_exit";
  }
  return "";
}

std::string to_string(InvocationState state) {
  switch (state) {
    case InvocationState::idle: return "idle";
    case InvocationState::translating: return "translating";
    case InvocationState::provisioning: return "provisioning";
    case InvocationState::running: return "running";
    case InvocationState::failed: return "failed";
    case InvocationState::reporting: return "reporting";
    case InvocationState::done: return "done";
  }
  return "";
}

void FailureCategoryStats::record(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: break;
    case ErrorCode::config_invalid: ++config_invalid; break;
    case ErrorCode::provisioning_failed: ++provisioning_failed; break;
    case ErrorCode::execution_timeout: ++execution_timeout; break;
    case ErrorCode::execution_error: ++execution_error; break;
    case ErrorCode::spawn_failed: ++spawn_failed; break;
    case ErrorCode::unexpected_exit: ++unexpected_exit; break;
  }
}

uint64_t FailureCategoryStats::total() const {
  return config_invalid + provisioning_failed + execution_timeout +
         execution_error + spawn_failed + unexpected_exit;
}

std::string FailureCategoryStats::to_json() const {
  std::ostringstream o;
  o << "{\"config_invalid\":" << config_invalid
    << ",\"provisioning_failed\":" << provisioning_failed
    << ",\"execution_timeout\":" << execution_timeout
    << ",\"execution_error\":" << execution_error
    << ",\"spawn_failed\":" << spawn_failed
    << ",\"unexpected_exit\":" << unexpected_exit
    << ",\"total\":" << total() << "}";
  return o.str();
}

std::string InvocationIdentity::tag() const {
  return "TAG: loader_idx:" + std::to_string(loader_index) +
         "-cpu_idx:" + std::to_string(cpu_index) +
         "-keyspace_idx:" + std::to_string(keyspace_index);
}

std::string InvocationIdentity::short_id() const {
  return "l" + std::to_string(loader_index) + "-c" + std::to_string(cpu_index) +
         "-k" + std::to_string(keyspace_index);
}

std::chrono::milliseconds TimeoutPolicy::hard() const {
  // ceil(5%) in integer arithmetic; never rounds the margin down to zero.
  const auto soft_ms = static_cast<uint64_t>(soft_.count());
  const uint64_t margin = (soft_ms * 5 + 99) / 100;
  return std::chrono::milliseconds(soft_ms + margin);
}

bool StressSummary::empty() const {
  return !op_rate && !partition_rate && !row_rate && !latency_mean_ms &&
         !latency_median_ms && !latency_95th_ms && !latency_99th_ms &&
         !latency_999th_ms && !latency_max_ms && !total_errors &&
         !total_operation_time;
}

std::string StressSummary::to_json() const {
  std::string out = "{";
  bool first = true;
  char buf[64];
  auto add_double = [&](const char* key, const std::optional<double>& v) {
    if (!v) return;
    if (!first) out += ',';
    first = false;
    std::snprintf(buf, sizeof(buf), "%.3f", *v);
    out += "\"";
    out += key;
    out += "\":";
    out += buf;
  };
  add_double("op_rate", op_rate);
  add_double("partition_rate", partition_rate);
  add_double("row_rate", row_rate);
  add_double("latency_mean_ms", latency_mean_ms);
  add_double("latency_median_ms", latency_median_ms);
  add_double("latency_95th_ms", latency_95th_ms);
  add_double("latency_99th_ms", latency_99th_ms);
  add_double("latency_999th_ms", latency_999th_ms);
  add_double("latency_max_ms", latency_max_ms);
  if (total_errors) {
    if (!first) out += ',';
    first = false;
    out += "\"total_errors\":" + std::to_string(*total_errors);
  }
  if (total_operation_time) {
    if (!first) out += ',';
    out += "\"total_operation_time\":\"" + jsonlite::escape(*total_operation_time) + "\"";
  }
  out += '}';
  return out;
}

std::string describe(const std::exception_ptr& cause) {
  if (!cause) return "";
  try {
    std::rethrow_exception(cause);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "non-standard exception";
  }
}

}  // namespace stressrig
