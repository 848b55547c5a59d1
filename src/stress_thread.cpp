#include "stressrig/stress_thread.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <tuple>
#include <utility>

#include <unistd.h>

#include "stressrig/archive.hpp"
#include "stressrig/hash.hpp"
#include "stressrig/jsonlite.hpp"
#include "stressrig/log.hpp"

namespace fs = std::filesystem;

namespace stressrig {

namespace {

constexpr const char* kComponent = "stress";

// Shared by every StressThread in the process so consecutive round-robin
// threads land on consecutive loaders.
std::atomic<uint64_t> g_round_robin_next{0};

std::string default_run_id() {
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  return "run-" + std::to_string(::getpid()) + "-" + std::to_string(now_ms);
}

ExecutionFailure failure_from(std::exception_ptr cause, ErrorCode code, const std::string& what,
                              const std::string& log_file) {
  ExecutionFailure f;
  f.code = code;
  f.cause = std::move(cause);
  f.message = what + ": " + describe(f.cause);
  f.log_file = log_file;
  return f;
}

std::string instance_name(const LoaderNode& loader) {
  return loader.ip_address.empty() ? loader.name : loader.ip_address;
}

}  // namespace

std::string InvocationOutcome::to_json() const {
  std::ostringstream o;
  o << "{\"ok\":" << (ok() ? "true" : "false")
    << ",\"loader\":" << loader.to_json()
    << ",\"tag\":\"" << jsonlite::escape(identity.tag()) << "\""
    << ",\"command\":\"" << jsonlite::escape(command) << "\""
    << ",\"log_file\":\"" << jsonlite::escape(log_file) << "\"";
  if (result) {
    o << ",\"result\":{\"exit_code\":" << result->exit_code
      << ",\"duration_ms\":" << result->duration_ms
      << ",\"soft_timeout_exceeded\":" << (result->soft_timeout_exceeded ? "true" : "false")
      << ",\"output_truncated\":" << (result->output_truncated ? "true" : "false")
      << ",\"summary\":" << result->summary.to_json() << "}";
  }
  o << ",\"event\":" << event.to_json() << ",\"states\":[";
  for (size_t i = 0; i < states.size(); ++i) {
    if (i > 0) o << ',';
    o << "\"" << to_string(states[i]) << "\"";
  }
  o << "]}";
  return o.str();
}

StressThread::StressThread(StressConfig config, RemoteSandbox& sandbox, EventSink& sink,
                           const DatacenterLookup* topology,
                           std::shared_ptr<const DialectTranslator> translator,
                           MetricsRegistry* metrics)
    : config_(std::move(config)),
      sandbox_(sandbox),
      sink_(sink),
      topology_(topology),
      translator_(std::move(translator)),
      metrics_(metrics ? *metrics : global_metrics()),
      provisioner_(sandbox_, config_.docker_image),
      reporter_(config_.stop_test_on_failure) {
  if (!topology_) {
    owned_topology_ = std::make_unique<NodeTopology>(config_.nodes);
    topology_ = owned_topology_.get();
  }
  if (!translator_) translator_ = std::make_shared<CqlStressTranslator>();
  if (config_.run_id.empty()) config_.run_id = default_run_id();
  shell_marker_ = shell_marker_for(config_.run_id, config_.stress_cmd);
}

StressThread::~StressThread() {
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
}

std::string StressThread::create_stress_cmd(const LoaderNode& loader,
                                            uint32_t keyspace_idx) const {
  TranslationContext ctx;
  ctx.keyspace_index = keyspace_idx;
  ctx.keyspace_name = config_.keyspace_name;
  ctx.compaction_strategy = config_.compaction_strategy;
  ctx.node_list = config_.node_addresses();
  ctx.multi_region = config_.multi_region;
  ctx.loader_region = loader.region;
  ctx.datacenter_lookup = topology_;
  return translator_->translate(config_.stress_cmd, ctx);
}

std::string StressThread::log_file_path(const LoaderNode& loader,
                                        const InvocationIdentity& id) const {
  const std::string sub = stress_subcommand(config_.stress_cmd);
  std::string name = std::string(kCqlStressTool);
  if (!sub.empty()) name += "-" + sub;
  name += "-" + log_file_id(id, shell_marker_) + ".log";
  return (fs::path(loader.logdir) / name).string();
}

std::string StressThread::build_node_command(const std::string& stress_cmd,
                                             const InvocationIdentity& id) const {
  std::string cmd = "echo " + id.tag() + "; STRESS_TEST_MARKER=" + shell_marker_ + "; ";
  if (config_.stress_num > 1) cmd += "taskset -c " + std::to_string(id.cpu_index) + " ";
  cmd += stress_cmd;
  return cmd;
}

void StressThread::publish_soft_timeout(const LoaderNode& loader, const InvocationIdentity& id,
                                        const std::string& log_file) {
  StressEvent ev;
  ev.kind = EventKind::soft_timeout;
  ev.severity = EventSeverity::warning;
  ev.node = loader.name;
  ev.stress_cmd = config_.stress_cmd;
  ev.log_file_name = log_file;
  ev.identity = id;
  ev.errors.push_back("stress command is still running after its soft timeout of " +
                      std::to_string(config_.timeout_s) + "s");
  try {
    sink_.publish(ev);
  } catch (const std::exception& e) {
    Logger::error(kComponent, std::string("soft timeout event not published: ") + e.what());
  } catch (...) {
    Logger::error(kComponent, "soft timeout event not published: non-standard exception");
  }
}

Outcome StressThread::provision_and_run(const LoaderNode& loader, const InvocationIdentity& id,
                                        const std::string& command, const std::string& log_file,
                                        std::vector<InvocationState>& states) {
  std::error_code ec;
  if (!loader.logdir.empty()) fs::create_directories(loader.logdir, ec);
  if (ec) {
    ExecutionFailure f;
    f.code = ErrorCode::provisioning_failed;
    f.cause = std::make_exception_ptr(
        fs::filesystem_error("cannot create log directory", fs::path(loader.logdir), ec));
    f.message = "cannot create log directory " + loader.logdir + ": " + ec.message();
    f.log_file = log_file;
    return f;
  }

  std::optional<uint32_t> cpu_affinity;
  if (config_.stress_num > 1) cpu_affinity = id.cpu_index;

  ProvisionOutcome prov = provisioner_.acquire(loader, cpu_affinity, shell_marker_);
  if (auto* failure = std::get_if<ExecutionFailure>(&prov)) {
    failure->log_file = log_file;
    return std::move(*failure);
  }
  ScopedContext& ctx = std::get<ScopedContext>(prov);

  states.push_back(InvocationState::running);
  StressMetricsExporter exporter(instance_name(loader), metrics_,
                                 stress_subcommand(config_.stress_cmd), log_file,
                                 id.loader_index, id.cpu_index);
  RunHooks hooks;
  hooks.on_line = [&exporter](const std::string& line) { exporter.consume_line(line); };
  hooks.on_soft_timeout = [&] { publish_soft_timeout(loader, id, log_file); };

  Outcome outcome = runner_.run(ctx, build_node_command(command, id), timeout_policy(),
                                log_file, hooks);
  // Torn down before the outcome is reported.
  ctx.release();
  return outcome;
}

InvocationOutcome StressThread::run_stress_invocation(const LoaderNode& loader,
                                                      uint32_t loader_idx, uint32_t cpu_idx,
                                                      uint32_t keyspace_idx) {
  InvocationOutcome out;
  out.loader = loader;
  out.identity = InvocationIdentity{loader_idx, cpu_idx, keyspace_idx};
  out.states.push_back(InvocationState::idle);

  out.states.push_back(InvocationState::translating);
  std::optional<Outcome> outcome;
  try {
    out.log_file = log_file_path(loader, out.identity);
    out.command = create_stress_cmd(loader, keyspace_idx);
    Logger::info(kComponent, "Stress command on " + loader.name + " (" + out.identity.tag() +
                                 "): " + out.command);
    Logger::debug(kComponent, "cql-stress-cassandra-stress local log: " + out.log_file);
  } catch (...) {
    outcome = failure_from(std::current_exception(), ErrorCode::config_invalid,
                           "cannot translate stress command", out.log_file);
  }

  StressEventScope scope(sink_, loader.name, config_.stress_cmd, out.log_file);
  scope.set_identity(out.identity);
  scope.set_translated_cmd(out.command);

  if (!outcome) {
    out.states.push_back(InvocationState::provisioning);
    try {
      outcome = provision_and_run(loader, out.identity, out.command, out.log_file, out.states);
    } catch (...) {
      outcome = failure_from(std::current_exception(), ErrorCode::execution_error,
                             "stress invocation aborted", out.log_file);
    }
  }

  if (auto* failure = std::get_if<ExecutionFailure>(&*outcome)) {
    out.states.push_back(InvocationState::failed);
    Logger::error(kComponent, loader.name + " " + out.identity.short_id() + ": " +
                                  to_string(failure->code) + ": " + failure->message);
  }

  std::error_code ec;
  if (config_.archive_logs && !out.log_file.empty() && fs::exists(out.log_file, ec)) {
    std::string err;
    const std::string archived = archive_log(out.log_file, &err);
    if (archived.empty()) {
      Logger::warning(kComponent, "log archival skipped for " + out.log_file + ": " + err);
    } else {
      Logger::debug(kComponent, "archived " + out.log_file + " to " + archived);
    }
  }

  out.states.push_back(InvocationState::reporting);
  InvocationReport report = reporter_.report(*outcome, scope);
  out.result = std::move(report.result);
  out.event = std::move(report.event);
  out.states.push_back(InvocationState::done);
  return out;
}

InvocationOutcome StressThread::aborted_outcome(const LoaderNode& loader,
                                                const InvocationIdentity& id,
                                                std::exception_ptr cause) {
  InvocationOutcome out;
  out.loader = loader;
  out.identity = id;
  out.states = {InvocationState::idle, InvocationState::failed, InvocationState::reporting,
                InvocationState::done};
  StressEventScope scope(sink_, loader.name, config_.stress_cmd, "");
  scope.set_identity(id);
  const Outcome failed = failure_from(std::move(cause), ErrorCode::execution_error,
                                      "stress invocation aborted", "");
  out.event = reporter_.report(failed, scope).event;
  return out;
}

std::vector<std::pair<uint32_t, LoaderNode>> StressThread::loaders_for_run() const {
  std::vector<std::pair<uint32_t, LoaderNode>> picked;
  if (config_.loaders.empty()) return picked;
  if (config_.round_robin) {
    const auto idx = static_cast<uint32_t>(g_round_robin_next.fetch_add(1) %
                                           config_.loaders.size());
    picked.emplace_back(idx, config_.loaders[idx]);
    return picked;
  }
  for (uint32_t i = 0; i < config_.loaders.size(); ++i) picked.emplace_back(i, config_.loaders[i]);
  return picked;
}

void StressThread::run() {
  const auto loaders = loaders_for_run();
  Logger::info(kComponent, "starting " + std::to_string(loaders.size()) + " loader(s) x " +
                               std::to_string(config_.stress_num) + " instance(s) x " +
                               std::to_string(config_.keyspace_num) +
                               " keyspace(s), marker " + shell_marker_);
  for (const auto& [loader_idx, loader] : loaders) {
    for (uint32_t cpu_idx = 0; cpu_idx < config_.stress_num; ++cpu_idx) {
      for (uint32_t ks_idx = 1; ks_idx <= config_.keyspace_num; ++ks_idx) {
        threads_.emplace_back([this, loader = loader, loader_idx = loader_idx, cpu_idx, ks_idx] {
          const InvocationIdentity id{loader_idx, cpu_idx, ks_idx};
          InvocationOutcome out;
          try {
            out = run_stress_invocation(loader, loader_idx, cpu_idx, ks_idx);
          } catch (...) {
            // Every identity gets an outcome, even when the invocation itself blew up.
            out = aborted_outcome(loader, id, std::current_exception());
          }
          std::lock_guard<std::mutex> lk(results_mu_);
          results_.push_back(std::move(out));
        });
      }
    }
  }
}

std::vector<InvocationOutcome> StressThread::get_results() {
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
  std::lock_guard<std::mutex> lk(results_mu_);
  std::vector<InvocationOutcome> out = std::move(results_);
  results_.clear();
  std::sort(out.begin(), out.end(), [](const InvocationOutcome& a, const InvocationOutcome& b) {
    return std::tie(a.identity.loader_index, a.identity.cpu_index, a.identity.keyspace_index) <
           std::tie(b.identity.loader_index, b.identity.cpu_index, b.identity.keyspace_index);
  });
  return out;
}

}  // namespace stressrig
