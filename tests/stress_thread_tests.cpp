#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

#include "stressrig/config.hpp"
#include "stressrig/container.hpp"
#include "stressrig/hash.hpp"
#include "stressrig/log.hpp"
#include "stressrig/metrics.hpp"
#include "stressrig/observability.hpp"
#include "stressrig/stress_thread.hpp"
#include "stressrig/topology.hpp"
#include "stressrig/translator.hpp"
#include "stressrig/types.hpp"

namespace fs = std::filesystem;
using stressrig::InvocationState;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

fs::path scratch_dir(const std::string& name) {
  const fs::path p = fs::temp_directory_path() /
                     ("stressrig_thread_" + name + "_" + std::to_string(::getpid()));
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

// ---------------------------------------------------------------------------
// Fakes
// ---------------------------------------------------------------------------

class FakeSandbox : public stressrig::RemoteSandbox {
 public:
  stressrig::SandboxHandle start(const stressrig::ContainerSpec& spec) override {
    std::lock_guard<std::mutex> lk(mu);
    ++starts;
    specs.push_back(spec);
    if (fail_start) throw stressrig::SandboxError("docker daemon unreachable");
    return {"ctr-" + std::to_string(starts), spec.node, spec.ssh_target};
  }

  stressrig::ExecResult exec_and_wait(const stressrig::SandboxHandle& handle,
                                      const stressrig::ExecRequest& req) override {
    {
      std::lock_guard<std::mutex> lk(mu);
      commands.push_back(req.shell_command);
      log_paths.push_back(req.log_path);
      soft_ms = req.soft_timeout.count();
      hard_ms = req.hard_timeout.count();
      exec_stops_seen = stops;
      exec_handles.push_back(handle.id);
    }
    if (exec_error) std::rethrow_exception(exec_error);
    if (fire_soft && req.on_soft_timeout) req.on_soft_timeout();
    if (req.on_line) {
      std::istringstream in(output);
      std::string line;
      while (std::getline(in, line)) req.on_line(line);
    }
    stressrig::ExecResult r;
    r.exit_status = exit_status;
    r.timed_out = timed_out;
    r.soft_timeout_fired = fire_soft;
    r.output = output;
    r.duration_ms = 5;
    return r;
  }

  void stop(const stressrig::SandboxHandle& handle) override {
    std::lock_guard<std::mutex> lk(mu);
    ++stops;
    stopped.push_back(handle.id);
  }

  int stop_count() {
    std::lock_guard<std::mutex> lk(mu);
    return stops;
  }

  std::mutex mu;
  int starts = 0;
  int stops = 0;
  int exec_stops_seen = -1;
  long long soft_ms = 0;
  long long hard_ms = 0;
  bool fail_start = false;
  bool fire_soft = false;
  bool timed_out = false;
  int exit_status = 0;
  std::exception_ptr exec_error;
  std::string output;
  std::vector<stressrig::ContainerSpec> specs;
  std::vector<std::string> commands;
  std::vector<std::string> log_paths;
  std::vector<std::string> exec_handles;
  std::vector<std::string> stopped;
};

class RecordingSink : public stressrig::EventSink {
 public:
  explicit RecordingSink(FakeSandbox* sandbox = nullptr) : sandbox_(sandbox) {}

  void publish(const stressrig::StressEvent& ev) override {
    const int stops = sandbox_ ? sandbox_->stop_count() : -1;
    std::lock_guard<std::mutex> lk(mu_);
    events.push_back(ev);
    stops_at_publish.push_back(stops);
  }

  size_t outcome_events() {
    std::lock_guard<std::mutex> lk(mu_);
    return static_cast<size_t>(std::count_if(events.begin(), events.end(), [](const auto& e) {
      return e.kind != stressrig::EventKind::soft_timeout;
    }));
  }

  std::vector<stressrig::StressEvent> events;
  std::vector<int> stops_at_publish;

 private:
  FakeSandbox* sandbox_;
  std::mutex mu_;
};

class PassthroughTranslator : public stressrig::DialectTranslator {
 public:
  std::string translate(const std::string& command,
                        const stressrig::TranslationContext&) const override {
    return command;
  }
};

class ThrowingSink : public stressrig::EventSink {
 public:
  void publish(const stressrig::StressEvent&) override {
    ++attempts;
    throw std::runtime_error("sink down");
  }

  std::atomic<int> attempts{0};
};

// Throws `error` from translate(); rethrows it as-is so callers see the same object.
class ThrowingTranslator : public stressrig::DialectTranslator {
 public:
  explicit ThrowingTranslator(std::exception_ptr error) : error_(std::move(error)) {}

  std::string translate(const std::string&, const stressrig::TranslationContext&) const override {
    std::rethrow_exception(error_);
  }

 private:
  std::exception_ptr error_;
};

class IntThrowingTranslator : public stressrig::DialectTranslator {
 public:
  std::string translate(const std::string&, const stressrig::TranslationContext&) const override {
    throw 42;
  }
};

const std::string kWriteCmd =
    "cql-stress-cassandra-stress write n=1000 -schema 'replication(factor=1)' -rate threads=4";

stressrig::StressConfig base_config(const fs::path& logroot, size_t loaders = 1) {
  stressrig::StressConfig c;
  c.stress_cmd = kWriteCmd;
  c.timeout_s = 20;
  c.run_id = "test-run";
  c.nodes = {{"db1", "10.0.0.1", "eu-west", "eu-west-dc"},
             {"db2", "10.0.0.2", "us-east", "us-east-dc"}};
  for (size_t i = 0; i < loaders; ++i) {
    stressrig::LoaderNode l;
    l.name = "loader" + std::to_string(i + 1);
    l.ip_address = "10.0.1." + std::to_string(i + 1);
    l.region = "eu-west";
    l.logdir = (logroot / l.name).string();
    c.loaders.push_back(l);
  }
  return c;
}

const std::vector<InvocationState> kSuccessTrace = {
    InvocationState::idle,    InvocationState::translating, InvocationState::provisioning,
    InvocationState::running, InvocationState::reporting,   InvocationState::done};

// ============================================================================
// Single invocation
// ============================================================================

void test_successful_invocation() {
  const auto dir = scratch_dir("success");
  FakeSandbox sandbox;
  sandbox.output = "Results:\nOp rate                   :   1,234 op/s  [WRITE: 1,234 op/s]\n";
  RecordingSink sink(&sandbox);
  stressrig::MetricsRegistry metrics;
  const auto config = base_config(dir);
  stressrig::StressThread stress(config, sandbox, sink, nullptr, nullptr, &metrics);

  const auto out = stress.run_stress_invocation(config.loaders[0], 0, 0, 1);

  expect(out.states == kSuccessTrace, "success state trace");
  expect(out.ok(), "success event");
  expect(out.result.has_value(), "run result present");
  expect(out.result->summary.op_rate == 1234.0, "summary parsed into result");
  expect(out.event.kind == stressrig::EventKind::finish, "finish event");
  expect(out.event.severity == stressrig::EventSeverity::normal, "normal severity");
  expect(out.event.stress_cmd == kWriteCmd, "event keeps the original command");
  expect(out.event.translated_cmd == out.command, "event keeps the translated command");
  expect(out.event.identity == stressrig::InvocationIdentity{0, 0, 1}, "event identity");
  expect(sandbox.starts == 1 && sandbox.stops == 1, "one acquire, one release");
  expect(sink.events.size() == 1, "exactly one event");
  expect(sink.stops_at_publish[0] == 1, "container released before the event");
  expect(sandbox.exec_stops_seen == 0, "container alive while running");
  expect(sandbox.soft_ms == 20000 && sandbox.hard_ms == 21000, "soft and hard timeouts");
  fs::remove_all(dir);
}

void test_remote_command_shape() {
  const auto dir = scratch_dir("command");
  FakeSandbox sandbox;
  RecordingSink sink;
  stressrig::MetricsRegistry metrics;
  const auto config = base_config(dir);
  stressrig::StressThread stress(config, sandbox, sink, nullptr, nullptr, &metrics);

  const auto out = stress.run_stress_invocation(config.loaders[0], 0, 0, 2);
  const std::string& cmd = sandbox.commands.at(0);
  const std::string prefix = "echo TAG: loader_idx:0-cpu_idx:0-keyspace_idx:2; STRESS_TEST_MARKER=" +
                             stress.shell_marker() + "; cql-stress-cassandra-stress write no-warmup";
  expect(cmd.rfind(prefix, 0) == 0, "tag, marker, then the command: " + cmd);
  expect(!contains(cmd, "taskset"), "no pinning for a single instance");
  expect(contains(cmd, "-schema keyspace=keyspace2 "), "keyspace index applied: " + cmd);
  expect(contains(cmd, "-node 10.0.0.1,10.0.0.2"), "cluster nodes targeted: " + cmd);

  const auto& spec = sandbox.specs.at(0);
  expect(spec.labels.at("shell_marker") == stress.shell_marker(), "container marker label");
  expect(!spec.cpuset.has_value(), "no cpuset for a single instance");
  expect(spec.image == stressrig::kDefaultStressImage, "default image");
  expect(spec.network_mode == "host", "host network");
  expect(spec.node == "loader1", "container bound to the loader");

  expect(fs::is_directory(config.loaders[0].logdir), "log directory created on demand");
  const fs::path log(out.log_file);
  expect(log.parent_path() == fs::path(config.loaders[0].logdir), "log under loader logdir");
  expect(log.filename().string().rfind("cql-stress-cassandra-stress-write-l0-c0-k2-", 0) == 0,
         "log name: " + log.filename().string());
  expect(log.extension() == ".log", "log extension");
  expect(sandbox.log_paths.at(0) == out.log_file, "runner streams into the log file");
  fs::remove_all(dir);
}

void test_exec_exception_releases_once() {
  const auto dir = scratch_dir("exec_throw");
  FakeSandbox sandbox;
  const auto injected = std::make_exception_ptr(stressrig::SandboxError("ssh: connection reset"));
  sandbox.exec_error = injected;
  RecordingSink sink(&sandbox);
  stressrig::MetricsRegistry metrics;
  const auto config = base_config(dir);
  stressrig::StressThread stress(config, sandbox, sink, nullptr, nullptr, &metrics);

  const auto out = stress.run_stress_invocation(config.loaders[0], 0, 0, 1);

  expect(sandbox.starts == 1 && sandbox.stops == 1, "released exactly once after exec threw");
  expect(!out.ok(), "failure event");
  expect(!out.result.has_value(), "no run result on failure");
  expect(out.event.error_code == stressrig::ErrorCode::execution_error, "execution_error");
  expect(out.event.severity == stressrig::EventSeverity::critical,
         "critical when the test stops on failure");
  expect(out.event.cause == injected, "cause is the injected exception object");
  bool rethrown_as_sandbox_error = false;
  try {
    std::rethrow_exception(out.event.cause);
  } catch (const stressrig::SandboxError& e) {
    rethrown_as_sandbox_error = std::string(e.what()) == "ssh: connection reset";
  }
  expect(rethrown_as_sandbox_error, "cause keeps its type and message");
  expect(sink.outcome_events() == 1, "exactly one outcome event");
  expect(sink.stops_at_publish[0] == 1, "release happened before the failure event");

  const std::vector<InvocationState> trace = {
      InvocationState::idle,    InvocationState::translating, InvocationState::provisioning,
      InvocationState::running, InvocationState::failed,      InvocationState::reporting,
      InvocationState::done};
  expect(out.states == trace, "running -> failed -> reporting -> done");
  fs::remove_all(dir);
}

void test_provisioning_failure() {
  const auto dir = scratch_dir("provision");
  FakeSandbox sandbox;
  sandbox.fail_start = true;
  RecordingSink sink(&sandbox);
  stressrig::MetricsRegistry metrics;
  const auto config = base_config(dir);
  stressrig::StressThread stress(config, sandbox, sink, nullptr, nullptr, &metrics);

  const auto out = stress.run_stress_invocation(config.loaders[0], 0, 0, 1);

  const std::vector<InvocationState> trace = {
      InvocationState::idle,   InvocationState::translating, InvocationState::provisioning,
      InvocationState::failed, InvocationState::reporting,   InvocationState::done};
  expect(out.states == trace, "provisioning -> failed -> reporting -> done");
  expect(out.event.error_code == stressrig::ErrorCode::provisioning_failed, "provisioning_failed");
  expect(stressrig::describe(out.event.cause) == "docker daemon unreachable", "start error kept");
  expect(sandbox.commands.empty(), "nothing executed");
  expect(sandbox.stops == 0, "nothing to release");
  expect(sink.events.size() == 1, "failure still reported");
  expect(!out.command.empty(), "translated command kept on failure");
  fs::remove_all(dir);
}

void test_logdir_failure_is_provisioning_failure() {
  const auto dir = scratch_dir("logdir");
  const auto blocker = dir / "not-a-dir";
  { std::ofstream(blocker) << "x"; }
  FakeSandbox sandbox;
  RecordingSink sink;
  stressrig::MetricsRegistry metrics;
  auto config = base_config(dir);
  config.loaders[0].logdir = (blocker / "logs").string();
  stressrig::StressThread stress(config, sandbox, sink, nullptr, nullptr, &metrics);

  const auto out = stress.run_stress_invocation(config.loaders[0], 0, 0, 1);
  expect(out.event.error_code == stressrig::ErrorCode::provisioning_failed, "logdir failure");
  expect(sandbox.starts == 0, "no container started");
  expect(out.event.cause != nullptr, "filesystem error kept as cause");
  fs::remove_all(dir);
}

void test_unexpected_exit_severity() {
  const auto dir = scratch_dir("exit");
  FakeSandbox sandbox;
  sandbox.exit_status = 3;
  RecordingSink sink;
  stressrig::MetricsRegistry metrics;
  auto config = base_config(dir);
  config.stop_test_on_failure = false;
  stressrig::StressThread stress(config, sandbox, sink, nullptr, nullptr, &metrics);

  const auto out = stress.run_stress_invocation(config.loaders[0], 0, 0, 1);
  expect(out.event.error_code == stressrig::ErrorCode::unexpected_exit, "unexpected_exit");
  expect(out.event.exit_code == 3, "exit status kept");
  expect(out.event.severity == stressrig::EventSeverity::error,
         "error severity when the test keeps going");
  expect(sandbox.stops == 1, "released");
  fs::remove_all(dir);
}

void test_hard_timeout_failure() {
  const auto dir = scratch_dir("timeout");
  FakeSandbox sandbox;
  sandbox.timed_out = true;
  sandbox.exit_status = 124;
  RecordingSink sink;
  stressrig::MetricsRegistry metrics;
  const auto config = base_config(dir);
  stressrig::StressThread stress(config, sandbox, sink, nullptr, nullptr, &metrics);

  const auto out = stress.run_stress_invocation(config.loaders[0], 0, 0, 1);
  expect(out.event.error_code == stressrig::ErrorCode::execution_timeout, "execution_timeout");
  bool timeout_cause = false;
  try {
    std::rethrow_exception(out.event.cause);
  } catch (const stressrig::StressError& e) {
    timeout_cause = e.code() == stressrig::ErrorCode::execution_timeout;
  }
  expect(timeout_cause, "timeout-specific cause");
  expect(sandbox.stops == 1, "released after timeout");
  fs::remove_all(dir);
}

void test_soft_timeout_event() {
  const auto dir = scratch_dir("soft");
  FakeSandbox sandbox;
  sandbox.fire_soft = true;
  RecordingSink sink;
  stressrig::MetricsRegistry metrics;
  const auto config = base_config(dir);
  stressrig::StressThread stress(config, sandbox, sink, nullptr, nullptr, &metrics);

  const auto out = stress.run_stress_invocation(config.loaders[0], 0, 0, 1);
  expect(out.ok(), "soft timeout alone is not a failure");
  expect(out.result && out.result->soft_timeout_exceeded, "overrun recorded on the result");
  expect(sink.events.size() == 2, "checkpoint event plus outcome event");
  expect(sink.events[0].kind == stressrig::EventKind::soft_timeout, "checkpoint first");
  expect(sink.events[0].severity == stressrig::EventSeverity::warning, "checkpoint is a warning");
  expect(sink.events[1].kind == stressrig::EventKind::finish, "then the outcome");
  expect(sink.outcome_events() == 1, "one outcome event");
  fs::remove_all(dir);
}

void test_metrics_wired_to_output() {
  const auto dir = scratch_dir("metrics");
  FakeSandbox sandbox;
  sandbox.output =
      "type       total ops,    op/s\n"
      "total,   1000,   900,   900,   900,   1.5,   1.1,   2.0,   3.0,   4.0,   5.0,   1.0,   0.0,   0\n"
      "total,   2000,   950,   950,   950,   1.4,   1.0,   1.9,   2.9,   3.9,   4.9,   2.0,   0.0,   0\n";
  RecordingSink sink;
  stressrig::MetricsRegistry metrics;
  const auto config = base_config(dir);
  stressrig::StressThread stress(config, sandbox, sink, nullptr, nullptr, &metrics);

  stress.run_stress_invocation(config.loaders[0], 0, 1, 1);

  const stressrig::MetricLabels labels = {
      {"instance", "10.0.1.1"}, {"loader_idx", "0"}, {"cpu_idx", "1"}, {"type", "op_rate"}};
  const auto v = metrics.gauge("stressrig_cql_stress_cassandra_stress_write_gauge", labels);
  expect(v.has_value() && *v == 950.0, "latest interval exported");
  fs::remove_all(dir);
}

void test_custom_translator_and_multi_region() {
  const auto dir = scratch_dir("dialect");
  FakeSandbox sandbox;
  RecordingSink sink;
  stressrig::MetricsRegistry metrics;
  auto config = base_config(dir);

  stressrig::StressThread raw(config, sandbox, sink, nullptr,
                              std::make_shared<PassthroughTranslator>(), &metrics);
  raw.run_stress_invocation(config.loaders[0], 0, 0, 1);
  const std::string& first = sandbox.commands.at(0);
  expect(first.size() >= kWriteCmd.size() &&
             first.compare(first.size() - kWriteCmd.size(), kWriteCmd.size(), kWriteCmd) == 0,
         "injected dialect runs the command as given: " + first);

  config.multi_region = true;
  stressrig::StressThread regional(config, sandbox, sink, nullptr, nullptr, &metrics);
  regional.run_stress_invocation(config.loaders[0], 0, 0, 1);
  expect(contains(sandbox.commands.at(1), "-node datacenter=eu-west-dc 10.0.0.1,10.0.0.2"),
         "loader region resolved from the config topology: " + sandbox.commands.at(1));
  fs::remove_all(dir);
}

void test_shell_marker_per_thread() {
  const auto dir = scratch_dir("marker");
  FakeSandbox sandbox;
  RecordingSink sink;
  const auto config = base_config(dir);
  stressrig::StressThread a(config, sandbox, sink);
  stressrig::StressThread b(config, sandbox, sink);
  expect(a.shell_marker() == b.shell_marker(), "same run id and command, same marker");
  expect(a.shell_marker() == stressrig::shell_marker_for("test-run", kWriteCmd), "marker source");

  auto other = config;
  other.run_id.clear();
  stressrig::StressThread c(other, sandbox, sink);
  expect(!c.config().run_id.empty(), "run id generated when missing");
  expect(c.shell_marker().size() == 20, "marker length");
  fs::remove_all(dir);
}

void test_sink_failure_keeps_outcome() {
  const auto dir = scratch_dir("sink_throw");
  FakeSandbox sandbox;
  ThrowingSink sink;
  stressrig::MetricsRegistry metrics;
  const auto config = base_config(dir);
  stressrig::StressThread stress(config, sandbox, sink, nullptr, nullptr, &metrics);

  const auto out = stress.run_stress_invocation(config.loaders[0], 0, 0, 1);
  expect(out.states == kSuccessTrace, "sink failure does not change the state trace");
  expect(out.result.has_value(), "run result survives the sink failure");
  expect(out.event.kind == stressrig::EventKind::finish, "event still returned to the caller");
  expect(sandbox.stops == 1, "context released once");
  expect(sink.attempts == 1, "one publish attempt");

  stress.run();
  const auto outcomes = stress.get_results();
  expect(outcomes.size() == 1, "fan-out still records the outcome");
  expect(outcomes[0].identity == stressrig::InvocationIdentity{0, 0, 1}, "outcome identity");
  expect(outcomes[0].result.has_value(), "fan-out result present");
  fs::remove_all(dir);
}

void test_translation_failure() {
  const auto dir = scratch_dir("translate_throw");
  FakeSandbox sandbox;
  RecordingSink sink(&sandbox);
  stressrig::MetricsRegistry metrics;
  const auto injected = std::make_exception_ptr(stressrig::SandboxError("bad dialect"));
  const auto config = base_config(dir);
  stressrig::StressThread stress(config, sandbox, sink, nullptr,
                                 std::make_shared<ThrowingTranslator>(injected), &metrics);

  const auto out = stress.run_stress_invocation(config.loaders[0], 0, 0, 1);
  const std::vector<InvocationState> trace = {InvocationState::idle, InvocationState::translating,
                                              InvocationState::failed, InvocationState::reporting,
                                              InvocationState::done};
  expect(out.states == trace, "translating -> failed -> reporting -> done");
  expect(!out.ok(), "failure event");
  expect(!out.result.has_value(), "no run result");
  expect(out.event.error_code == stressrig::ErrorCode::config_invalid, "config_invalid");
  expect(out.event.cause == injected, "cause is the translator's exception");
  expect(sandbox.starts == 0, "no container for an untranslatable command");
  expect(sink.events.size() == 1, "exactly one event");
  fs::remove_all(dir);
}

void test_non_standard_exception() {
  const auto dir = scratch_dir("int_throw");
  FakeSandbox sandbox;
  RecordingSink sink(&sandbox);
  stressrig::MetricsRegistry metrics;
  const auto config = base_config(dir);
  stressrig::StressThread stress(config, sandbox, sink, nullptr,
                                 std::make_shared<IntThrowingTranslator>(), &metrics);

  const auto out = stress.run_stress_invocation(config.loaders[0], 0, 0, 1);
  expect(!out.ok(), "failure event");
  expect(out.event.cause != nullptr, "cause kept");
  expect(stressrig::describe(out.event.cause) == "non-standard exception", "cause described");
  bool rethrown_as_int = false;
  try {
    std::rethrow_exception(out.event.cause);
  } catch (int v) {
    rethrown_as_int = v == 42;
  }
  expect(rethrown_as_int, "cause keeps the thrown value");

  stress.run();
  const auto outcomes = stress.get_results();
  expect(outcomes.size() == 1, "fan-out records the failed invocation");
  expect(!outcomes[0].ok(), "fan-out outcome is a failure");
  expect(outcomes[0].states.back() == InvocationState::done, "fan-out outcome finished");
  expect(sink.outcome_events() == 2, "one event per invocation");
  fs::remove_all(dir);
}

// ============================================================================
// Fan-out
// ============================================================================

void test_fan_out() {
  const auto dir = scratch_dir("fanout");
  FakeSandbox sandbox;
  RecordingSink sink(&sandbox);
  stressrig::MetricsRegistry metrics;
  auto config = base_config(dir, 2);
  config.stress_num = 2;
  config.keyspace_num = 2;
  stressrig::StressThread stress(config, sandbox, sink, nullptr, nullptr, &metrics);

  stress.run();
  const auto outcomes = stress.get_results();

  expect(outcomes.size() == 8, "2 loaders x 2 cpus x 2 keyspaces");
  expect(sandbox.starts == 8 && sandbox.stops == 8, "every context released");
  expect(sink.events.size() == 8, "one event per invocation");

  std::set<std::string> logs;
  for (const auto& o : outcomes) {
    expect(o.ok(), "invocation succeeded");
    expect(o.states == kSuccessTrace, "each invocation ran the full machine");
    logs.insert(o.log_file);
  }
  expect(logs.size() == 8, "distinct log file per identity");

  expect(outcomes[0].identity == stressrig::InvocationIdentity{0, 0, 1}, "sorted first");
  expect(outcomes[7].identity == stressrig::InvocationIdentity{1, 1, 2}, "sorted last");
  expect(outcomes[7].loader.name == "loader2", "loader matches its index");
  expect(contains(outcomes[3].command, "keyspace=keyspace2"), "keyspace index applied");

  int pinned = 0;
  for (const auto& cmd : sandbox.commands) {
    if (contains(cmd, "; taskset -c 1 cql-stress-cassandra-stress")) ++pinned;
  }
  expect(pinned == 4, "cpu slot 1 pinned with taskset");
  for (const auto& spec : sandbox.specs) expect(spec.cpuset.has_value(), "cpuset when shared");
  fs::remove_all(dir);
}

void test_round_robin() {
  const auto dir = scratch_dir("round_robin");
  FakeSandbox sandbox;
  RecordingSink sink;
  stressrig::MetricsRegistry metrics;
  auto config = base_config(dir, 2);
  config.round_robin = true;

  stressrig::StressThread first(config, sandbox, sink, nullptr, nullptr, &metrics);
  first.run();
  const auto a = first.get_results();
  stressrig::StressThread second(config, sandbox, sink, nullptr, nullptr, &metrics);
  second.run();
  const auto b = second.get_results();

  expect(a.size() == 1 && b.size() == 1, "one loader per round-robin thread");
  expect(a[0].loader.name != b[0].loader.name, "consecutive threads rotate loaders");
  expect(a[0].identity.loader_index != b[0].identity.loader_index, "loader index follows");
  fs::remove_all(dir);
}

void test_outcome_json() {
  const auto dir = scratch_dir("json");
  FakeSandbox sandbox;
  RecordingSink sink;
  stressrig::MetricsRegistry metrics;
  const auto config = base_config(dir);
  stressrig::StressThread stress(config, sandbox, sink, nullptr, nullptr, &metrics);
  const auto out = stress.run_stress_invocation(config.loaders[0], 0, 0, 1);
  const auto json = out.to_json();
  expect(contains(json, "\"ok\":true"), "ok flag");
  expect(contains(json, "\"states\":[\"idle\",\"translating\",\"provisioning\",\"running\","
                        "\"reporting\",\"done\"]"),
         "state trace: " + json);
  expect(contains(json, "\"tag\":\"TAG: loader_idx:0-cpu_idx:0-keyspace_idx:1\""), "tag");
  fs::remove_all(dir);
}

}  // namespace

int main() {
  stressrig::Logger::set_level(stressrig::LogLevel::error);
  std::cout << "=== stressrig Orchestrator Test Suite ===\n";

  std::cout << "\n[Invocation]\n";
  run_test("successful invocation", test_successful_invocation);
  run_test("remote command shape", test_remote_command_shape);
  run_test("exec exception releases once", test_exec_exception_releases_once);
  run_test("provisioning failure", test_provisioning_failure);
  run_test("log directory failure", test_logdir_failure_is_provisioning_failure);
  run_test("unexpected exit severity", test_unexpected_exit_severity);
  run_test("hard timeout failure", test_hard_timeout_failure);
  run_test("soft timeout event", test_soft_timeout_event);
  run_test("metrics wired to output", test_metrics_wired_to_output);
  run_test("custom translator and multi-region", test_custom_translator_and_multi_region);
  run_test("shell marker per thread", test_shell_marker_per_thread);
  run_test("outcome JSON", test_outcome_json);
  run_test("sink failure keeps outcome", test_sink_failure_keeps_outcome);
  run_test("translation failure", test_translation_failure);
  run_test("non-standard exception", test_non_standard_exception);

  std::cout << "\n[Fan-out]\n";
  run_test("loaders x cpus x keyspaces", test_fan_out);
  run_test("round robin", test_round_robin);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
