#pragma once

// stressrig/stress_thread.hpp - Orchestrates concurrent stress invocations.
//
// One StressThread drives one configured stress command across loaders:
// run() launches an invocation per (loader, cpu_idx, keyspace_idx) on its own
// std::thread and get_results() joins them.
//
// Each invocation runs the state machine
//   idle -> translating -> provisioning -> running -> reporting -> done
// with provisioning|running -> failed -> reporting -> done on failure. The
// container is released before the outcome event is published, and exactly
// one outcome event is published per invocation. Invocations share no
// mutable state apart from the thread-safe sink, metrics registry and
// result list.
//
// The dialect is a DialectTranslator passed in, not a subclass.

#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "stressrig/config.hpp"
#include "stressrig/container.hpp"
#include "stressrig/metrics.hpp"
#include "stressrig/observability.hpp"
#include "stressrig/reporter.hpp"
#include "stressrig/runner.hpp"
#include "stressrig/topology.hpp"
#include "stressrig/translator.hpp"
#include "stressrig/types.hpp"

namespace stressrig {

struct InvocationOutcome {
  LoaderNode loader;
  InvocationIdentity identity;
  std::string command;                 // translated command
  std::string log_file;
  std::optional<RunResult> result;     // empty on failure
  StressEvent event;
  std::vector<InvocationState> states; // every state entered, in order

  bool ok() const { return event.ok(); }
  std::string to_json() const;
};

class StressThread {
 public:
  // `topology` defaults to one built from config.nodes; `translator` to
  // CqlStressTranslator; `metrics` to global_metrics(). Borrowed references
  // must outlive the StressThread.
  StressThread(StressConfig config, RemoteSandbox& sandbox, EventSink& sink,
               const DatacenterLookup* topology = nullptr,
               std::shared_ptr<const DialectTranslator> translator = nullptr,
               MetricsRegistry* metrics = nullptr);
  ~StressThread();

  StressThread(const StressThread&) = delete;
  StressThread& operator=(const StressThread&) = delete;

  const StressConfig& config() const { return config_; }
  const std::string& shell_marker() const { return shell_marker_; }
  TimeoutPolicy timeout_policy() const { return TimeoutPolicy::from_seconds(config_.timeout_s); }

  // Translated command for one loader/keyspace.
  std::string create_stress_cmd(const LoaderNode& loader, uint32_t keyspace_idx) const;

  // <logdir>/cql-stress-cassandra-stress-<subcommand>-<log id>.log
  std::string log_file_path(const LoaderNode& loader, const InvocationIdentity& id) const;

  // Shell line executed in the container: tag echo, marker, optional taskset.
  std::string build_node_command(const std::string& stress_cmd,
                                 const InvocationIdentity& id) const;

  // One invocation, synchronously. Translator, sandbox and sink failures come
  // back in the outcome's event; the states always end failed|running ->
  // reporting -> done.
  InvocationOutcome run_stress_invocation(const LoaderNode& loader, uint32_t loader_idx,
                                          uint32_t cpu_idx, uint32_t keyspace_idx);

  // Launches every invocation in the background.
  void run();

  // Joins everything launched by run(); outcomes sorted by identity.
  std::vector<InvocationOutcome> get_results();

 private:
  Outcome provision_and_run(const LoaderNode& loader, const InvocationIdentity& id,
                            const std::string& command, const std::string& log_file,
                            std::vector<InvocationState>& states);

  // Outcome for an invocation that threw past its own stages.
  InvocationOutcome aborted_outcome(const LoaderNode& loader, const InvocationIdentity& id,
                                    std::exception_ptr cause);

  void publish_soft_timeout(const LoaderNode& loader, const InvocationIdentity& id,
                            const std::string& log_file);

  std::vector<std::pair<uint32_t, LoaderNode>> loaders_for_run() const;

  StressConfig config_;
  RemoteSandbox& sandbox_;
  EventSink& sink_;
  std::unique_ptr<NodeTopology> owned_topology_;
  const DatacenterLookup* topology_;
  std::shared_ptr<const DialectTranslator> translator_;
  MetricsRegistry& metrics_;
  Provisioner provisioner_;
  Runner runner_;
  Reporter reporter_;
  std::string shell_marker_;

  std::mutex results_mu_;
  std::vector<InvocationOutcome> results_;
  std::vector<std::thread> threads_;
};

}  // namespace stressrig
