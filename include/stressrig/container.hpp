#pragma once

// stressrig/container.hpp - Isolated remote execution contexts.
//
// DESIGN:
//   RemoteSandbox is the collaborator contract (start / exec_and_wait / stop).
//   DockerSandbox implements it with the docker CLI, either locally or through
//   `ssh <target>` when the loader names one.
//
//   Provisioner::acquire() starts an idle container for one invocation and
//   hands back a ScopedContext. The ScopedContext owns the container: its
//   destructor stops it, exactly once, on every exit path. Callers never call
//   stop() themselves.
//
// INVARIANTS:
//   1. Network mode is always host: the stress tool talks to cluster nodes
//      directly.
//   2. Every container carries the label shell_marker=<marker> so leftovers
//      can be audited and reaped by marker.
//   3. One ScopedContext per acquire; moved-from contexts release nothing.

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>

#include "stressrig/topology.hpp"
#include "stressrig/types.hpp"

namespace stressrig {

constexpr const char* kDefaultStressImage = "scylladb/cql-stress:latest";

struct ContainerSpec {
  std::string node;                       // loader name, for logs
  std::string ssh_target;                 // empty: local docker CLI
  std::string image;
  std::optional<uint32_t> cpuset;         // --cpuset-cpus when instances share a host
  std::string network_mode{"host"};
  std::map<std::string, std::string> labels;
  std::string entrypoint{"/bin/bash"};
  std::string command_line{"-c 'tail -f /dev/null'"};
};

struct SandboxHandle {
  std::string id;
  std::string node;
  std::string ssh_target;
};

struct ExecRequest {
  std::string shell_command;
  std::chrono::milliseconds soft_timeout{0};
  std::chrono::milliseconds hard_timeout{0};
  std::string log_path;
  std::function<void(const std::string&)> on_line;
  std::function<void()> on_soft_timeout;
};

struct ExecResult {
  int exit_status{0};
  std::string output;                     // bounded tail
  bool output_truncated{false};
  bool timed_out{false};
  bool soft_timeout_fired{false};
  uint64_t duration_ms{0};
};

class RemoteSandbox {
 public:
  virtual ~RemoteSandbox() = default;

  // Throws SandboxError when the container cannot be started.
  virtual SandboxHandle start(const ContainerSpec& spec) = 0;

  // Throws SandboxError on transport failures. Timeouts and non-zero exits
  // are reported in ExecResult, not thrown.
  virtual ExecResult exec_and_wait(const SandboxHandle& handle, const ExecRequest& req) = 0;

  // Throws SandboxError when the container cannot be removed.
  virtual void stop(const SandboxHandle& handle) = 0;
};

// ---------------------------------------------------------------------------
// DockerSandbox - docker CLI, optionally wrapped in ssh.
// ---------------------------------------------------------------------------
class DockerSandbox : public RemoteSandbox {
 public:
  explicit DockerSandbox(std::string docker_binary = "docker",
                         std::chrono::milliseconds control_timeout = std::chrono::seconds(120));

  SandboxHandle start(const ContainerSpec& spec) override;
  ExecResult exec_and_wait(const SandboxHandle& handle, const ExecRequest& req) override;
  void stop(const SandboxHandle& handle) override;

  // The shell command line `start` runs, exposed for diagnostics and tests.
  std::string run_command_line(const ContainerSpec& spec) const;

 private:
  std::string docker_;
  std::chrono::milliseconds control_timeout_;
};

// ---------------------------------------------------------------------------
// ScopedContext - exclusively owned running container.
// ---------------------------------------------------------------------------
class ScopedContext {
 public:
  ScopedContext(RemoteSandbox& sandbox, SandboxHandle handle, std::string marker);
  ~ScopedContext();

  ScopedContext(ScopedContext&& other) noexcept;
  ScopedContext& operator=(ScopedContext&& other) noexcept;
  ScopedContext(const ScopedContext&) = delete;
  ScopedContext& operator=(const ScopedContext&) = delete;

  RemoteSandbox& sandbox() const { return *sandbox_; }
  const SandboxHandle& handle() const { return handle_; }
  const std::string& marker() const { return marker_; }
  bool released() const { return sandbox_ == nullptr; }

  // Stops the container now. Later calls and the destructor are no-ops.
  // Stop failures are logged; they cannot change the invocation outcome.
  void release() noexcept;

 private:
  RemoteSandbox* sandbox_;
  SandboxHandle handle_;
  std::string marker_;
};

using ProvisionOutcome = std::variant<ScopedContext, ExecutionFailure>;

class Provisioner {
 public:
  Provisioner(RemoteSandbox& sandbox, std::string image);

  // Starts the idle container bound to `loader`. A start failure becomes
  // ExecutionFailure{provisioning_failed} carrying the collaborator's
  // exception as cause.
  ProvisionOutcome acquire(const LoaderNode& loader,
                           std::optional<uint32_t> cpu_affinity,
                           const std::string& marker) const;

 private:
  RemoteSandbox& sandbox_;
  std::string image_;
};

}  // namespace stressrig
