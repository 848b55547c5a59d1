#include "stressrig/container.hpp"

#include <sstream>
#include <utility>

#include "stressrig/log.hpp"
#include "stressrig/sandbox.hpp"

namespace stressrig {

namespace {

// Runs `shell_cmd` through /bin/sh locally, or through ssh on the target.
ProcessSpec control_spec(const std::string& ssh_target, const std::string& shell_cmd,
                         std::chrono::milliseconds timeout) {
  ProcessSpec spec;
  if (ssh_target.empty()) {
    spec.command = "/bin/sh";
    spec.argv = {"-c", shell_cmd};
  } else {
    spec.command = "ssh";
    spec.argv = {"-o", "BatchMode=yes", ssh_target, shell_cmd};
  }
  spec.timeout_ms = static_cast<std::uint64_t>(timeout.count());
  return spec;
}

std::string last_non_empty_line(const std::string& text) {
  std::istringstream in(text);
  std::string line;
  std::string last;
  while (std::getline(in, line)) {
    const auto b = line.find_first_not_of(" \t\r");
    if (b == std::string::npos) continue;
    const auto e = line.find_last_not_of(" \t\r");
    last = line.substr(b, e - b + 1);
  }
  return last;
}

std::string where(const SandboxHandle& h) {
  return h.ssh_target.empty() ? h.node : h.node + " (" + h.ssh_target + ")";
}

}  // namespace

// ---------------------------------------------------------------------------
// DockerSandbox
// ---------------------------------------------------------------------------

DockerSandbox::DockerSandbox(std::string docker_binary,
                             std::chrono::milliseconds control_timeout)
    : docker_(std::move(docker_binary)), control_timeout_(control_timeout) {}

std::string DockerSandbox::run_command_line(const ContainerSpec& spec) const {
  std::string cmd = docker_ + " run -d";
  if (spec.cpuset) cmd += " --cpuset-cpus=\"" + std::to_string(*spec.cpuset) + "\"";
  cmd += " --network=" + spec.network_mode;
  for (const auto& [k, v] : spec.labels) cmd += " --label " + shell_quote(k + "=" + v);
  if (!spec.entrypoint.empty()) cmd += " --entrypoint " + spec.entrypoint;
  cmd += " " + spec.image;
  if (!spec.command_line.empty()) cmd += " " + spec.command_line;
  return cmd;
}

SandboxHandle DockerSandbox::start(const ContainerSpec& spec) {
  const std::string cmd = run_command_line(spec);
  Logger::debug("docker", "starting container on " + spec.node + ": " + cmd);
  const ProcessResult r = run_process(control_spec(spec.ssh_target, cmd, control_timeout_));
  if (r.spawn_failed) {
    throw SandboxError("cannot launch docker for " + spec.node + ": " + r.error_message);
  }
  if (r.timed_out) {
    throw SandboxError("docker run on " + spec.node + " timed out");
  }
  if (r.exit_code != 0) {
    throw SandboxError("docker run on " + spec.node + " failed (exit " +
                       std::to_string(r.exit_code) + "): " + last_non_empty_line(r.output_tail));
  }
  SandboxHandle h;
  h.id = last_non_empty_line(r.output_tail);
  h.node = spec.node;
  h.ssh_target = spec.ssh_target;
  if (h.id.empty()) {
    throw SandboxError("docker run on " + spec.node + " returned no container id");
  }
  return h;
}

ExecResult DockerSandbox::exec_and_wait(const SandboxHandle& handle, const ExecRequest& req) {
  const std::string cmd =
      docker_ + " exec " + handle.id + " /bin/bash -c " + shell_quote(req.shell_command);
  ProcessSpec spec = control_spec(handle.ssh_target, cmd, req.hard_timeout);
  spec.soft_timeout_ms = static_cast<std::uint64_t>(req.soft_timeout.count());
  spec.log_path = req.log_path;
  spec.on_line = req.on_line;
  spec.on_soft_timeout = req.on_soft_timeout;

  const ProcessResult r = run_process(spec);
  if (r.spawn_failed) {
    throw SandboxError("cannot exec in container " + handle.id + " on " + where(handle) +
                       ": " + r.error_message);
  }

  if (r.timed_out) {
    // The local client is gone; make sure the remote process is too.
    const ProcessResult k = run_process(
        control_spec(handle.ssh_target, docker_ + " kill " + handle.id, control_timeout_));
    if (k.exit_code != 0) {
      Logger::warning("docker", "kill of timed out container " + handle.id + " on " +
                                    where(handle) + " failed: " +
                                    last_non_empty_line(k.output_tail));
    }
  }

  ExecResult out;
  out.exit_status = r.exit_code;
  out.output = r.output_tail;
  out.output_truncated = r.output_truncated;
  out.timed_out = r.timed_out;
  out.soft_timeout_fired = r.soft_timeout_fired;
  out.duration_ms = r.duration_ms;
  return out;
}

void DockerSandbox::stop(const SandboxHandle& handle) {
  const ProcessResult r = run_process(
      control_spec(handle.ssh_target, docker_ + " rm -f " + handle.id, control_timeout_));
  if (r.spawn_failed || r.timed_out || r.exit_code != 0) {
    throw SandboxError("docker rm -f " + handle.id + " on " + where(handle) + " failed: " +
                       (r.spawn_failed ? r.error_message : last_non_empty_line(r.output_tail)));
  }
  Logger::debug("docker", "removed container " + handle.id + " on " + where(handle));
}

// ---------------------------------------------------------------------------
// ScopedContext
// ---------------------------------------------------------------------------

ScopedContext::ScopedContext(RemoteSandbox& sandbox, SandboxHandle handle, std::string marker)
    : sandbox_(&sandbox), handle_(std::move(handle)), marker_(std::move(marker)) {}

ScopedContext::~ScopedContext() { release(); }

ScopedContext::ScopedContext(ScopedContext&& other) noexcept
    : sandbox_(std::exchange(other.sandbox_, nullptr)),
      handle_(std::move(other.handle_)),
      marker_(std::move(other.marker_)) {}

ScopedContext& ScopedContext::operator=(ScopedContext&& other) noexcept {
  if (this != &other) {
    release();
    sandbox_ = std::exchange(other.sandbox_, nullptr);
    handle_ = std::move(other.handle_);
    marker_ = std::move(other.marker_);
  }
  return *this;
}

void ScopedContext::release() noexcept {
  RemoteSandbox* sb = std::exchange(sandbox_, nullptr);
  if (!sb) return;
  try {
    sb->stop(handle_);
  } catch (const std::exception& e) {
    Logger::error("provisioner", "failed to stop container " + handle_.id + ": " + e.what());
  } catch (...) {
    Logger::error("provisioner", "failed to stop container " + handle_.id +
                                     ": non-standard exception");
  }
}

// ---------------------------------------------------------------------------
// Provisioner
// ---------------------------------------------------------------------------

Provisioner::Provisioner(RemoteSandbox& sandbox, std::string image)
    : sandbox_(sandbox), image_(std::move(image)) {}

ProvisionOutcome Provisioner::acquire(const LoaderNode& loader,
                                      std::optional<uint32_t> cpu_affinity,
                                      const std::string& marker) const {
  ContainerSpec spec;
  spec.node = loader.name;
  spec.ssh_target = loader.ssh_target;
  spec.image = image_;
  spec.cpuset = cpu_affinity;
  spec.labels["shell_marker"] = marker;

  try {
    SandboxHandle handle = sandbox_.start(spec);
    return ScopedContext(sandbox_, std::move(handle), marker);
  } catch (...) {
    ExecutionFailure f;
    f.code = ErrorCode::provisioning_failed;
    f.cause = std::current_exception();
    f.message = "cannot start stress container on " + loader.name + ": " + describe(f.cause);
    return f;
  }
}

}  // namespace stressrig
