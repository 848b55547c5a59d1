#include "stressrig/sandbox.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>

extern char** environ;

namespace stressrig {

namespace {

// Keeps the last `limit` bytes of the stream.
void append_tail(std::string& dst, const char* src, std::size_t n,
                 std::size_t limit, bool& truncated) {
  dst.append(src, n);
  if (dst.size() > limit) {
    dst.erase(0, dst.size() - limit);
    truncated = true;
  }
}

void write_all(int fd, const char* data, std::size_t n) {
  while (n > 0) {
    const ssize_t w = ::write(fd, data, n);
    if (w < 0) {
      if (errno == EINTR) continue;
      return;
    }
    data += w;
    n -= static_cast<std::size_t>(w);
  }
}

struct LineSplitter {
  const std::function<void(const std::string&)>& sink;
  std::string pending;

  void feed(const char* data, std::size_t n) {
    if (!sink) return;
    pending.append(data, n);
    std::size_t start = 0;
    while (true) {
      const std::size_t nl = pending.find('\n', start);
      if (nl == std::string::npos) break;
      std::size_t end = nl;
      if (end > start && pending[end - 1] == '\r') --end;
      sink(pending.substr(start, end - start));
      start = nl + 1;
    }
    pending.erase(0, start);
  }

  void flush() {
    if (sink && !pending.empty()) sink(pending);
    pending.clear();
  }
};

}  // namespace

ProcessResult run_process(const ProcessSpec& spec) {
  using Clock = std::chrono::steady_clock;
  ProcessResult result;
  const auto started = Clock::now();

  int log_fd = -1;
  if (!spec.log_path.empty()) {
    log_fd = ::open(spec.log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (log_fd < 0) {
      result.spawn_failed = true;
      result.exit_code = 127;
      result.error_message = "cannot open log file " + spec.log_path + ": " + std::strerror(errno);
      return result;
    }
  }

  int out_pipe[2];
  if (::pipe(out_pipe) != 0) {
    if (log_fd >= 0) ::close(log_fd);
    result.spawn_failed = true;
    result.exit_code = 127;
    result.error_message = "spawn_failed: pipe";
    return result;
  }

  // argv/envp are built before fork so the child only calls async-signal-safe
  // functions.
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all) argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs;
  for (char** e = environ; e && *e; ++e) {
    const std::string kv(*e);
    const auto eq = kv.find('=');
    if (eq != std::string::npos && spec.env.count(kv.substr(0, eq))) continue;
    envs.push_back(kv);
  }
  for (const auto& [k, v] : spec.env) envs.push_back(k + "=" + v);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs) envp.push_back(e.data());
  envp.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    if (log_fd >= 0) ::close(log_fd);
    result.spawn_failed = true;
    result.exit_code = 127;
    result.error_message = "spawn_failed: fork";
    return result;
  }

  if (pid == 0) {
    ::setsid();
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(out_pipe[1], STDERR_FILENO);
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) _exit(127);
    environ = envp.data();
    ::execvp(argv[0], argv.data());
    _exit(127);
  }

  ::close(out_pipe[1]);

  const auto hard_deadline = started + std::chrono::milliseconds(spec.timeout_ms);
  const auto soft_deadline = started + std::chrono::milliseconds(spec.soft_timeout_ms);
  LineSplitter lines{spec.on_line, {}};
  char buf[4096];
  int status = 0;
  bool exited = false;
  bool eof = false;

  while (!exited) {
    if (!eof) {
      pollfd pfd{out_pipe[0], POLLIN, 0};
      const int pr = ::poll(&pfd, 1, 20);
      if (pr > 0) {
        const ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
        if (n > 0) {
          if (log_fd >= 0) write_all(log_fd, buf, static_cast<std::size_t>(n));
          lines.feed(buf, static_cast<std::size_t>(n));
          append_tail(result.output_tail, buf, static_cast<std::size_t>(n),
                      spec.max_output_bytes, result.output_truncated);
        } else if (n == 0) {
          eof = true;
        }
      }
    } else {
      ::usleep(20 * 1000);
    }

    const pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid) {
      exited = true;
      break;
    }

    const auto now = Clock::now();
    if (spec.soft_timeout_ms > 0 && !result.soft_timeout_fired && now >= soft_deadline) {
      result.soft_timeout_fired = true;
      if (spec.on_soft_timeout) spec.on_soft_timeout();
    }
    if (spec.timeout_ms > 0 && now >= hard_deadline) {
      ::kill(-pid, SIGKILL);
      ::kill(pid, SIGKILL);
      ::waitpid(pid, &status, 0);
      result.timed_out = true;
      exited = true;
    }
  }

  // Drain whatever the child wrote before exiting. Grandchildren that
  // inherited the pipe were killed with the group on timeout; on a normal
  // exit the read end is non-blocking so a lingering writer cannot stall us.
  ::fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  while (true) {
    const ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
    if (n <= 0) break;
    if (log_fd >= 0) write_all(log_fd, buf, static_cast<std::size_t>(n));
    lines.feed(buf, static_cast<std::size_t>(n));
    append_tail(result.output_tail, buf, static_cast<std::size_t>(n),
                spec.max_output_bytes, result.output_truncated);
  }
  lines.flush();
  ::close(out_pipe[0]);
  if (log_fd >= 0) ::close(log_fd);

  result.duration_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count());

  if (result.timed_out) {
    result.exit_code = 124;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

std::string shell_quote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') out += "'\\''";
    else out += c;
  }
  out += '\'';
  return out;
}

}  // namespace stressrig
