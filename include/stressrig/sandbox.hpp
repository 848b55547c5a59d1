#pragma once

// stressrig/sandbox.hpp - Local process execution with two timeout tiers.
//
// run_process() forks the command in its own process group and pumps its
// combined stdout/stderr:
//   - appended to ProcessSpec::log_path as it arrives (never buffered whole),
//   - split into lines for ProcessSpec::on_line,
//   - kept as a bounded tail in ProcessResult::output_tail.
//
// TIMEOUTS:
//   soft_timeout_ms  cooperative checkpoint: on_soft_timeout fires once and
//                    the process keeps running.
//   timeout_ms       hard bound: the whole process group gets SIGKILL and
//                    exit_code is 124.
//   0 disables either tier.
//
// Every other container / remote transport in stressrig is built on this.

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace stressrig {

struct ProcessSpec {
  std::string command;                       // resolved through PATH when it has no '/'
  std::vector<std::string> argv;             // arguments after argv[0]
  std::map<std::string, std::string> env;    // added to the inherited environment
  std::string cwd;
  std::uint64_t timeout_ms{5000};
  std::uint64_t soft_timeout_ms{0};
  std::size_t max_output_bytes{64 * 1024};
  std::string log_path;                      // empty: output is not persisted
  std::function<void(const std::string&)> on_line;
  std::function<void()> on_soft_timeout;
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool soft_timeout_fired{false};
  bool output_truncated{false};
  bool spawn_failed{false};
  std::string output_tail;
  std::string error_message;
  std::uint64_t duration_ms{0};
};

ProcessResult run_process(const ProcessSpec& spec);

// Quotes `s` for a POSIX shell: wraps in single quotes, escaping embedded ones.
std::string shell_quote(const std::string& s);

}  // namespace stressrig
