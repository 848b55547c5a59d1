#include "stressrig/runner.hpp"

#include "stressrig/log.hpp"
#include "stressrig/metrics.hpp"

namespace stressrig {

Outcome Runner::run(ScopedContext& ctx, const std::string& command, const TimeoutPolicy& policy,
                    const std::string& log_path, const RunHooks& hooks) const {
  ExecRequest req;
  req.shell_command = command;
  req.soft_timeout = policy.soft();
  req.hard_timeout = policy.hard();
  req.log_path = log_path;
  req.on_line = hooks.on_line;
  req.on_soft_timeout = [&] {
    Logger::warning("runner", "soft timeout of " + std::to_string(policy.soft().count()) +
                                  "ms reached in container " + ctx.handle().id +
                                  ", still waiting up to " +
                                  std::to_string(policy.hard().count()) + "ms");
    if (hooks.on_soft_timeout) hooks.on_soft_timeout();
  };

  ExecResult r;
  try {
    r = ctx.sandbox().exec_and_wait(ctx.handle(), req);
  } catch (...) {
    ExecutionFailure f;
    f.code = ErrorCode::execution_error;
    f.cause = std::current_exception();
    f.message = "stress command failed in container " + ctx.handle().id + ": " + describe(f.cause);
    f.log_file = log_path;
    return f;
  }

  if (r.timed_out) {
    ExecutionFailure f;
    f.code = ErrorCode::execution_timeout;
    f.message = "stress command exceeded hard timeout of " +
                std::to_string(policy.hard().count()) + "ms and was killed";
    f.cause = std::make_exception_ptr(StressError(f.code, f.message));
    f.exit_code = r.exit_status;
    f.duration_ms = r.duration_ms;
    f.log_file = log_path;
    return f;
  }

  if (r.exit_status != 0) {
    ExecutionFailure f;
    f.code = ErrorCode::unexpected_exit;
    f.message = "stress command exited with status " + std::to_string(r.exit_status);
    f.cause = std::make_exception_ptr(StressError(f.code, f.message));
    f.exit_code = r.exit_status;
    f.duration_ms = r.duration_ms;
    f.log_file = log_path;
    return f;
  }

  RunResult ok;
  ok.exit_code = r.exit_status;
  ok.output_tail = std::move(r.output);
  ok.output_truncated = r.output_truncated;
  ok.log_file = log_path;
  ok.duration_ms = r.duration_ms;
  ok.soft_timeout_exceeded = r.soft_timeout_fired;
  ok.summary = parse_stress_summary(ok.output_tail);
  return ok;
}

}  // namespace stressrig
