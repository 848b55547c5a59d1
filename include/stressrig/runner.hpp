#pragma once

// stressrig/runner.hpp - Runs a translated command inside a ScopedContext.
//
// run() never throws. Transport exceptions, hard timeouts and non-zero exits
// all come back as ExecutionFailure with the original exception attached as
// cause; a clean exit comes back as RunResult.
//
// The soft timeout is a checkpoint only: hooks.on_soft_timeout fires and the
// process keeps running until it exits or the hard timeout kills it.

#include <functional>
#include <string>

#include "stressrig/container.hpp"
#include "stressrig/types.hpp"

namespace stressrig {

struct RunHooks {
  std::function<void(const std::string&)> on_line;
  std::function<void()> on_soft_timeout;
};

class Runner {
 public:
  Outcome run(ScopedContext& ctx, const std::string& command, const TimeoutPolicy& policy,
              const std::string& log_path, const RunHooks& hooks = {}) const;
};

}  // namespace stressrig
