#pragma once

// stressrig/reporter.hpp - Turns a Runner outcome into exactly one event.

#include <optional>
#include <string>

#include "stressrig/observability.hpp"
#include "stressrig/types.hpp"

namespace stressrig {

struct InvocationReport {
  std::optional<RunResult> result;  // empty on failure
  StressEvent event;
};

class Reporter {
 public:
  // Failures are CRITICAL when the test should stop on them, ERROR otherwise.
  explicit Reporter(bool stop_test_on_failure) : stop_test_on_failure_(stop_test_on_failure) {}

  // Records the outcome on `scope` and publishes it. The failure's cause is
  // kept as thrown.
  InvocationReport report(const Outcome& outcome, StressEventScope& scope) const;

  EventSeverity failure_severity() const {
    return stop_test_on_failure_ ? EventSeverity::critical : EventSeverity::error;
  }

 private:
  bool stop_test_on_failure_;
};

}  // namespace stressrig
