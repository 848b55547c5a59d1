#include "stressrig/reporter.hpp"

#include <type_traits>
#include <variant>

namespace stressrig {

InvocationReport Reporter::report(const Outcome& outcome, StressEventScope& scope) const {
  InvocationReport report;
  std::visit(
      [&](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, RunResult>) {
          scope.record_success(o);
          report.result = o;
        } else {
          scope.record_failure(o, failure_severity());
        }
      },
      outcome);
  report.event = scope.publish();
  return report;
}

}  // namespace stressrig
