#ifndef ABSINT_ENGINE_RUN_HPP
#define ABSINT_ENGINE_RUN_HPP

#include "engine/analysis.hpp"
#include "engine/evaluation_config.hpp"
#include "engine/evaluator.hpp"

#include <concepts>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace absint {

// Outcome of one analysis run: the final value, or the failure that ended the
// run, together with the state the run ended in.
template <typename Term, typename Value>
struct run_result {
  std::optional<Value>          result;
  std::exception_ptr            error;
  std::string                   action_backtrace;
  evaluator_state<Term, Value>  state;

  bool
  succeeded() const { return !error; }

  // The final value; rethrows the failure if the run failed.
  Value const&
  value() const {
    if (error)
      std::rethrow_exception(error);
    return *result;
  }

  // Empty if the run succeeded.
  std::string
  error_message() const {
    if (!error)
      return {};

    std::string message;
    try {
      std::rethrow_exception(error);
    } catch (std::exception const& e) {
      message = e.what();
    } catch (...) {
      message = "Unknown error";
    }

    if (!action_backtrace.empty())
      message += "\n" + action_backtrace;
    return message;
  }
};

// Run an action, given the evaluator, to completion. Any failure ends the run
// and is reported in the result rather than thrown.
template <typename Term, typename Value, typename Action>
  requires std::invocable<Action&, evaluator<Term, Value>&>
run_result<Term, Value>
run_analysis(analysis<Term, Value>& a, evaluation_config const& config,
             Action&& action) {
  evaluator<Term, Value> ev{a, config};
  run_result<Term, Value> result;

  try {
    result.result.emplace(action(ev));
  } catch (...) {
    result.error = std::current_exception();
  }

  result.action_backtrace = ev.action_backtrace();
  result.state = std::move(ev.state());
  return result;
}

// Evaluate a program made of the given modules, the first one being the entry
// point.
template <typename Term, typename Value>
run_result<Term, Value>
run_analysis(analysis<Term, Value>& a, evaluation_config const& config,
             std::vector<module_<Term>> const& modules) {
  return run_analysis(a, config, [&] (evaluator<Term, Value>& ev) {
    return ev.evaluate_modules(modules);
  });
}

} // namespace absint

#endif
