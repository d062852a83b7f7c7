#ifndef ABSINT_ENGINE_MODULE_SIGNAL_HPP
#define ABSINT_ENGINE_MODULE_SIGNAL_HPP

#include "abstract/module.hpp"

#include <functional>

namespace absint {

template <typename Term, typename Value>
class evaluator;

// Receiver of the module evaluation signal. Raising the signal suspends the
// raiser until a handler resumes it with the module's value.
//
// Handlers form a chain. The most recently installed handler receives the
// signal first and may answer it itself, or pass it on by calling `next`. The
// evaluator's own handler, at the end of the chain, evaluates the module.
template <typename Term, typename Value>
class module_evaluation_handler {
public:
  using evaluator_type = evaluator<Term, Value>;
  using continuation   = std::function<Value(module_<Term> const&)>;

  virtual
  ~module_evaluation_handler() = default;

  virtual Value
  handle(evaluator_type&, module_<Term> const&, continuation const& next) = 0;
};

} // namespace absint

#endif
