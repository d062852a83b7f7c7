#ifndef ABSINT_ENGINE_ANALYSIS_HPP
#define ABSINT_ENGINE_ANALYSIS_HPP

#include "abstract/address.hpp"
#include "abstract/live.hpp"
#include "engine/term.hpp"

#include <functional>

namespace absint {

template <typename Term, typename Value>
class evaluator;

// An evaluation strategy: the algebra applied at every term node and at every
// module, over some value domain.
//
// analyze_term and analyze_module should only be called by the evaluator and by
// composite analyses, through lifted_analysis. Everything else evaluates terms
// with evaluator::evaluate_term and modules with evaluator::evaluate_module.
template <typename Term, typename Value>
class analysis {
public:
  using evaluator_type   = evaluator<Term, Value>;
  using node_type        = term_node<Term, Value>;
  using module_node_type = module_node<Term, Value>;
  using address_type     = location_for<Value>;

  virtual
  ~analysis() = default;

  // Compute the value of one node. Children are evaluated by forcing the
  // subterms in the node; a child that is never forced is never evaluated.
  virtual Value
  analyze_term(evaluator_type&, node_type const&) = 0;

  virtual Value
  analyze_module(evaluator_type&, module_node_type const&) = 0;

  // Run an action with an empty global environment and export set, restoring
  // both afterwards.
  virtual void
  isolate(evaluator_type& ev, std::function<void()> const& action) {
    ev.run_isolated(action);
  }

  // Addresses reachable from the current point of evaluation.
  virtual live<address_type>
  ask_roots(evaluator_type const&) { return {}; }
};

// The way a composite analysis reaches the algebras of the analysis it wraps.
// Calling through the adapter runs the inner analysis's semantics for the
// given node only: the node's children remain deferred to the evaluator, so
// they are still evaluated by the outermost analysis.
template <typename Term, typename Value>
class lifted_analysis {
public:
  using analysis_type = analysis<Term, Value>;

  explicit
  lifted_analysis(analysis_type& inner) : inner_{inner} { }

  Value
  analyze_term(typename analysis_type::evaluator_type& ev,
               typename analysis_type::node_type const& node) const {
    return inner_.analyze_term(ev, node);
  }

  Value
  analyze_module(typename analysis_type::evaluator_type& ev,
                 typename analysis_type::module_node_type const& m) const {
    return inner_.analyze_module(ev, m);
  }

  analysis_type&
  inner() const { return inner_; }

private:
  analysis_type& inner_;
};

template <typename Term, typename Value>
lifted_analysis<Term, Value>
lift_analyze(analysis<Term, Value>& inner) {
  return lifted_analysis<Term, Value>{inner};
}

// Base for analyses that wrap another one. Every operation is delegated to the
// inner analysis unless overridden.
template <typename Term, typename Value>
class analysis_layer : public analysis<Term, Value> {
public:
  using base = analysis<Term, Value>;
  using typename base::evaluator_type;
  using typename base::node_type;
  using typename base::module_node_type;
  using typename base::address_type;

  explicit
  analysis_layer(base& inner) : lift_{inner} { }

  Value
  analyze_term(evaluator_type& ev, node_type const& node) override {
    return lift_.analyze_term(ev, node);
  }

  Value
  analyze_module(evaluator_type& ev, module_node_type const& m) override {
    return lift_.analyze_module(ev, m);
  }

  void
  isolate(evaluator_type& ev, std::function<void()> const& action) override {
    lift_.inner().isolate(ev, action);
  }

  live<address_type>
  ask_roots(evaluator_type const& ev) override {
    return lift_.inner().ask_roots(ev);
  }

protected:
  lifted_analysis<Term, Value> const&
  lift() const { return lift_; }

private:
  lifted_analysis<Term, Value> lift_;
};

} // namespace absint

#endif
