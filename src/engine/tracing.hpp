#ifndef ABSINT_ENGINE_TRACING_HPP
#define ABSINT_ENGINE_TRACING_HPP

#include "abstract/configuration.hpp"
#include "engine/analysis.hpp"
#include "engine/evaluator.hpp"

#include <cstddef>
#include <map>
#include <vector>

namespace absint {

// Records the configuration in which each term is evaluated, in evaluation
// order, then evaluates the term with the wrapped analysis.
template <typename Term, typename Value>
class tracing_analysis : public analysis_layer<Term, Value> {
public:
  using layer = analysis_layer<Term, Value>;
  using typename layer::evaluator_type;
  using typename layer::node_type;

  using layer::layer;

  Value
  analyze_term(evaluator_type& ev, node_type const& node) override {
    trace_.push_back(ev.get_configuration(node.term));
    return this->lift().analyze_term(ev, node);
  }

  std::vector<configuration<Term, Value>> const&
  trace() const { return trace_; }

  bool
  visited(Term const& t) const {
    for (auto const& c : trace_)
      if (c.term == &t)
        return true;
    return false;
  }

private:
  std::vector<configuration<Term, Value>> trace_;
};

// Counts how often each term node is analysed.
template <typename Term, typename Value>
class counting_analysis : public analysis_layer<Term, Value> {
public:
  using layer = analysis_layer<Term, Value>;
  using typename layer::evaluator_type;
  using typename layer::node_type;

  using layer::layer;

  Value
  analyze_term(evaluator_type& ev, node_type const& node) override {
    ++visits_[&node.term];
    ++total_;
    return this->lift().analyze_term(ev, node);
  }

  std::size_t
  visits(Term const& t) const {
    if (auto it = visits_.find(&t); it != visits_.end())
      return it->second;
    else
      return 0;
  }

  std::size_t
  total() const { return total_; }

private:
  std::map<Term const*, std::size_t> visits_;
  std::size_t                        total_ = 0;
};

} // namespace absint

#endif
