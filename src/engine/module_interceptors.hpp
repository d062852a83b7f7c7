#ifndef ABSINT_ENGINE_MODULE_INTERCEPTORS_HPP
#define ABSINT_ENGINE_MODULE_INTERCEPTORS_HPP

#include "abstract/module.hpp"
#include "engine/module_signal.hpp"

#include <cstddef>
#include <map>
#include <utility>
#include <vector>

namespace absint {

// Counts how many times each module is evaluated, then lets the evaluation
// proceed.
template <typename Term, typename Value>
class module_evaluation_counter final
  : public module_evaluation_handler<Term, Value>
{
public:
  using base = module_evaluation_handler<Term, Value>;

  Value
  handle(typename base::evaluator_type&, module_<Term> const& m,
         typename base::continuation const& next) override {
    ++counts_[m.name];
    order_.push_back(m.name);
    return next(m);
  }

  std::size_t
  count(module_name const& name) const {
    if (auto it = counts_.find(name); it != counts_.end())
      return it->second;
    else
      return 0;
  }

  std::size_t
  total() const { return order_.size(); }

  // Module names in the order their evaluations started.
  std::vector<module_name> const&
  order() const { return order_; }

private:
  std::map<module_name, std::size_t> counts_;
  std::vector<module_name>           order_;
};

// Answers the signal for selected modules with a fixed value instead of
// evaluating them. Substituted modules define and export nothing.
template <typename Term, typename Value>
class module_substitution final : public module_evaluation_handler<Term, Value> {
public:
  using base = module_evaluation_handler<Term, Value>;

  void
  substitute(module_name const& name, Value v) {
    substitutes_.insert_or_assign(name, std::move(v));
  }

  Value
  handle(typename base::evaluator_type&, module_<Term> const& m,
         typename base::continuation const& next) override {
    if (auto it = substitutes_.find(m.name); it != substitutes_.end())
      return it->second;
    else
      return next(m);
  }

private:
  std::map<module_name, Value> substitutes_;
};

} // namespace absint

#endif
