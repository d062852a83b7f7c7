#ifndef ABSINT_ENGINE_TERM_HPP
#define ABSINT_ENGINE_TERM_HPP

#include "abstract/module.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace absint {

namespace detail {
  template <typename Term>
  struct subterm_probe {
    void
    operator () (Term const&) const { }
  };
}

// A syntax tree type the evaluator can fold over. Each front-end supplies one;
// visit_subterms calls its argument on every immediate child, in order. The
// children passed must be owned by the term and outlive it; the evaluator keeps
// references to them.
template <typename Term>
concept recursive_term = requires (Term const& t) {
  t.visit_subterms(detail::subterm_probe<Term>{});
};

template <typename Term, typename F>
void
for_each_subterm(Term const& t, F&& f) {
  t.visit_subterms(std::forward<F>(f));
}

// A term together with the deferred computation of its value. The computation
// is run the first time the value is forced; later forcings, including through
// copies of this subterm, return the remembered value.
template <typename Term, typename Value>
class subterm {
public:
  subterm(Term const& term, std::function<Value()> compute)
    : term_{&term}
    , state_{std::make_shared<deferred>(std::move(compute))}
  { }

  Term const&
  term() const { return *term_; }

  Value const&
  value() const {
    if (!state_->value)
      state_->value.emplace(state_->compute());
    return *state_->value;
  }

  bool
  forced() const { return state_->value.has_value(); }

private:
  struct deferred {
    std::function<Value()> compute;
    std::optional<Value>   value;

    explicit
    deferred(std::function<Value()> c) : compute{std::move(c)} { }
  };

  Term const*               term_;
  std::shared_ptr<deferred> state_;
};

// One level of a term: the node itself and its immediate children, each
// paired with its deferred value.
template <typename Term, typename Value>
struct term_node {
  Term const&                       term;
  std::vector<subterm<Term, Value>> children;

  subterm<Term, Value> const&
  child(std::size_t i) const { return children.at(i); }

  std::size_t
  size() const { return children.size(); }
};

// A module whose body is exposed as a subterm, so that the module algebra can
// act before and after the body is evaluated.
template <typename Term, typename Value>
struct module_node {
  module_<Term> const& source;
  subterm<Term, Value> body;
};

} // namespace absint

#endif
