#ifndef ABSINT_LANG_CORE_SEMANTICS_HPP
#define ABSINT_LANG_CORE_SEMANTICS_HPP

#include "engine/analysis.hpp"
#include "engine/error.hpp"
#include "engine/evaluator.hpp"
#include "lang/core_term.hpp"
#include "lang/values.hpp"

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>

namespace absint {

// A value domain the core language can be evaluated over.
template <typename Value>
concept core_domain = requires (Value const& v, std::int64_t i) {
  typename Value::location_type;
  { Value::unit() } -> std::same_as<Value>;
  { Value::from_integer(i) } -> std::same_as<Value>;
  { add(v, v) } -> std::same_as<Value>;
  { subtract(v, v) } -> std::same_as<Value>;
  { truthiness(v) } -> std::same_as<std::optional<bool>>;
  { join(v, v) } -> std::same_as<Value>;
  { show(v) } -> std::same_as<std::string>;
};

// The base analysis of the core language.
template <core_domain Value>
class core_semantics : public analysis<core_term, Value> {
public:
  using base = analysis<core_term, Value>;
  using typename base::evaluator_type;
  using typename base::node_type;
  using typename base::module_node_type;
  using typename base::address_type;

  Value
  analyze_term(evaluator_type& ev, node_type const& node) override {
    core_term const& t = node.term;
    switch (t.get_kind()) {
    case core_term::kind::program:
    case core_term::kind::begin:
      return sequence(node);

    case core_term::kind::integer:
      return Value::from_integer(t.integer_value());

    case core_term::kind::reference:
      return dereference(ev, t);

    case core_term::kind::define: {
      address_type a = ev.allocate(t.atom());
      Value v = node.child(0).value();
      ev.modify_store([&] (auto const& s) {
        auto result = s;
        result.insert(a, v);
        return result;
      });
      ev.modify_global_environment([&] (auto const& env) {
        auto result = env;
        result.insert(t.atom(), a);
        return result;
      });
      return Value::unit();
    }

    case core_term::kind::export_:
      ev.add_export(t.exported_name(), t.atom(), ev.lookup_address(t.atom()));
      return Value::unit();

    case core_term::kind::import_: {
      auto imported = ev.import_module(t.atom());
      ev.modify_global_environment([&] (auto const& env) {
        return env.merge(imported, merge_policy::last_wins);
      });
      return Value::unit();
    }

    case core_term::kind::let: {
      address_type a = ev.allocate(t.atom());
      Value v = node.child(0).value();
      ev.modify_store([&] (auto const& s) {
        auto result = s;
        result.insert(a, v);
        return result;
      });
      return ev.with_local_environment(
        [&] (auto const& env) {
          auto result = env;
          result.push();
          result.insert(t.atom(), a);
          return result;
        },
        [&] { return node.child(1).value(); }
      );
    }

    // Operands are forced left to right; either may define or import.
    case core_term::kind::add: {
      Value lhs = node.child(0).value();
      Value rhs = node.child(1).value();
      return add(lhs, rhs);
    }

    case core_term::kind::subtract: {
      Value lhs = node.child(0).value();
      Value rhs = node.child(1).value();
      return subtract(lhs, rhs);
    }

    case core_term::kind::if_: {
      std::optional<bool> condition = truthiness(node.child(0).value());
      if (!condition) {
        Value consequent = node.child(1).value();
        Value alternative = node.child(2).value();
        return join(consequent, alternative);
      }
      else if (*condition)
        return node.child(1).value();
      else
        return node.child(2).value();
    }
    }

    throw make_error<evaluation_error>("{}: Invalid term",
                                       format_location(t.location()));
  }

  // Top-level names of a module body live in a frame of their own.
  Value
  analyze_module(evaluator_type& ev, module_node_type const& m) override {
    return ev.with_local_environment(
      [] (auto const& env) {
        auto result = env;
        result.push();
        return result;
      },
      [&] { return m.body.value(); }
    );
  }

  live<address_type>
  ask_roots(evaluator_type const& ev) override {
    return ev.global_environment().roots().united(
      ev.local_environment().roots()
    );
  }

private:
  static Value
  sequence(node_type const& node) {
    std::optional<Value> last;
    for (auto const& child : node.children)
      last = child.value();
    return last ? *last : Value::unit();
  }

  static Value
  dereference(evaluator_type& ev, core_term const& t) {
    std::optional<address_type> a = ev.lookup_address(t.atom());
    if (!a)
      throw make_error<unbound_variable_error>(
        "{}: Unbound variable {}", format_location(t.location()), t.atom()
      );

    auto const* values = ev.get_store().lookup(*a);
    if (!values || values->empty())
      throw make_error<evaluation_error>(
        "{}: Variable {} has no value", format_location(t.location()), t.atom()
      );

    auto it = values->begin();
    Value result = *it;
    for (++it; it != values->end(); ++it)
      result = join(result, *it);
    return result;
  }
};

} // namespace absint

#endif
