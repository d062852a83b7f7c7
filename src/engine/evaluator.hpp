#ifndef ABSINT_ENGINE_EVALUATOR_HPP
#define ABSINT_ENGINE_EVALUATOR_HPP

#include "abstract/address.hpp"
#include "abstract/configuration.hpp"
#include "abstract/environment.hpp"
#include "abstract/exports.hpp"
#include "abstract/live.hpp"
#include "abstract/module.hpp"
#include "abstract/module_table.hpp"
#include "abstract/store.hpp"
#include "engine/action.hpp"
#include "engine/analysis.hpp"
#include "engine/error.hpp"
#include "engine/evaluation_config.hpp"
#include "engine/import_graph.hpp"
#include "engine/module_signal.hpp"
#include "engine/source_location.hpp"
#include "engine/term.hpp"
#include "util/scoped_restore.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace absint {

// Everything an analysis run threads through evaluation.
template <typename Term, typename Value>
struct evaluator_state {
  using address_type = location_for<Value>;

  environment<address_type>               global_env;
  environment<address_type>               local_env;
  exports<address_type>                   module_exports;
  store<address_type, Value>              heap;
  // Exported environments of the modules evaluated so far.
  module_table<environment<address_type>> module_cache;
  // Modules available for import.
  pending_module_table<Term>              pending_modules;
  import_graph                            imports;
  std::uint64_t                           next_address = 0;
};

// Evaluates terms and modules with a given analysis, and provides the
// analysis with access to environments, the store and the module tables.
//
// Execution is single-threaded. Every scoped operation (with_local_environment,
// with_pending_modules, isolate) restores what it changed on every way out,
// including exceptions.
template <typename Term, typename Value>
class evaluator {
public:
  using term_type        = Term;
  using value_type       = Value;
  using address_type     = location_for<Value>;
  using environment_type = environment<address_type>;
  using store_type       = store<address_type, Value>;
  using exports_type     = exports<address_type>;
  using module_type      = module_<Term>;
  using module_list      = std::vector<module_type>;
  using analysis_type    = analysis<Term, Value>;
  using handler_type     = module_evaluation_handler<Term, Value>;
  using node_type        = term_node<Term, Value>;
  using module_node_type = module_node<Term, Value>;
  using state_type       = evaluator_state<Term, Value>;

  evaluator(analysis_type& a, evaluation_config const& config)
    : analysis_{a}
    , config_{config}
  { }

  evaluator(evaluator const&) = delete;
  void operator = (evaluator const&) = delete;

  analysis_type&
  top_analysis() const { return analysis_; }

  evaluation_config const&
  config() const { return config_; }

  diagnostic_sink&
  diagnostics() const { return config_.diagnostics; }

  state_type&
  state() { return state_; }

  state_type const&
  state() const { return state_; }

  // Descriptions of the actions an exception has unwound through, innermost
  // first.
  std::string const&
  action_backtrace() const { return action_backtrace_; }

  environment_type const&
  global_environment() const { return state_.global_env; }

  void
  set_global_environment(environment_type env) {
    state_.global_env = std::move(env);
  }

  template <typename F>
  void
  modify_global_environment(F&& f) {
    set_global_environment(f(std::as_const(state_.global_env)));
  }

  environment_type const&
  local_environment() const { return state_.local_env; }

  // Run an action with the local environment replaced by f(current local
  // environment).
  template <typename F, typename Action>
  auto
  with_local_environment(F&& f, Action&& action) {
    auto saved = restore_on_exit(state_.local_env);
    state_.local_env = f(saved.saved());
    return action();
  }

  store_type const&
  get_store() const { return state_.heap; }

  void
  put_store(store_type s) { state_.heap = std::move(s); }

  template <typename F>
  void
  modify_store(F&& f) {
    put_store(f(std::as_const(state_.heap)));
  }

  exports_type const&
  get_exports() const { return state_.module_exports; }

  void
  put_exports(exports_type e) { state_.module_exports = std::move(e); }

  void
  add_export(std::string exported, std::string original,
             std::optional<address_type> address) {
    exports_type e = state_.module_exports;
    e.insert(std::move(exported), std::move(original), std::move(address));
    put_exports(std::move(e));
  }

  module_table<environment_type> const&
  module_cache() const { return state_.module_cache; }

  template <typename F>
  void
  modify_module_cache(F&& f) {
    state_.module_cache = f(std::as_const(state_.module_cache));
  }

  pending_module_table<Term> const&
  pending_modules() const { return state_.pending_modules; }

  // Run an action with the table of modules available for import replaced by
  // f(current table).
  template <typename F, typename Action>
  auto
  with_pending_modules(F&& f, Action&& action) {
    auto saved = restore_on_exit(state_.pending_modules);
    state_.pending_modules = f(saved.saved());
    return action();
  }

  live<address_type>
  ask_roots() const { return analysis_.ask_roots(*this); }

  configuration<Term, Value>
  get_configuration(Term const& t) const {
    return configuration<Term, Value>{&t, ask_roots(), state_.local_env,
                                      state_.heap};
  }

  address_type
  allocate(std::string const& name) {
    return address_traits<address_type>::allocate(state_.next_address, name);
  }

  // Look the name up in the local environment, then in the global one.
  std::optional<address_type>
  lookup_address(std::string const& name) const {
    if (auto a = state_.local_env.lookup(name))
      return a;
    return state_.global_env.lookup(name);
  }

  // Fold the term into a value, applying the analysis at every node. Each
  // child's value is deferred to a recursive evaluate_term call that happens
  // only if the analysis forces it.
  Value
  evaluate_term(Term const& t) {
    node_type node{t, {}};
    for_each_subterm(t, [&] (Term const& child) {
      node.children.emplace_back(child,
                                 [this, &child] { return evaluate_term(child); });
    });
    return analysis_.analyze_term(*this, node);
  }

  // Evaluate a root-level term: a single-term program, or one module of a
  // multi-module program. Modules required during the evaluation are
  // evaluated by the evaluator's handler unless an interceptor answers first.
  Value
  evaluate_module(module_type const& m) {
    return handling_module_evaluation([&] { return evaluate_module_body(m); });
  }

  // What the evaluator's own module handler does: apply the analysis's module
  // algebra to the module.
  Value
  evaluate_module_body(module_type const& m) {
    simple_action act{action_backtrace_, "Evaluating module {}", m.name};
    state_.imports.add_module(m.name);

    auto saved = restore_on_exit(evaluating_);
    evaluating_.push_back(m.name);

    module_node_type node{
      m,
      subterm<Term, Value>{*m.body, [this, &m] { return evaluate_term(*m.body); }}
    };
    return analysis_.analyze_module(*this, node);
  }

  // Run an action with the evaluator's module handler at the end of the
  // handler chain.
  template <typename Action>
  auto
  handling_module_evaluation(Action&& action) {
    if (default_installed_)
      return action();

    default_installation installation{*this};
    return action();
  }

  // Run an action with the given handler at the front of the handler chain.
  template <typename Action>
  auto
  intercept_module_evaluation(handler_type& h, Action&& action) {
    handler_installation installation{handlers_, h};
    return action();
  }

  // Suspend until a handler has evaluated the module, and resume with its
  // value.
  Value
  raise_module_evaluation(module_type const& m) {
    return dispatch(handlers_.size(), m);
  }

  // Run an action in isolation from the current global environment and
  // exports, as defined by the analysis.
  template <typename Action>
  auto
  isolate(Action&& action) {
    using result_type = std::invoke_result_t<Action&>;

    if constexpr (std::is_void_v<result_type>)
      analysis_.isolate(*this, [&] { action(); });
    else {
      std::optional<result_type> result;
      analysis_.isolate(*this, [&] { result.emplace(action()); });
      if (!result)
        throw make_error<evaluation_error>("Isolated action was not run");
      return std::move(*result);
    }
  }

  // The default isolation: empty global environment and exports for the
  // duration of the action.
  void
  run_isolated(std::function<void()> const& action) {
    auto saved_env = restore_on_exit(state_.global_env);
    auto saved_exports = restore_on_exit(state_.module_exports);
    state_.global_env = environment_type{};
    state_.module_exports = exports_type{};
    action();
  }

  // The environment exported by the named module: taken from the cache if the
  // module has been evaluated before, otherwise loaded.
  environment_type
  require(module_name const& name) {
    if (!evaluating_.empty()
        && (state_.module_cache.contains(name)
            || state_.pending_modules.contains(name)))
      state_.imports.add_edge(evaluating_.back(), name);

    if (auto const* cached = state_.module_cache.lookup(name)) {
      if (std::ranges::find(evaluating_, name) != evaluating_.end())
        diagnostics().show(
          source_location::unknown,
          fmt::format("Module {} required during its own evaluation; "
                      "using the environment exported so far",
                      name)
        );
      else
        diagnostics().show(
          source_location::unknown,
          fmt::format("Using cached environment of module {}", name)
        );

      return *cached;
    }

    return load(name);
  }

  // Evaluate every module registered under the name, in table order, and
  // return the combination of their exported environments. The cache entry for
  // the name is updated after each module, and exists, empty, before the first
  // one starts; a module that requires itself, directly or through other
  // modules, gets what has been exported up to that point. If evaluation
  // fails, an entry created here is removed again.
  environment_type
  load(module_name const& name) {
    module_list const* found = state_.pending_modules.lookup(name);
    if (!found)
      throw make_error<module_not_found_error>("Cannot load module {}", name);

    module_list candidates = *found;
    simple_action act{action_backtrace_, "Loading module {}", name};

    bool placeholder = !state_.module_cache.contains(name);
    if (placeholder)
      state_.module_cache.insert(name, environment_type{});

    try {
      return load_candidates(name, candidates);
    } catch (...) {
      if (placeholder)
        state_.module_cache.erase(name);
      throw;
    }
  }

  // Require a module in isolation: the module's evaluation neither sees nor
  // changes the importer's globals and exports, and only the names the module
  // exports are returned.
  environment_type
  import_module(module_name const& name) {
    return isolate([&] { return require(name); });
  }

  // Run an action with the given modules, and only those, available for
  // import.
  template <typename Action>
  auto
  with_modules(module_list const& modules, Action&& action) {
    return with_pending_modules(
      [&] (pending_module_table<Term> const&) {
        return module_table_from_list(modules);
      },
      std::forward<Action>(action)
    );
  }

  // Evaluate the first module as the entry point, with the rest available for
  // import.
  Value
  evaluate_modules(module_list const& modules) {
    if (modules.empty())
      throw make_error<empty_module_list_error>(
        "Cannot evaluate an empty list of modules"
      );

    module_list rest(modules.begin() + 1, modules.end());
    return with_modules(rest, [&] { return evaluate_module(modules.front()); });
  }

private:
  environment_type
  load_candidates(module_name const& name, module_list const& candidates) {
    environment_type result;
    bool first = true;
    for (module_type const& m : candidates) {
      diagnostics().show(source_location{m.path.string(), 0, 0},
                         fmt::format("Loading module {}", name));

      raise_module_evaluation(m);

      environment_type env = filter_environment(state_.module_exports,
                                                state_.global_env,
                                                config_.empty_exports);
      state_.module_cache.insert_with(
        name, env,
        [&] (environment_type const& cached, environment_type added) {
          return cached.merge(added, config_.merge);
        }
      );

      result = first ? env : result.merge(env, config_.merge);
      first = false;
    }

    return result;
  }

  class evaluating_handler final : public handler_type {
  public:
    Value
    handle(evaluator& ev, module_type const& m,
           typename handler_type::continuation const&) override {
      return ev.evaluate_module_body(m);
    }
  };

  class handler_installation {
  public:
    handler_installation(std::vector<handler_type*>& handlers, handler_type& h)
      : handlers_{handlers}
    {
      handlers_.push_back(&h);
    }

    ~handler_installation() { handlers_.pop_back(); }

    handler_installation(handler_installation const&) = delete;
    void operator = (handler_installation const&) = delete;

  private:
    std::vector<handler_type*>& handlers_;
  };

  class default_installation {
  public:
    explicit
    default_installation(evaluator& ev)
      : ev_{ev}
    {
      ev_.handlers_.insert(ev_.handlers_.begin(), &ev_.default_handler_);
      ev_.default_installed_ = true;
    }

    ~default_installation() {
      ev_.handlers_.erase(ev_.handlers_.begin());
      ev_.default_installed_ = false;
    }

    default_installation(default_installation const&) = delete;
    void operator = (default_installation const&) = delete;

  private:
    evaluator& ev_;
  };

  analysis_type&             analysis_;
  evaluation_config          config_;
  state_type                 state_;
  // Innermost handler last.
  std::vector<handler_type*> handlers_;
  evaluating_handler         default_handler_;
  bool                       default_installed_ = false;
  // Names of the modules being evaluated, innermost last.
  std::vector<module_name>   evaluating_;
  std::string                action_backtrace_;

  Value
  dispatch(std::size_t depth, module_type const& m) {
    if (depth == 0)
      throw make_error<unhandled_signal_error>(
        "No handler installed for the evaluation of module {}", m.name
      );

    return handlers_[depth - 1]->handle(
      *this, m,
      [this, depth] (module_type const& next) {
        return dispatch(depth - 1, next);
      }
    );
  }
};

} // namespace absint

#endif
