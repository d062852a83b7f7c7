#include "engine_fixture.hpp"

#include "engine/module_interceptors.hpp"

#include <string>
#include <utility>
#include <vector>

using namespace absint;

struct modules : engine_fixture {
  tree_evaluator ev{semantics, config};

  number
  run(std::vector<tree_module> const& ms) {
    return ev.evaluate_modules(ms);
  }
};

TEST_F(modules, empty_module_list_is_an_error) {
  EXPECT_THROW(run({}), empty_module_list_error);
}

TEST_F(modules, single_module_is_evaluated_like_evaluate_module) {
  auto m = make_tree_module("main", sum(define("x", lit(2)), ref("x")));

  tree_semantics other_semantics;
  tree_evaluator other{other_semantics, config};

  EXPECT_EQ(run({m}), other.evaluate_module(m));
  EXPECT_EQ(ev.global_environment().names(),
            other.global_environment().names());
}

TEST_F(modules, required_module_is_evaluated_once) {
  module_evaluation_counter<tree_term, number> counter;
  std::vector<tree_module> ms{
    make_tree_module("main", sum(require("lib"), require("lib"), ref("x"))),
    make_tree_module("lib", define("x", lit(3)))
  };

  number result = ev.intercept_module_evaluation(counter, [&] {
    return run(ms);
  });

  EXPECT_EQ(result, number{3});
  EXPECT_EQ(counter.count("lib"), 1u);
  EXPECT_TRUE(diagnostics.contains("Using cached environment of module lib"));
}

TEST_F(modules, repeated_require_returns_the_same_environment) {
  std::vector<tree_module> libs{
    make_tree_module("lib", sum(define("x", lit(3)), define("y", lit(4))))
  };

  auto [first, second] = ev.handling_module_evaluation([&] {
    return ev.with_modules(libs, [&] {
      auto env = ev.require("lib");
      return std::pair{env, ev.require("lib")};
    });
  });

  EXPECT_TRUE(first.contains("x"));
  EXPECT_EQ(first, second);
}

TEST_F(modules, failed_module_is_not_cached) {
  module_evaluation_counter<tree_term, number> counter;
  std::vector<tree_module> libs{make_tree_module("a", ref("missing"))};

  ev.handling_module_evaluation([&] {
    return ev.intercept_module_evaluation(counter, [&] {
      return ev.with_modules(libs, [&] {
        EXPECT_THROW(ev.require("a"), unbound_variable_error);
        EXPECT_FALSE(ev.module_cache().contains("a"));
        EXPECT_THROW(ev.require("a"), unbound_variable_error);
        return 0;
      });
    });
  });

  EXPECT_FALSE(ev.module_cache().contains("a"));
  EXPECT_EQ(counter.count("a"), 2u);
}

TEST_F(modules, loading_is_reported_once_per_module) {
  std::vector<tree_module> ms{
    make_tree_module("main", sum(require("lib"), require("lib"))),
    make_tree_module("lib", lit(0))
  };
  run(ms);

  EXPECT_TRUE(diagnostics.contains("lib.tree: Loading module lib"));
}

TEST_F(modules, circular_imports_terminate) {
  std::vector<tree_module> ms{
    make_tree_module("main", require("a")),
    make_tree_module("a", sum(define("x", lit(1)), require("b"))),
    make_tree_module("b", sum(require("a"), lit(2)))
  };

  run(ms);

  EXPECT_TRUE(diagnostics.contains(
    "Module a required during its own evaluation"
  ));
  ASSERT_NE(ev.module_cache().lookup("a"), nullptr);
  ASSERT_NE(ev.module_cache().lookup("b"), nullptr);
  EXPECT_TRUE(ev.module_cache().lookup("a")->contains("x"));

  auto cycle = ev.state().imports.find_cycle();
  ASSERT_TRUE(cycle);
  EXPECT_EQ(*cycle, (std::vector<module_name>{"a", "b", "a"}));
}

TEST_F(modules, self_import_sees_partial_environment) {
  std::vector<tree_module> ms{
    make_tree_module("main", import_("a")),
    make_tree_module("a", sum(define("x", lit(1)), import_("a"), ref("x")))
  };

  EXPECT_NO_THROW(run(ms));
  EXPECT_TRUE(ev.module_cache().lookup("a")->contains("x"));
}

TEST_F(modules, missing_module_leaves_cache_unchanged) {
  std::vector<tree_module> ms{
    make_tree_module("main", sum(require("lib"), require("missing"))),
    make_tree_module("lib", lit(1))
  };

  EXPECT_THROW(run(ms), module_not_found_error);
  EXPECT_TRUE(ev.module_cache().contains("lib"));
  EXPECT_FALSE(ev.module_cache().contains("missing"));
}

TEST_F(modules, name_without_modules_loads_empty_environment) {
  auto env = ev.with_pending_modules(
    [] (pending_module_table<tree_term> const&) {
      pending_module_table<tree_term> table;
      table.insert("ghost", {});
      return table;
    },
    [&] { return ev.load("ghost"); }
  );

  EXPECT_TRUE(env.empty());
  ASSERT_NE(ev.module_cache().lookup("ghost"), nullptr);
  EXPECT_TRUE(ev.module_cache().lookup("ghost")->empty());
  EXPECT_TRUE(ev.pending_modules().empty());
}

TEST_F(modules, exports_restrict_what_importers_see) {
  std::vector<tree_module> ms{
    make_tree_module("main", sum(import_("lib"), ref("x"), ref("y"))),
    make_tree_module("lib",
                     sum(define("x", lit(1)), define("y", lit(2)), export_("x")))
  };

  EXPECT_THROW(run(ms), unbound_variable_error);
  EXPECT_TRUE(ev.module_cache().lookup("lib")->contains("x"));
  EXPECT_FALSE(ev.module_cache().lookup("lib")->contains("y"));
}

TEST_F(modules, imported_module_does_not_see_importer_globals) {
  std::vector<tree_module> ms{
    make_tree_module("main", sum(define("z", lit(1)), import_("lib"))),
    make_tree_module("lib", ref("z"))
  };

  EXPECT_THROW(run(ms), unbound_variable_error);
}

TEST_F(modules, import_does_not_leak_module_globals) {
  std::vector<tree_module> ms{
    make_tree_module("main", sum(define("z", lit(1)), import_("lib"))),
    make_tree_module("lib", sum(define("x", lit(1)), export_("x")))
  };

  run(ms);
  EXPECT_TRUE(ev.global_environment().contains("z"));
  EXPECT_TRUE(ev.global_environment().contains("x"));
  EXPECT_EQ(ev.get_exports().size(), 0u);
}

TEST_F(modules, modules_without_exports_expose_nothing_when_strict) {
  evaluation_config strict = evaluation_config::strict_config(diagnostics);
  tree_evaluator strict_ev{semantics, strict};

  std::vector<tree_module> ms{
    make_tree_module("main", sum(import_("lib"), ref("x"))),
    make_tree_module("lib", define("x", lit(1)))
  };

  EXPECT_THROW(strict_ev.evaluate_modules(ms), unbound_variable_error);
  EXPECT_TRUE(strict_ev.module_cache().lookup("lib")->empty());
}

TEST_F(modules, same_named_modules_first_definition_wins) {
  std::vector<tree_module> ms{
    make_tree_module("main", sum(import_("lib"), ref("x"), ref("y"))),
    make_tree_module("lib", define("x", lit(1))),
    make_tree_module("lib", sum(define("x", lit(2)), define("y", lit(10))))
  };

  EXPECT_EQ(run(ms), number{11});
}

TEST_F(modules, same_named_modules_last_definition_wins) {
  evaluation_config last{empty_exports_policy::export_all,
                         merge_policy::last_wins, diagnostics};
  tree_evaluator last_ev{semantics, last};

  std::vector<tree_module> ms{
    make_tree_module("main", sum(import_("lib"), ref("x"), ref("y"))),
    make_tree_module("lib", define("x", lit(1))),
    make_tree_module("lib", sum(define("x", lit(2)), define("y", lit(10))))
  };

  EXPECT_EQ(last_ev.evaluate_modules(ms), number{12});
}

TEST_F(modules, import_graph_records_requirements) {
  std::vector<tree_module> ms{
    make_tree_module("main", sum(import_("a"), import_("b"))),
    make_tree_module("a", import_("b")),
    make_tree_module("b", lit(0))
  };

  run(ms);

  import_graph const& g = ev.state().imports;
  EXPECT_EQ(g.dependencies("main"), (std::vector<module_name>{"a", "b"}));
  EXPECT_EQ(g.dependencies("a"), (std::vector<module_name>{"b"}));
  EXPECT_EQ(g.load_order(), (std::vector<module_name>{"b", "a", "main"}));
  EXPECT_FALSE(g.find_cycle());
}

TEST_F(modules, failure_reports_action_backtrace) {
  std::vector<tree_module> ms{
    make_tree_module("main", import_("lib")),
    make_tree_module("lib", ref("nothing"))
  };

  EXPECT_THROW(run(ms), unbound_variable_error);
  EXPECT_NE(ev.action_backtrace().find("Evaluating module lib"),
            std::string::npos);
  EXPECT_NE(ev.action_backtrace().find("Loading module lib"),
            std::string::npos);
  EXPECT_NE(ev.action_backtrace().find("Evaluating module main"),
            std::string::npos);
}
