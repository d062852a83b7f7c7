#include "engine_fixture.hpp"

#include "engine/run.hpp"

#include <exception>
#include <string>
#include <vector>

using namespace absint;

TEST_F(engine_fixture, successful_run_reports_value_and_state) {
  std::vector<tree_module> ms{
    make_tree_module("main", sum(import_("lib"), ref("x"), lit(1))),
    make_tree_module("lib", sum(define("x", lit(4)), export_("x")))
  };

  auto result = run_analysis(semantics, config, ms);
  ASSERT_TRUE(result.succeeded());
  EXPECT_EQ(result.value(), number{5});
  EXPECT_TRUE(result.error_message().empty());
  EXPECT_TRUE(result.state.module_cache.contains("lib"));
  EXPECT_TRUE(result.state.global_env.contains("x"));
  EXPECT_EQ(result.state.heap.size(), 1u);
}

TEST(run_result, non_standard_exception_has_a_message) {
  run_result<tree_term, number> result;
  result.error = std::make_exception_ptr(42);

  EXPECT_FALSE(result.succeeded());
  EXPECT_EQ(result.error_message(), "Unknown error");
}

TEST_F(engine_fixture, failed_run_keeps_error_and_backtrace) {
  std::vector<tree_module> ms{
    make_tree_module("main", import_("lib")),
    make_tree_module("lib", ref("y"))
  };

  auto result = run_analysis(semantics, config, ms);
  EXPECT_FALSE(result.succeeded());
  EXPECT_FALSE(result.result);
  EXPECT_THROW(result.value(), unbound_variable_error);

  std::string message = result.error_message();
  EXPECT_NE(message.find("Unbound variable y"), std::string::npos);
  EXPECT_NE(message.find("Evaluating module lib"), std::string::npos);
}

TEST_F(engine_fixture, run_with_custom_action) {
  auto result = run_analysis(semantics, config, [] (tree_evaluator& ev) {
    return ev.evaluate_term(sum(lit(2), lit(3)));
  });

  ASSERT_TRUE(result.succeeded());
  EXPECT_EQ(result.value(), number{5});
  EXPECT_EQ(semantics.visited.size(), 3u);
}

TEST_F(engine_fixture, unhandled_signal_is_reported_as_failure) {
  auto m = make_tree_module("lib", lit(1));
  auto result = run_analysis(semantics, config, [&] (tree_evaluator& ev) {
    return ev.raise_module_evaluation(m);
  });

  EXPECT_FALSE(result.succeeded());
  EXPECT_THROW(result.value(), unhandled_signal_error);
}

TEST_F(engine_fixture, empty_program_fails) {
  auto result = run_analysis(semantics, config, std::vector<tree_module>{});
  EXPECT_THROW(result.value(), empty_module_list_error);
  EXPECT_EQ(result.error_message(),
            "Cannot evaluate an empty list of modules");
}
