#include "abstract/address.hpp"
#include "abstract/environment.hpp"
#include "abstract/exports.hpp"
#include "abstract/live.hpp"
#include "abstract/module.hpp"
#include "abstract/module_table.hpp"
#include "abstract/store.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <set>
#include <string>
#include <vector>

using namespace absint;

using env = environment<precise_address>;

static precise_address
addr(std::uint64_t i) { return precise_address{i}; }

TEST(environment, lookup_finds_innermost_binding) {
  env e{{"x", addr(0)}};
  e.push();
  e.insert("x", addr(1));
  EXPECT_EQ(e.lookup("x"), addr(1));

  e.pop();
  EXPECT_EQ(e.lookup("x"), addr(0));
}

TEST(environment, lookup_of_unbound_name_is_empty) {
  env e{{"x", addr(0)}};
  EXPECT_FALSE(e.lookup("y"));
  EXPECT_FALSE(e.contains("y"));
  EXPECT_TRUE(e.contains("x"));
}

TEST(environment, copies_do_not_share_mutations) {
  env original{{"x", addr(0)}};
  env copy = original;
  copy.insert("y", addr(1));

  EXPECT_FALSE(original.contains("y"));
  EXPECT_TRUE(copy.contains("y"));
}

TEST(environment, popping_last_frame_leaves_empty_environment) {
  env e{{"x", addr(0)}};
  e.pop();
  EXPECT_TRUE(e.empty());
  EXPECT_EQ(e.depth(), 1u);
}

TEST(environment, merge_first_wins_keeps_left_binding) {
  env left{{"x", addr(0)}, {"y", addr(1)}};
  env right{{"x", addr(2)}, {"z", addr(3)}};

  env merged = left.merge(right, merge_policy::first_wins);
  EXPECT_EQ(merged.lookup("x"), addr(0));
  EXPECT_EQ(merged.lookup("y"), addr(1));
  EXPECT_EQ(merged.lookup("z"), addr(3));
}

TEST(environment, merge_last_wins_keeps_right_binding) {
  env left{{"x", addr(0)}};
  env right{{"x", addr(2)}};
  EXPECT_EQ(left.merge(right, merge_policy::last_wins).lookup("x"), addr(2));
}

TEST(environment, overwrite_renames_bound_names) {
  env e{{"a", addr(0)}, {"b", addr(1)}};
  env result = e.overwrite({{"a", "x"}, {"missing", "y"}});

  EXPECT_EQ(result.lookup("x"), addr(0));
  EXPECT_FALSE(result.contains("a"));
  EXPECT_FALSE(result.contains("b"));
  EXPECT_FALSE(result.contains("y"));
}

TEST(environment, roots_include_shadowed_bindings) {
  env e{{"x", addr(0)}};
  e.push();
  e.insert("x", addr(1));

  live<precise_address> roots = e.roots();
  EXPECT_EQ(roots.size(), 2u);
  EXPECT_TRUE(roots.contains(addr(0)));
  EXPECT_TRUE(roots.contains(addr(1)));
}

TEST(store, insert_accumulates_values) {
  store<precise_address, int> s;
  s.insert(addr(0), 1);
  s.insert(addr(0), 2);

  ASSERT_NE(s.lookup(addr(0)), nullptr);
  EXPECT_EQ(*s.lookup(addr(0)), (std::set<int>{1, 2}));
}

TEST(store, assign_replaces_values) {
  store<precise_address, int> s;
  s.insert(addr(0), 1);
  s.assign(addr(0), 3);
  EXPECT_EQ(*s.lookup(addr(0)), (std::set<int>{3}));
}

TEST(store, lookup_of_unknown_address_is_null) {
  store<precise_address, int> s;
  EXPECT_EQ(s.lookup(addr(7)), nullptr);
  EXPECT_FALSE(s.contains(addr(7)));
}

TEST(address, monovariant_allocation_shares_address_per_name) {
  std::uint64_t next = 0;
  auto a = address_traits<monovariant_address>::allocate(next, "x");
  auto b = address_traits<monovariant_address>::allocate(next, "x");
  auto c = address_traits<monovariant_address>::allocate(next, "y");
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
}

TEST(address, precise_allocation_is_fresh) {
  std::uint64_t next = 0;
  auto a = address_traits<precise_address>::allocate(next, "x");
  auto b = address_traits<precise_address>::allocate(next, "x");
  EXPECT_NE(a, b);
  EXPECT_EQ(next, 2u);
}

TEST(exports, aliased_export_is_visible_under_alias_only) {
  env e{{"a", addr(0)}, {"b", addr(1)}, {"c", addr(2)}};
  exports<precise_address> ports;
  ports.insert("x", "a");

  env result = filter_environment(ports, e, empty_exports_policy::export_all);
  EXPECT_EQ(result.lookup("x"), addr(0));
  EXPECT_FALSE(result.contains("a"));
  EXPECT_FALSE(result.contains("b"));
  EXPECT_FALSE(result.contains("c"));
  EXPECT_EQ(result.size(), 1u);
}

TEST(exports, recorded_address_takes_precedence) {
  env e{{"a", addr(0)}};
  exports<precise_address> ports;
  ports.insert("a", "a", addr(5));

  env result = filter_environment(ports, e, empty_exports_policy::export_all);
  EXPECT_EQ(result.lookup("a"), addr(5));
}

TEST(exports, empty_exports_expose_everything_by_default) {
  env e{{"a", addr(0)}, {"b", addr(1)}};
  exports<precise_address> ports;
  EXPECT_EQ(filter_environment(ports, e, empty_exports_policy::export_all), e);
}

TEST(exports, empty_exports_expose_nothing_when_strict) {
  env e{{"a", addr(0)}, {"b", addr(1)}};
  exports<precise_address> ports;
  EXPECT_TRUE(
    filter_environment(ports, e, empty_exports_policy::export_none).empty()
  );
}

TEST(module_table, insert_with_combines_existing_entry) {
  module_table<int> t;
  t.insert("m", 1);
  t.insert_with("m", 2, [] (int existing, int added) {
    return existing * 10 + added;
  });
  t.insert_with("n", 3, [] (int, int) { return -1; });

  EXPECT_EQ(*t.lookup("m"), 12);
  EXPECT_EQ(*t.lookup("n"), 3);
  EXPECT_EQ(t.lookup("o"), nullptr);
}

TEST(module_table, modules_are_grouped_by_name_in_list_order) {
  std::vector<module_<int>> modules{
    make_module("a", "a1", 1),
    make_module("b", "b", 2),
    make_module("a", "a2", 3)
  };

  auto table = module_table_from_list(modules);
  ASSERT_NE(table.lookup("a"), nullptr);
  ASSERT_EQ(table.lookup("a")->size(), 2u);
  EXPECT_EQ(table.lookup("a")->at(0).path.string(), "a1");
  EXPECT_EQ(table.lookup("a")->at(1).path.string(), "a2");
  EXPECT_EQ(table.lookup("b")->size(), 1u);
  EXPECT_EQ(table.names(), (std::vector<module_name>{"a", "b"}));
}
