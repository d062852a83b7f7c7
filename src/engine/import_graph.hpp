#ifndef ABSINT_ENGINE_IMPORT_GRAPH_HPP
#define ABSINT_ENGINE_IMPORT_GRAPH_HPP

#include "abstract/module.hpp"

#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace absint {

// Which modules required which during a run.
class import_graph {
public:
  void
  add_module(module_name const&);

  // Record that `importer` required `imported`. Adds both modules; repeated
  // edges are recorded once.
  void
  add_edge(module_name const& importer, module_name const& imported);

  bool
  contains(module_name const& name) const { return edges_.contains(name); }

  // Direct dependencies, in the order they were first required.
  std::vector<module_name>
  dependencies(module_name const&) const;

  std::vector<module_name>
  modules() const;

  std::vector<std::pair<module_name, module_name>>
  edges() const;

  // A chain of modules m1, m2, ..., mn, m1 in which each requires the next, or
  // nullopt if there is no such chain.
  std::optional<std::vector<module_name>>
  find_cycle() const;

  // All modules, each after the modules it depends on. Modules on a cycle are
  // ordered by the point at which the cycle was entered.
  std::vector<module_name>
  load_order() const;

  friend bool
  operator == (import_graph const&, import_graph const&) = default;

private:
  std::map<module_name, std::vector<module_name>> edges_;
};

} // namespace absint

#endif
