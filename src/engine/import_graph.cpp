#include "engine/import_graph.hpp"

#include "util/depth_first_search.hpp"

#include <algorithm>
#include <ranges>

namespace absint {

void
import_graph::add_module(module_name const& name) {
  edges_.try_emplace(name);
}

void
import_graph::add_edge(module_name const& importer,
                       module_name const& imported) {
  add_module(imported);
  std::vector<module_name>& deps = edges_[importer];
  if (std::ranges::find(deps, imported) == deps.end())
    deps.push_back(imported);
}

std::vector<module_name>
import_graph::dependencies(module_name const& name) const {
  if (auto it = edges_.find(name); it != edges_.end())
    return it->second;
  else
    return {};
}

std::vector<module_name>
import_graph::modules() const {
  std::vector<module_name> result;
  for (auto const& [name, deps] : edges_)
    result.push_back(name);
  return result;
}

std::vector<std::pair<module_name, module_name>>
import_graph::edges() const {
  std::vector<std::pair<module_name, module_name>> result;
  for (auto const& [importer, deps] : edges_)
    for (module_name const& imported : deps)
      result.emplace_back(importer, imported);
  return result;
}

namespace {
  enum class color { white, grey, black };

  struct import_visitor {
    import_graph const&                     graph;
    std::map<module_name, color>            colors;
    std::vector<module_name>                path;
    std::vector<module_name>                order;
    std::optional<std::vector<module_name>> cycle;

    explicit
    import_visitor(import_graph const& g) : graph{g} { }

    bool
    enter(module_name const& name, dfs_stack<module_name>& stack) {
      switch (colors[name]) {
      case color::grey:
        // Grey modules are exactly the ones on the current path.
        if (!cycle) {
          auto start = std::ranges::find(path, name);
          cycle.emplace(start, path.end());
          cycle->push_back(name);
        }
        return false;

      case color::black:
        return false;

      case color::white:
        break;
      }

      colors[name] = color::grey;
      path.push_back(name);
      std::vector<module_name> deps = graph.dependencies(name);
      for (module_name const& dep : deps | std::views::reverse)
        stack.push_back(dep);
      return true;
    }

    void
    leave(module_name const& name) {
      colors[name] = color::black;
      path.pop_back();
      order.push_back(name);
    }
  };
} // anonymous namespace

std::optional<std::vector<module_name>>
import_graph::find_cycle() const {
  import_visitor v{*this};
  depth_first_search(modules(), v);
  return v.cycle;
}

std::vector<module_name>
import_graph::load_order() const {
  import_visitor v{*this};
  depth_first_search(modules(), v);
  return v.order;
}

} // namespace absint
