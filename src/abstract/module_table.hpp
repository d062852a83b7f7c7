#ifndef ABSINT_ABSTRACT_MODULE_TABLE_HPP
#define ABSINT_ABSTRACT_MODULE_TABLE_HPP

#include "abstract/module.hpp"

#include <map>
#include <utility>
#include <vector>

namespace absint {

// Table keyed by module name, ordered by name.
template <typename X>
class module_table {
public:
  X const*
  lookup(module_name const& name) const {
    if (auto it = entries_.find(name); it != entries_.end())
      return &it->second;
    else
      return nullptr;
  }

  bool
  contains(module_name const& name) const { return entries_.contains(name); }

  void
  insert(module_name const& name, X value) {
    entries_.insert_or_assign(name, std::move(value));
  }

  void
  erase(module_name const& name) { entries_.erase(name); }

  // Insert the value, or if the name is already present, replace the existing
  // entry with combine(existing, value).
  template <typename Combine>
  void
  insert_with(module_name const& name, X value, Combine&& combine) {
    if (auto it = entries_.find(name); it != entries_.end())
      it->second = combine(std::as_const(it->second), std::move(value));
    else
      entries_.emplace(name, std::move(value));
  }

  std::vector<module_name>
  names() const {
    std::vector<module_name> result;
    for (auto const& [name, value] : entries_)
      result.push_back(name);
    return result;
  }

  std::size_t
  size() const { return entries_.size(); }

  bool
  empty() const { return entries_.empty(); }

  auto
  begin() const { return entries_.begin(); }

  auto
  end() const { return entries_.end(); }

  friend bool
  operator == (module_table const&, module_table const&) = default;

private:
  std::map<module_name, X> entries_;
};

template <typename Term>
using pending_module_table = module_table<std::vector<module_<Term>>>;

// Group modules by name, keeping same-named modules in list order.
template <typename Term>
pending_module_table<Term>
module_table_from_list(std::vector<module_<Term>> const& modules) {
  pending_module_table<Term> result;
  for (module_<Term> const& m : modules)
    result.insert_with(
      m.name, std::vector{m},
      [] (std::vector<module_<Term>> const& existing,
          std::vector<module_<Term>> added) {
        std::vector<module_<Term>> combined = existing;
        combined.insert(combined.end(), added.begin(), added.end());
        return combined;
      }
    );
  return result;
}

} // namespace absint

#endif
