#ifndef ABSINT_ABSTRACT_STORE_HPP
#define ABSINT_ABSTRACT_STORE_HPP

#include <cstddef>
#include <map>
#include <set>
#include <vector>

namespace absint {

// Heap mapping addresses to sets of abstract values. A cell holding more than
// one value stands for several program paths merged at that address.
template <typename Address, typename Value>
class store {
public:
  using value_set = std::set<Value>;

  // Add a value to the cell at the given address (weak update).
  void
  insert(Address const& a, Value v) {
    cells_[a].insert(std::move(v));
  }

  // Replace the contents of the cell at the given address (strong update).
  void
  assign(Address const& a, Value v) {
    cells_.insert_or_assign(a, value_set{std::move(v)});
  }

  // Null if nothing was ever stored at the address.
  value_set const*
  lookup(Address const& a) const {
    if (auto it = cells_.find(a); it != cells_.end())
      return &it->second;
    else
      return nullptr;
  }

  bool
  contains(Address const& a) const { return cells_.contains(a); }

  std::size_t
  size() const { return cells_.size(); }

  bool
  empty() const { return cells_.empty(); }

  std::vector<Address>
  addresses() const {
    std::vector<Address> result;
    result.reserve(cells_.size());
    for (auto const& [address, values] : cells_)
      result.push_back(address);
    return result;
  }

  auto
  begin() const { return cells_.begin(); }

  auto
  end() const { return cells_.end(); }

  friend bool
  operator == (store const&, store const&) = default;

private:
  std::map<Address, value_set> cells_;
};

} // namespace absint

#endif
