#ifndef ABSINT_ABSTRACT_LIVE_HPP
#define ABSINT_ABSTRACT_LIVE_HPP

#include <cstddef>
#include <initializer_list>
#include <set>

namespace absint {

// Set of addresses reachable from the current point of evaluation.
template <typename Address>
class live {
public:
  live() = default;

  live(std::initializer_list<Address> addresses)
    : addresses_{addresses}
  { }

  void
  insert(Address const& a) { addresses_.insert(a); }

  void
  erase(Address const& a) { addresses_.erase(a); }

  bool
  contains(Address const& a) const { return addresses_.contains(a); }

  bool
  empty() const { return addresses_.empty(); }

  std::size_t
  size() const { return addresses_.size(); }

  auto
  begin() const { return addresses_.begin(); }

  auto
  end() const { return addresses_.end(); }

  live
  united(live const& other) const {
    live result = *this;
    result.addresses_.insert(other.addresses_.begin(), other.addresses_.end());
    return result;
  }

  friend bool
  operator == (live const&, live const&) = default;

private:
  std::set<Address> addresses_;
};

} // namespace absint

#endif
