#ifndef ABSINT_ABSTRACT_ADDRESS_HPP
#define ABSINT_ABSTRACT_ADDRESS_HPP

#include <compare>
#include <cstdint>
#include <string>

namespace absint {

// Address domain in which every allocation yields a fresh address.
struct precise_address {
  std::uint64_t index;

  friend auto
  operator <=> (precise_address const&, precise_address const&) = default;
};

// Address domain in which all allocations for one variable name share a single
// address, so values bound to that name on different paths accumulate in one
// store cell.
struct monovariant_address {
  std::string name;

  friend auto
  operator <=> (monovariant_address const&,
                monovariant_address const&) = default;
};

template <typename Address>
struct address_traits;

template <>
struct address_traits<precise_address> {
  static precise_address
  allocate(std::uint64_t& next_index, std::string const&) {
    return precise_address{next_index++};
  }
};

template <>
struct address_traits<monovariant_address> {
  static monovariant_address
  allocate(std::uint64_t&, std::string const& name) {
    return monovariant_address{name};
  }
};

// The address type of a value domain.
template <typename Value>
using location_for = typename Value::location_type;

std::string
format_address(precise_address const&);

std::string
format_address(monovariant_address const&);

} // namespace absint

#endif
