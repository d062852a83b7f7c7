#ifndef ABSINT_LANG_VALUES_HPP
#define ABSINT_LANG_VALUES_HPP

#include "abstract/address.hpp"

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace absint {

// Exact values: the result of running the program.
class concrete_value {
public:
  using location_type = precise_address;

  static concrete_value
  unit() { return concrete_value{std::monostate{}}; }

  static concrete_value
  from_integer(std::int64_t i) { return concrete_value{i}; }

  bool
  is_unit() const { return std::holds_alternative<std::monostate>(value_); }

  std::optional<std::int64_t>
  integer() const {
    if (auto const* i = std::get_if<std::int64_t>(&value_))
      return *i;
    else
      return std::nullopt;
  }

  friend auto
  operator <=> (concrete_value const&, concrete_value const&) = default;

private:
  std::variant<std::monostate, std::int64_t> value_;

  explicit
  concrete_value(std::variant<std::monostate, std::int64_t> v)
    : value_{v}
  { }
};

concrete_value
add(concrete_value const&, concrete_value const&);

concrete_value
subtract(concrete_value const&, concrete_value const&);

// Whether the value counts as true in a condition. Zero and unit are false.
std::optional<bool>
truthiness(concrete_value const&);

// Exact values only meet when both sides agree.
concrete_value
join(concrete_value const&, concrete_value const&);

std::string
show(concrete_value const&);

// Types: what kind of value each expression can produce.
class type_value {
public:
  using location_type = monovariant_address;

  enum class type {
    unit,
    integer,
    // Any value at all.
    top
  };

  static type_value
  unit() { return type_value{type::unit}; }

  static type_value
  from_integer(std::int64_t) { return type_value{type::integer}; }

  static type_value
  top() { return type_value{type::top}; }

  type
  get_type() const { return type_; }

  friend auto
  operator <=> (type_value const&, type_value const&) = default;

private:
  type type_;

  explicit
  type_value(type t) : type_{t} { }
};

type_value
add(type_value const&, type_value const&);

type_value
subtract(type_value const&, type_value const&);

// Unit is false; an integer may be either.
std::optional<bool>
truthiness(type_value const&);

type_value
join(type_value const&, type_value const&);

std::string
show(type_value const&);

} // namespace absint

#endif
