#include "lang/values.hpp"

#include "engine/error.hpp"

#include <fmt/format.h>

#include <initializer_list>

namespace absint {

static std::int64_t
expect_integer(concrete_value const& v, char const* operation) {
  if (auto i = v.integer())
    return *i;
  throw make_error<evaluation_error>("{}: Expected an integer, got {}",
                                     operation, show(v));
}

concrete_value
add(concrete_value const& x, concrete_value const& y) {
  std::int64_t result{};
  if (__builtin_add_overflow(expect_integer(x, "+"), expect_integer(y, "+"),
                             &result))
    throw make_error<evaluation_error>("+: Integer overflow adding {} and {}",
                                       show(x), show(y));
  return concrete_value::from_integer(result);
}

concrete_value
subtract(concrete_value const& x, concrete_value const& y) {
  std::int64_t result{};
  if (__builtin_sub_overflow(expect_integer(x, "-"), expect_integer(y, "-"),
                             &result))
    throw make_error<evaluation_error>(
      "-: Integer overflow subtracting {} from {}", show(y), show(x)
    );
  return concrete_value::from_integer(result);
}

std::optional<bool>
truthiness(concrete_value const& v) {
  if (auto i = v.integer())
    return *i != 0;
  else
    return false;
}

concrete_value
join(concrete_value const& x, concrete_value const& y) {
  if (x != y)
    throw make_error<evaluation_error>("Cannot join distinct values {} and {}",
                                       show(x), show(y));
  return x;
}

std::string
show(concrete_value const& v) {
  if (auto i = v.integer())
    return fmt::format("{}", *i);
  else
    return "#unit";
}

static type_value
arithmetic(type_value const& x, type_value const& y, char const* operation) {
  for (type_value const& operand : {x, y})
    if (operand.get_type() == type_value::type::unit)
      throw make_error<evaluation_error>("{}: Expected an integer, got {}",
                                         operation, show(operand));

  if (x.get_type() == type_value::type::integer
      && y.get_type() == type_value::type::integer)
    return type_value::from_integer(0);
  else
    return type_value::top();
}

type_value
add(type_value const& x, type_value const& y) {
  return arithmetic(x, y, "+");
}

type_value
subtract(type_value const& x, type_value const& y) {
  return arithmetic(x, y, "-");
}

std::optional<bool>
truthiness(type_value const& v) {
  if (v.get_type() == type_value::type::unit)
    return false;
  else
    return std::nullopt;
}

type_value
join(type_value const& x, type_value const& y) {
  if (x == y)
    return x;
  else
    return type_value::top();
}

std::string
show(type_value const& v) {
  switch (v.get_type()) {
  case type_value::type::unit:    return "unit";
  case type_value::type::integer: return "integer";
  case type_value::type::top:     return "top";
  }

  return "<invalid>";
}

} // namespace absint
