#include "abstract/address.hpp"

#include <fmt/format.h>

namespace absint {

std::string
format_address(precise_address const& a) {
  return fmt::format("#{}", a.index);
}

std::string
format_address(monovariant_address const& a) {
  return fmt::format("#{}", a.name);
}

} // namespace absint
