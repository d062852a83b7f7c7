#include "engine/source_location.hpp"

#include <fmt/format.h>

namespace absint {

std::string
format_location(source_location const& loc) {
  if (loc.line == 0)
    return loc.file_name.empty() ? "<unknown>" : loc.file_name;

  return fmt::format("{}:{}:{}",
                     loc.file_name.empty() ? "<unknown>" : loc.file_name,
                     loc.line, loc.column);
}

} // namespace absint
