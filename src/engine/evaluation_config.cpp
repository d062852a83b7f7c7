#include "engine/evaluation_config.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iostream>

namespace absint {

void
diagnostic_sink::show(source_location const& loc, std::string const& message) {
  std::string key = fmt::format("{}\n{}", format_location(loc), message);
  if (!emitted_.contains(key)) {
    output(loc, message);
    emitted_.emplace(std::move(key));
  }
}

null_diagnostic_sink
null_diagnostic_sink::instance;

void
stdout_diagnostic_sink::output(source_location const& loc,
                               std::string const& message) {
  std::cout << fmt::format("Note: {}: {}\n", format_location(loc), message);
}

delegate_diagnostic_sink::delegate_diagnostic_sink(diagnostic_sink& other)
  : target_{other}
{ }

void
delegate_diagnostic_sink::output(source_location const& loc,
                                 std::string const& msg) {
  target_.show(loc, msg);
}

bool
collecting_diagnostic_sink::contains(std::string const& message) const {
  return std::ranges::any_of(messages_, [&] (std::string const& m) {
    return m.find(message) != std::string::npos;
  });
}

void
collecting_diagnostic_sink::output(source_location const& loc,
                                   std::string const& msg) {
  messages_.push_back(fmt::format("{}: {}", format_location(loc), msg));
}

evaluation_config
evaluation_config::default_config(diagnostic_sink& diagnostics) {
  return evaluation_config{empty_exports_policy::export_all,
                           merge_policy::first_wins,
                           diagnostics};
}

evaluation_config
evaluation_config::strict_config(diagnostic_sink& diagnostics) {
  return evaluation_config{empty_exports_policy::export_none,
                           merge_policy::first_wins,
                           diagnostics};
}

} // namespace absint
