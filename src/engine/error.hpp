#ifndef ABSINT_ENGINE_ERROR_HPP
#define ABSINT_ENGINE_ERROR_HPP

#include <fmt/format.h>

#include <stdexcept>
#include <string_view>
#include <utility>

namespace absint {

template <typename>
class named_runtime_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

template <typename Error = std::runtime_error, typename... Args>
Error
make_error(std::string_view fmt, Args&&... args) {
  return Error{fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...)};
}

// A required module is not among the modules available for import.
using module_not_found_error = named_runtime_error<class module_not_found_tag>;

// A program was evaluated with no modules at all.
using empty_module_list_error
  = named_runtime_error<class empty_module_list_tag>;

// Generic failure raised by an analysis while evaluating a term.
using evaluation_error = named_runtime_error<class evaluation_error_tag>;

using unbound_variable_error = named_runtime_error<class unbound_variable_tag>;

// The module evaluation signal was raised with no handler to receive it. This
// indicates a bug in the analysis, not in the analysed program.
class unhandled_signal_error : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

} // namespace absint

#endif
