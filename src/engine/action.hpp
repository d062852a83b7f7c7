#ifndef ABSINT_ENGINE_ACTION_HPP
#define ABSINT_ENGINE_ACTION_HPP

#include <fmt/format.h>

#include <exception>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

namespace absint {

// An action of the evaluator, used in error messages. If the action is left
// because of an exception, its description is appended to the backtrace.
template <typename Derived>
class action {
public:
  explicit
  action(std::string& backtrace)
    : backtrace_{backtrace}
    , exceptions_on_entry_{std::uncaught_exceptions()}
  { }

  action(action const&) = delete;
  void operator = (action const&) = delete;

protected:
  void
  check() {
    if (std::uncaught_exceptions() > exceptions_on_entry_) {
      if (!backtrace_.empty())
        backtrace_ += '\n';
      backtrace_ += static_cast<Derived*>(this)->format();
    }
  }

private:
  std::string& backtrace_;
  int          exceptions_on_entry_;
};

// Action described by a format string and its arguments.
template <typename... Args>
class simple_action : public action<simple_action<Args...>> {
  using base = action<simple_action<Args...>>;

public:
  simple_action(std::string& backtrace, std::string_view format,
                Args const&... args)
    : base{backtrace}
    , format_{format}
    , args_{args...}
  { }

  ~simple_action() { this->check(); }

  std::string
  format() const {
    return std::apply(
      [&] (auto const&... args) {
        return fmt::format(fmt::runtime(format_), args...);
      },
      args_
    );
  }

private:
  std::string_view    format_;
  std::tuple<Args...> args_;
};

template <typename... Args>
simple_action(std::string&, std::string_view, Args const&...)
  -> simple_action<Args...>;

} // namespace absint

#endif
