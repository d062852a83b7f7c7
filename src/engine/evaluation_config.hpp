#ifndef ABSINT_ENGINE_EVALUATION_CONFIG_HPP
#define ABSINT_ENGINE_EVALUATION_CONFIG_HPP

#include "abstract/environment.hpp"
#include "abstract/exports.hpp"
#include "engine/source_location.hpp"

#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace absint {

class diagnostic_sink {
public:
  virtual
  ~diagnostic_sink() = default;

  // Output the message unless the same message has already been shown for the
  // same location.
  void
  show(source_location const& location, std::string const& message);

private:
  std::unordered_set<std::string> emitted_;

  virtual void
  output(source_location const&, std::string const&) = 0;
};

class null_diagnostic_sink final : public diagnostic_sink {
public:
  static null_diagnostic_sink instance;

private:
  void
  output(source_location const&, std::string const&) override { }
};

class stdout_diagnostic_sink final : public diagnostic_sink {
  void
  output(source_location const&, std::string const&) override;
};

class delegate_diagnostic_sink final : public diagnostic_sink {
public:
  explicit
  delegate_diagnostic_sink(diagnostic_sink& other);

private:
  diagnostic_sink& target_;

  void
  output(source_location const& loc, std::string const& msg) override;
};

// Keeps every message, formatted as "<location>: <message>".
class collecting_diagnostic_sink final : public diagnostic_sink {
public:
  std::vector<std::string> const&
  messages() const { return messages_; }

  bool
  contains(std::string const& message) const;

private:
  std::vector<std::string> messages_;

  void
  output(source_location const& loc, std::string const& msg) override;
};

struct evaluation_config {
  empty_exports_policy empty_exports = empty_exports_policy::export_all;
  merge_policy         merge         = merge_policy::first_wins;
  diagnostic_sink&     diagnostics;

  explicit
  evaluation_config(diagnostic_sink& diagnostics)
    : diagnostics{diagnostics}
  { }

  evaluation_config(empty_exports_policy empty_exports, merge_policy merge,
                    diagnostic_sink& diagnostics)
    : empty_exports{empty_exports}
    , merge{merge}
    , diagnostics{diagnostics}
  { }

  // Modules with no exports expose all their bindings; the first definition of
  // a name wins.
  static evaluation_config
  default_config(diagnostic_sink& = null_diagnostic_sink::instance);

  // Modules with no exports expose nothing.
  static evaluation_config
  strict_config(diagnostic_sink& = null_diagnostic_sink::instance);
};

} // namespace absint

#endif
