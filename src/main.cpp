#include "engine/evaluation_config.hpp"
#include "engine/evaluator.hpp"
#include "engine/run.hpp"
#include "engine/tracing.hpp"
#include "lang/core_semantics.hpp"
#include "lang/module_loader.hpp"
#include "lang/values.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {
  struct options {
    std::string              domain = "concrete";
    absint::empty_exports_policy empty_exports
                               = absint::empty_exports_policy::export_all;
    absint::merge_policy     merge = absint::merge_policy::first_wins;
    bool                     trace = false;
    bool                     verbose = false;
    std::vector<std::string> positional;
  };

  class options_parse_error : public std::runtime_error {
  public:
    options_parse_error()
      : std::runtime_error{"Bad option"}
    { }
  };
}

static void
print_usage(char const* program_name) {
  fmt::print("{} [<options> ...] <entry module> [<directory>]", program_name);
  fmt::print(R"(
Options:
  -d <domain>       -- value domain: concrete (default) or types
  -e all|none       -- what a module without exports exposes; default: all
  -m first|last     -- which binding wins when modules share a name;
                       default: first
  -t                -- trace the configuration of every evaluated term
  -v                -- show diagnostics
)");
}

static options
parse_options(int argc, char** argv) {
  options opts;

  for (int i = 1; i < argc; ++i) {
    if (argv[i][0] == '-') {
      std::string flag = argv[i];

      if (flag == "-t") {
        opts.trace = true;
        continue;
      } else if (flag == "-v") {
        opts.verbose = true;
        continue;
      } else if (flag == "-")
        throw options_parse_error{};

      std::string argument;
      if (flag.size() > 2) {
        argument = flag.substr(2);
        flag = flag.substr(0, 2);
      } else {
        if (i + 1 == argc)
          throw options_parse_error{};

        argument = argv[i + 1];
        ++i;
      }

      if (flag == "-d") {
        if (argument != "concrete" && argument != "types")
          throw options_parse_error{};
        opts.domain = std::move(argument);
      } else if (flag == "-e") {
        if (argument == "all")
          opts.empty_exports = absint::empty_exports_policy::export_all;
        else if (argument == "none")
          opts.empty_exports = absint::empty_exports_policy::export_none;
        else
          throw options_parse_error{};
      } else if (flag == "-m") {
        if (argument == "first")
          opts.merge = absint::merge_policy::first_wins;
        else if (argument == "last")
          opts.merge = absint::merge_policy::last_wins;
        else
          throw options_parse_error{};
      } else
        throw options_parse_error{};
    } else
      opts.positional.emplace_back(argv[i]);
  }

  if (opts.positional.empty() || opts.positional.size() > 2)
    throw options_parse_error{};

  return opts;
}

// The entry module first, then everything else.
static std::vector<absint::core_module>
order_modules(std::vector<absint::core_module> modules,
              absint::module_name const& entry) {
  std::vector<absint::core_module> result;
  for (auto it = modules.begin(); it != modules.end(); ++it)
    if (it->name == entry) {
      result.push_back(std::move(*it));
      modules.erase(it);
      break;
    }

  if (result.empty())
    throw absint::make_error<absint::module_not_found_error>(
      "Cannot find entry module {}", entry
    );

  for (absint::core_module& m : modules)
    result.push_back(std::move(m));
  return result;
}

template <typename Value>
static std::string
show_values(absint::store<absint::location_for<Value>, Value> const& heap,
            absint::location_for<Value> const& address) {
  std::vector<std::string> values;
  if (auto const* cell = heap.lookup(address))
    for (Value const& v : *cell)
      values.push_back(show(v));
  return fmt::format("{{{}}}", fmt::join(values, ", "));
}

template <typename Value>
static void
print_report(absint::run_result<absint::core_term, Value> const& result) {
  fmt::print("Result: {}\n", show(result.value()));

  auto const& state = result.state;
  for (auto const& [name, env] : state.module_cache) {
    fmt::print("Module {}:\n", name);
    for (auto const& [symbol, address] : env.bindings())
      fmt::print("  {} {} {}\n", symbol, absint::format_address(address),
                 show_values(state.heap, address));
  }

  fmt::print("Imports:\n");
  for (auto const& [importer, imported] : state.imports.edges())
    fmt::print("  {} -> {}\n", importer, imported);
}

template <typename Value>
static void
print_trace(
  std::vector<absint::configuration<absint::core_term, Value>> const& trace
) {
  fmt::print("Trace:\n");
  for (auto const& c : trace)
    fmt::print("  {} {} (locals: {}, store: {})\n",
               absint::format_location(c.term->location()),
               absint::kind_name(c.term->get_kind()), c.local_env.size(),
               c.heap.size());
}

template <absint::core_domain Value>
static int
run_domain(options const& opts, std::vector<absint::core_module> const& modules,
           absint::diagnostic_sink& diagnostics) {
  absint::evaluation_config config{opts.empty_exports, opts.merge, diagnostics};
  absint::core_semantics<Value> semantics;

  absint::run_result<absint::core_term, Value> result;
  if (opts.trace) {
    absint::tracing_analysis<absint::core_term, Value> tracing{semantics};
    result = absint::run_analysis(tracing, config, modules);
    print_trace(tracing.trace());
  } else
    result = absint::run_analysis(semantics, config, modules);

  if (!result.succeeded()) {
    fmt::print("Error: {}\n", result.error_message());
    return EXIT_FAILURE;
  }

  print_report(result);
  return EXIT_SUCCESS;
}

static int
run(int argc, char** argv) {
  options opts = parse_options(argc, argv);

  std::filesystem::path directory
    = opts.positional.size() == 2 ? opts.positional[1] : ".";
  auto modules = order_modules(absint::load_core_modules(directory),
                               opts.positional.front());

  absint::stdout_diagnostic_sink stdout_sink;
  absint::diagnostic_sink& diagnostics
    = opts.verbose ? static_cast<absint::diagnostic_sink&>(stdout_sink)
                   : absint::null_diagnostic_sink::instance;

  if (opts.domain == "types")
    return run_domain<absint::type_value>(opts, modules, diagnostics);
  else
    return run_domain<absint::concrete_value>(opts, modules, diagnostics);
}

int
main(int argc, char** argv) {
  try {
    return run(argc, argv);
  } catch (options_parse_error const&) {
    print_usage(argv[0]);
    return 1;
  } catch (std::runtime_error const& e) {
    fmt::print("Error: {}\n", e.what());
    return 1;
  }
}
