#include "lang/core_term.hpp"

#include "engine/error.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <charconv>

namespace absint {

std::int64_t
core_term::integer_value() const {
  char const* begin = atom_.data();
  if (atom_.size() > 1 && atom_.front() == '+')
    ++begin;

  std::int64_t result{};
  auto [end, ec] = std::from_chars(begin, atom_.data() + atom_.size(), result);
  if (ec != std::errc{} || end != atom_.data() + atom_.size())
    throw make_error<evaluation_error>("{}: Invalid integer literal {}",
                                       format_location(location_), atom_);
  return result;
}

std::string
kind_name(core_term::kind k) {
  switch (k) {
  case core_term::kind::program:   return "program";
  case core_term::kind::integer:   return "integer";
  case core_term::kind::reference: return "reference";
  case core_term::kind::define:    return "define";
  case core_term::kind::export_:   return "export";
  case core_term::kind::import_:   return "import";
  case core_term::kind::let:       return "let";
  case core_term::kind::add:       return "+";
  case core_term::kind::subtract:  return "-";
  case core_term::kind::if_:       return "if";
  case core_term::kind::begin:     return "begin";
  }

  return "<invalid>";
}

static std::string
show_children(core_term const& t) {
  std::vector<std::string> children;
  for (core_term const& child : t.children())
    children.push_back(show(child));
  return fmt::format("{}", fmt::join(children, " "));
}

std::string
show(core_term const& t) {
  switch (t.get_kind()) {
  case core_term::kind::integer:
  case core_term::kind::reference:
    return t.atom();

  case core_term::kind::import_:
    return fmt::format("(import \"{}\")", t.atom());

  case core_term::kind::export_:
    if (t.alias())
      return fmt::format("(export {} {})", t.atom(), *t.alias());
    else
      return fmt::format("(export {})", t.atom());

  case core_term::kind::define:
  case core_term::kind::let:
    return fmt::format("({} {} {})", kind_name(t.get_kind()), t.atom(),
                       show_children(t));

  case core_term::kind::program:
  case core_term::kind::add:
  case core_term::kind::subtract:
  case core_term::kind::if_:
  case core_term::kind::begin:
    if (t.children().empty())
      return fmt::format("({})", kind_name(t.get_kind()));
    return fmt::format("({} {})", kind_name(t.get_kind()), show_children(t));
  }

  return "<invalid>";
}

} // namespace absint
