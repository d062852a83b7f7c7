#ifndef ABSINT_LANG_CORE_TERM_HPP
#define ABSINT_LANG_CORE_TERM_HPP

#include "engine/source_location.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace absint {

// Syntax tree of the core language.
//
//   program   -- top-level forms; children are the forms
//   integer   -- atom is the literal value
//   reference -- atom is the variable name
//   define    -- atom is the name; one child, the value
//   export_   -- atom is the name, alias the exported name; no children
//   import_   -- atom is the module name; no children
//   let       -- atom is the name; children are the value and the body
//   add, subtract
//             -- two children
//   if_       -- condition, consequent, alternative
//   begin     -- children are the forms
class core_term {
public:
  enum class kind {
    program,
    integer,
    reference,
    define,
    export_,
    import_,
    let,
    add,
    subtract,
    if_,
    begin
  };

  core_term(kind k, std::string atom, std::vector<core_term> children,
            source_location location)
    : kind_{k}
    , atom_{std::move(atom)}
    , children_{std::move(children)}
    , location_{std::move(location)}
  { }

  kind
  get_kind() const { return kind_; }

  std::string const&
  atom() const { return atom_; }

  // The name an export_ term exports under: the alias if one was given,
  // otherwise the atom.
  std::string const&
  exported_name() const { return alias_ ? *alias_ : atom_; }

  std::optional<std::string> const&
  alias() const { return alias_; }

  void
  set_alias(std::string alias) { alias_ = std::move(alias); }

  std::int64_t
  integer_value() const;

  std::vector<core_term> const&
  children() const { return children_; }

  source_location const&
  location() const { return location_; }

  template <typename F>
  void
  visit_subterms(F&& f) const {
    for (core_term const& child : children_)
      f(child);
  }

private:
  kind                       kind_;
  std::string                atom_;
  std::optional<std::string> alias_;
  std::vector<core_term>     children_;
  source_location            location_;
};

std::string
kind_name(core_term::kind);

// Render the term as an s-expression.
std::string
show(core_term const&);

} // namespace absint

#endif
