#ifndef ABSINT_ABSTRACT_MODULE_HPP
#define ABSINT_ABSTRACT_MODULE_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

namespace absint {

using module_name = std::string;

// A named unit of source code: one parsed file or compilation unit. Several
// modules may share one name; together they make up one logical module.
template <typename Term>
struct module_ {
  module_name                 name;
  std::filesystem::path       path;
  std::shared_ptr<Term const> body;
};

template <typename Term>
module_<Term>
make_module(module_name name, std::filesystem::path path, Term body) {
  return module_<Term>{std::move(name), std::move(path),
                       std::make_shared<Term const>(std::move(body))};
}

} // namespace absint

#endif
