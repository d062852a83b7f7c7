#ifndef ABSINT_LANG_MODULE_LOADER_HPP
#define ABSINT_LANG_MODULE_LOADER_HPP

#include "abstract/module.hpp"
#include "lang/core_term.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace absint {

using core_module = module_<core_term>;

// Extension of core-language source files.
constexpr std::string_view core_extension = ".core";

core_module
make_core_module(module_name name, std::filesystem::path const& path,
                 std::string_view text);

// Name of the module defined by the file at path, relative to root: the
// relative path without its extension, with components separated by /.
module_name
module_name_for(std::filesystem::path const& root,
                std::filesystem::path const& path);

// Parse every core source file under the directory, recursively, ordered by
// path.
std::vector<core_module>
load_core_modules(std::filesystem::path const& directory);

} // namespace absint

#endif
