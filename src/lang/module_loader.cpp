#include "lang/module_loader.hpp"

#include "engine/error.hpp"
#include "lang/reader.hpp"

#include <algorithm>
#include <fstream>
#include <utility>
#include <sstream>

namespace absint {

core_module
make_core_module(module_name name, std::filesystem::path const& path,
                 std::string_view text) {
  return make_module(std::move(name), path,
                     read_core_program(text, path.string()));
}

module_name
module_name_for(std::filesystem::path const& root,
                std::filesystem::path const& path) {
  std::filesystem::path relative = path.lexically_relative(root);
  relative.replace_extension();
  return relative.generic_string();
}

static std::string
read_file(std::filesystem::path const& path) {
  std::ifstream in{path};
  if (!in)
    throw make_error("Can't open {} for reading", path.string());

  std::ostringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

std::vector<core_module>
load_core_modules(std::filesystem::path const& directory) {
  if (!std::filesystem::is_directory(directory))
    throw make_error("{} is not a directory", directory.string());

  std::vector<std::filesystem::path> paths;
  for (auto const& entry
       : std::filesystem::recursive_directory_iterator{directory})
    if (entry.is_regular_file() && entry.path().extension()
                                        == std::filesystem::path{core_extension})
      paths.push_back(entry.path());

  std::ranges::sort(paths);

  std::vector<core_module> result;
  for (std::filesystem::path const& p : paths)
    result.push_back(make_core_module(module_name_for(directory, p), p,
                                      read_file(p)));
  return result;
}

} // namespace absint
