#ifndef ABSINT_ABSTRACT_EXPORTS_HPP
#define ABSINT_ABSTRACT_EXPORTS_HPP

#include "abstract/environment.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace absint {

// What a module with an empty export set exposes to its importers. This
// differs between source languages, so it is left to the caller.
enum class empty_exports_policy {
  export_all,
  export_none
};

// The names a module makes visible to importers. Each exported name refers to
// an original name in the module, and possibly directly to an address.
template <typename Address>
class exports {
public:
  struct entry {
    std::string            original;
    std::optional<Address> address;

    friend bool
    operator == (entry const&, entry const&) = default;
  };

  // Export `original` under the name `exported`.
  void
  insert(std::string exported, std::string original,
         std::optional<Address> address = std::nullopt) {
    entries_.insert_or_assign(std::move(exported),
                              entry{std::move(original), std::move(address)});
  }

  bool
  null() const { return entries_.empty(); }

  std::size_t
  size() const { return entries_.size(); }

  entry const*
  find(std::string const& exported) const {
    if (auto it = entries_.find(exported); it != entries_.end())
      return &it->second;
    else
      return nullptr;
  }

  std::vector<std::string>
  names() const {
    std::vector<std::string> result;
    for (auto const& [name, e] : entries_)
      result.push_back(name);
    return result;
  }

  // Exported names whose address is known.
  environment<Address>
  to_environment() const {
    typename environment<Address>::frame result;
    for (auto const& [name, e] : entries_)
      if (e.address)
        result.emplace(name, *e.address);
    return environment<Address>{std::move(result)};
  }

  // (original, exported) pairs.
  std::vector<std::pair<std::string, std::string>>
  aliases() const {
    std::vector<std::pair<std::string, std::string>> result;
    for (auto const& [name, e] : entries_)
      result.emplace_back(e.original, name);
    return result;
  }

  friend bool
  operator == (exports const&, exports const&) = default;

private:
  std::map<std::string, entry> entries_;
};

// Restrict an environment to what the export set makes visible. Addresses
// recorded in the export set take precedence over bindings found through the
// aliases.
template <typename Address>
environment<Address>
filter_environment(exports<Address> const& ports,
                   environment<Address> const& env,
                   empty_exports_policy policy) {
  if (ports.null()) {
    if (policy == empty_exports_policy::export_all)
      return env;
    else
      return {};
  }

  return ports.to_environment().merge(env.overwrite(ports.aliases()),
                                      merge_policy::first_wins);
}

} // namespace absint

#endif
