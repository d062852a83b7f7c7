#ifndef ABSINT_ABSTRACT_ENVIRONMENT_HPP
#define ABSINT_ABSTRACT_ENVIRONMENT_HPP

#include "abstract/live.hpp"

#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace absint {

// Which side wins when two environments bind the same name.
enum class merge_policy {
  first_wins,
  last_wins
};

// Map from variable names to addresses, organised as a stack of frames. The
// innermost frame shadows the outer ones.
//
// Frames are shared between copies and copied on write, so an environment
// behaves as a value: modifying one never affects another, and saving an
// environment before a nested scope is enough to restore it afterwards.
template <typename Address>
class environment {
public:
  using frame = std::map<std::string, Address>;

  environment()
    : frames_{std::make_shared<frame>()}
  { }

  environment(std::initializer_list<std::pair<std::string const, Address>> bs)
    : frames_{std::make_shared<frame>(bs)}
  { }

  explicit
  environment(frame f)
    : frames_{std::make_shared<frame>(std::move(f))}
  { }

  std::optional<Address>
  lookup(std::string const& name) const {
    for (auto const& f : frames_ | std::views::reverse)
      if (auto it = f->find(name); it != f->end())
        return it->second;

    return std::nullopt;
  }

  bool
  contains(std::string const& name) const { return lookup(name).has_value(); }

  // Bind a name in the innermost frame, replacing any binding of that name in
  // that frame.
  void
  insert(std::string const& name, Address a) {
    writable_head()[name] = std::move(a);
  }

  void
  push() { frames_.push_back(std::make_shared<frame>()); }

  // Drop the innermost frame. Popping the last frame leaves a single empty one.
  void
  pop() {
    if (frames_.size() > 1)
      frames_.pop_back();
    else
      frames_.back() = std::make_shared<frame>();
  }

  std::size_t
  depth() const { return frames_.size(); }

  // The innermost frame only.
  environment
  head() const { return environment{*frames_.back()}; }

  // All visible bindings; for a shadowed name, the innermost binding.
  frame
  bindings() const {
    frame result;
    for (auto const& f : frames_ | std::views::reverse)
      result.insert(f->begin(), f->end());
    return result;
  }

  std::set<std::string>
  names() const {
    std::set<std::string> result;
    for (auto const& f : frames_)
      for (auto const& [name, address] : *f)
        result.insert(name);
    return result;
  }

  std::size_t
  size() const { return names().size(); }

  bool
  empty() const {
    for (auto const& f : frames_)
      if (!f->empty())
        return false;
    return true;
  }

  // Every address bound in any frame, shadowed bindings included.
  live<Address>
  roots() const {
    live<Address> result;
    for (auto const& f : frames_)
      for (auto const& [name, address] : *f)
        result.insert(address);
    return result;
  }

  // Union of the visible bindings of both environments, as a single frame.
  environment
  merge(environment const& other, merge_policy policy) const {
    frame result = bindings();
    for (auto const& [name, address] : other.bindings()) {
      if (policy == merge_policy::last_wins)
        result.insert_or_assign(name, address);
      else
        result.emplace(name, address);
    }
    return environment{std::move(result)};
  }

  // For each (from, to) pair whose `from` is bound here, bind `to` to the same
  // address. Only the names produced this way are present in the result.
  environment
  overwrite(std::vector<std::pair<std::string, std::string>> const& aliases)
    const
  {
    frame result;
    for (auto const& [from, to] : aliases)
      if (auto a = lookup(from))
        result.insert_or_assign(to, *a);
    return environment{std::move(result)};
  }

  friend bool
  operator == (environment const& lhs, environment const& rhs) {
    if (lhs.frames_.size() != rhs.frames_.size())
      return false;

    for (std::size_t i = 0; i < lhs.frames_.size(); ++i)
      if (*lhs.frames_[i] != *rhs.frames_[i])
        return false;

    return true;
  }

private:
  // Invariant: never empty.
  std::vector<std::shared_ptr<frame>> frames_;

  frame&
  writable_head() {
    if (frames_.back().use_count() > 1)
      frames_.back() = std::make_shared<frame>(*frames_.back());
    return *frames_.back();
  }
};

} // namespace absint

#endif
