#ifndef ABSINT_UTIL_DEPTH_FIRST_SEARCH_HPP
#define ABSINT_UTIL_DEPTH_FIRST_SEARCH_HPP

#include <cstddef>
#include <utility>
#include <vector>

namespace absint {

namespace detail {
  enum class direction { in, out };
}

template <typename Node>
class dfs_stack {
public:
  struct record {
    Node              node;
    detail::direction dir;
  };

  void
  push_back(Node n) {
    stack_.push_back(record{std::move(n), detail::direction::in});
  }

  record&
  back() { return stack_.back(); }

  void
  pop_back() { stack_.pop_back(); }

  bool
  empty() const { return stack_.empty(); }

  std::size_t
  size() const { return stack_.size(); }

private:
  std::vector<record> stack_;
};

// Iterative depth-first traversal. The visitor's enter(node, stack) is called
// when a node is first reached and pushes the successors to be visited. If
// enter returns false, the node is not expanded: it must then push nothing, and
// leave is not called for it. Otherwise leave(node) is called once all nodes
// pushed by enter have been left.
template <typename Node, typename Visitor>
void
depth_first_search(std::vector<Node> const& roots, Visitor&& v) {
  dfs_stack<Node> stack;
  for (auto it = roots.rbegin(); it != roots.rend(); ++it)
    stack.push_back(*it);

  while (!stack.empty()) {
    auto& current = stack.back();
    switch (current.dir) {
    case detail::direction::in: {
      current.dir = detail::direction::out;
      Node n = current.node;
      if (!v.enter(n, stack))
        stack.pop_back();
      break;
    }

    case detail::direction::out: {
      Node n = std::move(current.node);
      stack.pop_back();
      v.leave(n);
      break;
    }
    }
  }
}

template <typename Node, typename Visitor>
void
depth_first_search(Node n, Visitor&& v) {
  depth_first_search(std::vector<Node>{std::move(n)}, v);
}

} // namespace absint

#endif
