#ifndef ABSINT_UTIL_SCOPED_RESTORE_HPP
#define ABSINT_UTIL_SCOPED_RESTORE_HPP

#include <utility>

namespace absint {

// Remembers the value of a variable and puts it back when the scope is left,
// whether normally or by an exception.
template <typename T>
class scoped_restore {
public:
  [[nodiscard]] explicit
  scoped_restore(T& target)
    : target_{target}
    , saved_{target}
  { }

  ~scoped_restore() { target_ = std::move(saved_); }

  scoped_restore(scoped_restore const&) = delete;
  void operator = (scoped_restore const&) = delete;

  T const&
  saved() const { return saved_; }

private:
  T& target_;
  T  saved_;
};

[[nodiscard]]
inline auto
restore_on_exit(auto& target) {
  return scoped_restore{target};
}

} // namespace absint

#endif
