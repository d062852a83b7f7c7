#ifndef ABSINT_ABSTRACT_CONFIGURATION_HPP
#define ABSINT_ABSTRACT_CONFIGURATION_HPP

#include "abstract/address.hpp"
#include "abstract/environment.hpp"
#include "abstract/live.hpp"
#include "abstract/store.hpp"

namespace absint {

// Snapshot of one evaluation state: the term being evaluated, the live roots,
// the local environment and the store. Two equal configurations describe the
// same state; terms are compared by identity.
template <typename Term, typename Value>
struct configuration {
  using address_type = location_for<Value>;

  Term const*                       term;
  live<address_type>                roots;
  environment<address_type>         local_env;
  store<address_type, Value>        heap;

  friend bool
  operator == (configuration const&, configuration const&) = default;
};

} // namespace absint

#endif
