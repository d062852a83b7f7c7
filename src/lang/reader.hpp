#ifndef ABSINT_LANG_READER_HPP
#define ABSINT_LANG_READER_HPP

#include "engine/source_location.hpp"
#include "lang/core_term.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

namespace absint {

class parse_error : public std::runtime_error {
public:
  parse_error(std::string const& message, source_location const&);

  source_location const&
  location() const { return location_; }

private:
  source_location location_;
};

// Parse the text of a core-language source file into a program term.
core_term
read_core_program(std::string_view text, std::string const& file_name);

} // namespace absint

#endif
