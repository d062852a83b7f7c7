#include "lang/reader.hpp"

#include <fmt/format.h>

#include <cctype>
#include <memory>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace absint {

parse_error::parse_error(std::string const& message,
                         source_location const& loc)
  : std::runtime_error{fmt::format("{}: {}", format_location(loc), message)}
  , location_{loc}
{ }

namespace {
  class reader_stream {
  public:
    reader_stream(std::string_view text, std::string file_name)
      : text_{text}
      , loc_{std::move(file_name), 1, 1}
    { }

    std::optional<char>
    peek() const {
      if (position_ < text_.size())
        return text_[position_];
      else
        return std::nullopt;
    }

    std::optional<char>
    read() {
      std::optional<char> c = peek();
      if (!c)
        return std::nullopt;

      ++position_;
      if (*c == '\n') {
        ++loc_.line;
        loc_.column = 1;
      } else
        ++loc_.column;

      return c;
    }

    source_location const&
    location() const { return loc_; }

  private:
    std::string_view text_;
    std::size_t      position_ = 0;
    source_location  loc_;
  };

  struct token {
    struct end { };
    struct left_paren { };
    struct right_paren { };

    struct string_literal {
      std::string value;
    };

    struct atom {
      std::string value;
    };

    using value_type = std::variant<
      end,
      left_paren,
      right_paren,
      string_literal,
      atom
    >;

    value_type      value;
    source_location location;
  };

  // Unparsed s-expression.
  struct datum {
    enum class type { atom, string, list };

    type                 kind;
    std::string          text;
    std::vector<datum>   elements;
    source_location      location;
  };
} // anonymous namespace

static bool
delimiter(char c) {
  return std::isspace(static_cast<unsigned char>(c)) || c == '(' || c == ')'
         || c == '"' || c == ';';
}

static void
skip_whitespace(reader_stream& stream) {
  std::optional<char> c = stream.peek();

  while (c && (std::isspace(static_cast<unsigned char>(*c)) || *c == ';')) {
    if (*c == ';')
      while ((c = stream.read()) && *c != '\n')
        ;
    else
      stream.read();

    c = stream.peek();
  }
}

static std::string
read_string_literal(reader_stream& stream, source_location const& start) {
  std::string result;
  while (true) {
    std::optional<char> c = stream.read();
    if (!c)
      throw parse_error{"Unterminated string literal", start};

    if (*c == '"')
      return result;

    if (*c == '\\') {
      std::optional<char> escaped = stream.read();
      if (!escaped)
        throw parse_error{"Unterminated string literal", start};
      result += *escaped;
    } else
      result += *c;
  }
}

static token
read_token(reader_stream& stream) {
  skip_whitespace(stream);

  source_location loc = stream.location();
  std::optional<char> c = stream.peek();
  if (!c)
    return token{token::end{}, loc};

  if (*c == '(') {
    stream.read();
    return token{token::left_paren{}, loc};
  } else if (*c == ')') {
    stream.read();
    return token{token::right_paren{}, loc};
  } else if (*c == '"') {
    stream.read();
    return token{token::string_literal{read_string_literal(stream, loc)}, loc};
  }

  std::string text;
  while (stream.peek() && !delimiter(*stream.peek()))
    text += *stream.read();
  return token{token::atom{std::move(text)}, loc};
}

static datum
read_list(reader_stream& stream, source_location const& start);

// Read one datum starting with the given token, which must not be the end of
// input or a right parenthesis.
static datum
read_datum(reader_stream& stream, token const& t) {
  if (std::holds_alternative<token::left_paren>(t.value))
    return read_list(stream, t.location);
  else if (auto const* s = std::get_if<token::string_literal>(&t.value))
    return datum{datum::type::string, s->value, {}, t.location};
  else if (auto const* a = std::get_if<token::atom>(&t.value))
    return datum{datum::type::atom, a->value, {}, t.location};
  else if (std::holds_alternative<token::right_paren>(t.value))
    throw parse_error{"Unexpected )", t.location};
  else
    throw parse_error{"Unexpected end of input", t.location};
}

static datum
read_list(reader_stream& stream, source_location const& start) {
  datum result{datum::type::list, {}, {}, start};
  while (true) {
    token t = read_token(stream);
    if (std::holds_alternative<token::right_paren>(t.value))
      return result;
    else if (std::holds_alternative<token::end>(t.value))
      throw parse_error{"Unterminated list", start};

    result.elements.push_back(read_datum(stream, t));
  }
}

static bool
looks_like_integer(std::string const& text) {
  std::size_t i = 0;
  if (text.size() > 1 && (text[0] == '-' || text[0] == '+'))
    i = 1;

  if (i == text.size())
    return false;

  for (; i < text.size(); ++i)
    if (!std::isdigit(static_cast<unsigned char>(text[i])))
      return false;

  return true;
}

static std::string const&
expect_identifier(datum const& d, std::string_view what) {
  if (d.kind != datum::type::atom || looks_like_integer(d.text))
    throw parse_error{fmt::format("Expected {}", what), d.location};
  return d.text;
}

static void
expect_arity(datum const& form, std::size_t expected, std::string_view syntax) {
  if (form.elements.size() != expected)
    throw parse_error{fmt::format("Invalid syntax, expected {}", syntax),
                      form.location};
}

static core_term
parse_form(datum const& d);

static std::vector<core_term>
parse_forms(std::vector<datum> const& data, std::size_t from) {
  std::vector<core_term> result;
  for (std::size_t i = from; i < data.size(); ++i)
    result.push_back(parse_form(data[i]));
  return result;
}

static core_term
parse_list_form(datum const& d) {
  if (d.elements.empty())
    throw parse_error{"Empty form", d.location};

  std::string const& head = expect_identifier(d.elements.front(), "form name");
  using kind = core_term::kind;

  if (head == "define") {
    expect_arity(d, 3, "(define <name> <form>)");
    return core_term{kind::define,
                     expect_identifier(d.elements[1], "variable name"),
                     parse_forms(d.elements, 2), d.location};
  } else if (head == "export") {
    if (d.elements.size() != 2 && d.elements.size() != 3)
      throw parse_error{"Invalid syntax, expected (export <name> [<alias>])",
                        d.location};

    core_term result{kind::export_,
                     expect_identifier(d.elements[1], "exported name"),
                     {}, d.location};
    if (d.elements.size() == 3)
      result.set_alias(expect_identifier(d.elements[2], "export alias"));
    return result;
  } else if (head == "import") {
    expect_arity(d, 2, "(import \"<module>\")");
    if (d.elements[1].kind != datum::type::string)
      throw parse_error{"Expected module name string", d.elements[1].location};
    return core_term{kind::import_, d.elements[1].text, {}, d.location};
  } else if (head == "let") {
    expect_arity(d, 4, "(let <name> <form> <form>)");
    return core_term{kind::let,
                     expect_identifier(d.elements[1], "variable name"),
                     parse_forms(d.elements, 2), d.location};
  } else if (head == "+" || head == "-") {
    expect_arity(d, 3, fmt::format("({} <form> <form>)", head));
    return core_term{head == "+" ? kind::add : kind::subtract, {},
                     parse_forms(d.elements, 1), d.location};
  } else if (head == "if") {
    expect_arity(d, 4, "(if <form> <form> <form>)");
    return core_term{kind::if_, {}, parse_forms(d.elements, 1), d.location};
  } else if (head == "begin")
    return core_term{kind::begin, {}, parse_forms(d.elements, 1), d.location};
  else
    throw parse_error{fmt::format("Unknown form {}", head), d.location};
}

static core_term
parse_form(datum const& d) {
  switch (d.kind) {
  case datum::type::atom:
    if (looks_like_integer(d.text))
      return core_term{core_term::kind::integer, d.text, {}, d.location};
    else
      return core_term{core_term::kind::reference, d.text, {}, d.location};

  case datum::type::string:
    throw parse_error{"Unexpected string literal", d.location};

  case datum::type::list:
    return parse_list_form(d);
  }

  throw parse_error{"Invalid datum", d.location};
}

core_term
read_core_program(std::string_view text, std::string const& file_name) {
  reader_stream stream{text, file_name};
  std::vector<datum> data;

  while (true) {
    token t = read_token(stream);
    if (std::holds_alternative<token::end>(t.value))
      break;
    data.push_back(read_datum(stream, t));
  }

  return core_term{core_term::kind::program, {}, parse_forms(data, 0),
                   source_location{file_name, 1, 1}};
}

} // namespace absint
