/*
MIT License

Copyright (c) 2026 The lime contributors

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#ifndef LIME_HPP
#define LIME_HPP

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <iostream>
#include <limits>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/// Goals
// * a lazy, curried lambda language with a small fixed set of builtins
// * one statement per line, every statement evaluated against one top level scope
// * header only and embeddable, native functions can be added from C++
// * no exceptions, errors are values
// * everything lives in arenas owned by the interpreter and is referred to by index
// * all values are immutable and trivially copyable
// * C++23 as a minimum
// * never thread safe

/// Notes
// * arguments are never evaluated at the call site, they become thunks that are forced at most once
// * `=` `<` and `>` take both branches as arguments and only ever force one of them
// * recursion is done by passing a function to itself, a binding can't see itself until it exists
// * list literals are evaluated eagerly, their elements are plain values
// * nothing is ever freed, the arenas grow for the lifetime of an interpreter

/// To do
// * arenas could be compacted between top level statements, nothing but the global scope is live then


namespace lime {

inline constexpr int lime_version_major{ 0 };
inline constexpr int lime_version_minor{ 0 };
inline constexpr int lime_version_patch{ 1 };
inline constexpr int lime_version_tweak{};


enum struct token_kind : std::uint8_t {
  identifier,
  number,
  string,
  lambda,
  dot,
  assign,
  lparen,
  rparen,
  lbracket,
  rbracket,
  comma,
  eof,
  error,
};

struct Token
{
  token_kind kind{ token_kind::eof };
  std::string_view parsed;
  std::string_view remaining;
  // only set for token_kind::error
  std::string_view error{};
};

[[nodiscard]] constexpr bool is_eol(char ch) noexcept { return ch == '\n' || ch == '\r'; }

[[nodiscard]] constexpr bool is_whitespace(char ch) noexcept
{
  return ch == ' ' || ch == '\t' || ch == '\v' || ch == '\f' || is_eol(ch);
}

[[nodiscard]] constexpr bool is_digit(char ch) noexcept { return ch >= '0' && ch <= '9'; }

[[nodiscard]] constexpr bool is_reserved(char ch) noexcept
{
  return std::string_view{ "\\.()[],\";" }.find(ch) != std::string_view::npos;
}

[[nodiscard]] constexpr std::optional<char> unescape(char code) noexcept
{
  switch (code) {
  case 'n':
    return '\n';
  case 't':
    return '\t';
  case 'r':
    return '\r';
  case 'b':
    return '\b';
  case 'f':
    return '\f';
  case 'v':
    return '\v';
  case 's':
    return ' ';
  case '\\':
    return '\\';
  case '"':
    return '"';
  default:
    return std::nullopt;
  }
}

[[nodiscard]] constexpr Token next_token(std::string_view input)
{
  constexpr auto consume = [](std::string_view ws_input, auto predicate) {
    auto begin = ws_input.begin();
    while (begin != ws_input.end() && predicate(*begin)) { ++begin; }
    return std::string_view{ begin, ws_input.end() };
  };

  constexpr auto make_token = [=](token_kind kind, std::string_view token_input, std::size_t size) {
    return Token{ kind, token_input.substr(0, size), consume(token_input.substr(size), is_whitespace) };
  };

  constexpr auto make_error = [](std::string_view token_input, std::size_t size, std::string_view description) {
    return Token{ token_kind::error, token_input.substr(0, size), token_input.substr(size), description };
  };

  input = consume(input, is_whitespace);

  // comment
  while (input.starts_with(';')) {
    input = consume(input, [](auto ch) { return !is_eol(ch); });
    input = consume(input, is_whitespace);
  }

  if (input.empty()) { return Token{ token_kind::eof, input, input }; }

  if (input.starts_with(":=")) { return make_token(token_kind::assign, input, 2); }

  switch (input.front()) {
  case '\\':
    return make_token(token_kind::lambda, input, 1);
  case '.':
    return make_token(token_kind::dot, input, 1);
  case '(':
    return make_token(token_kind::lparen, input, 1);
  case ')':
    return make_token(token_kind::rparen, input, 1);
  case '[':
    return make_token(token_kind::lbracket, input, 1);
  case ']':
    return make_token(token_kind::rbracket, input, 1);
  case ',':
    return make_token(token_kind::comma, input, 1);
  default:
    break;
  }

  // quoted string, escapes are validated here and decoded by the parser
  if (input.starts_with('"')) {
    auto location = std::next(input.begin());
    while (location != input.end() && *location != '"') {
      if (*location == '\\') {
        ++location;
        if (location == input.end()) { break; }
        if (!unescape(*location)) {
          return make_error(input,
            static_cast<std::size_t>(std::distance(input.begin(), location)) + 1,
            "invalid escape code");
        }
      }
      ++location;
    }

    if (location == input.end()) { return make_error(input, input.size(), "unterminated string literal"); }

    return make_token(token_kind::string, input, static_cast<std::size_t>(std::distance(input.begin(), location)) + 1);
  }

  // number, with an optional sign directly in front of the first digit
  const auto unsigned_part = (input.starts_with('-') || input.starts_with('+')) ? input.substr(1) : input;
  if (!unsigned_part.empty() && is_digit(unsigned_part.front())) {
    const auto after_integer = consume(unsigned_part, is_digit);
    if (!after_integer.starts_with('.')) {
      return make_token(token_kind::number, input, input.size() - after_integer.size());
    }

    const auto after_fraction = consume(after_integer.substr(1), is_digit);
    if (after_fraction.size() == after_integer.size() - 1) {
      return make_error(input, input.size() - after_fraction.size(), "expected digit after decimal point");
    }
    return make_token(token_kind::number, input, input.size() - after_fraction.size());
  }

  // everything else is an identifier, operators included
  auto end = input.begin();
  while (end != input.end() && !is_whitespace(*end) && !is_reserved(*end)
         && !std::string_view{ end, input.end() }.starts_with(":=")) {
    ++end;
  }

  return make_token(token_kind::identifier, input, static_cast<std::size_t>(std::distance(input.begin(), end)));
}

// the last token is always token_kind::eof or token_kind::error
[[nodiscard]] constexpr std::vector<Token> tokenize(std::string_view input)
{
  std::vector<Token> result;
  auto token = next_token(input);
  result.push_back(token);

  while (token.kind != token_kind::eof && token.kind != token_kind::error) {
    token = next_token(token.remaining);
    result.push_back(token);
  }

  return result;
}

[[nodiscard]] constexpr bool is_continuation_byte(char ch) noexcept
{
  return (static_cast<unsigned char>(ch) & 0xC0U) == 0x80U;
}

// a code point is a byte followed by any continuation bytes, a stray continuation byte counts as one
[[nodiscard]] constexpr std::size_t utf8_next(std::string_view input, std::size_t start) noexcept
{
  auto end = start + 1;
  while (end < input.size() && is_continuation_byte(input[end])) { ++end; }
  return end;
}

[[nodiscard]] constexpr std::size_t utf8_length(std::string_view input) noexcept
{
  std::size_t count = 0;
  for (std::size_t start = 0; start < input.size(); start = utf8_next(input, start)) { ++count; }
  return count;
}

// {offset, size} in bytes of the code point at `index`, {input.size(), 0} if there is none
[[nodiscard]] constexpr std::pair<std::size_t, std::size_t> utf8_character(std::string_view input,
  std::size_t index) noexcept
{
  std::size_t start = 0;
  for (std::size_t count = 0; start < input.size(); ++count) {
    const auto end = utf8_next(input, start);
    if (count == index) { return { start, end - start }; }
    start = end;
  }
  return { input.size(), 0 };
}

template<std::floating_point T> [[nodiscard]] std::pair<bool, T> parse_number(std::string_view input) noexcept
{
  static constexpr std::pair<bool, T> failure{ false, 0 };

  while (!input.empty() && is_whitespace(input.front())) { input.remove_prefix(1); }
  while (!input.empty() && is_whitespace(input.back())) { input.remove_suffix(1); }

  // from_chars does not accept a leading '+'
  if (input.starts_with('+')) {
    input.remove_prefix(1);
    if (input.starts_with('-')) { return failure; }
  }

  if (input.empty()) { return failure; }

  T value{};
  const auto *const last = input.data() + input.size();
  const auto [ptr, error] = std::from_chars(input.data(), last, value);
  if (error != std::errc{} || ptr != last) { return failure; }

  return { true, value };
}

// shortest representation that round trips, "120" rather than "120.0"
template<std::floating_point T> [[nodiscard]] std::string format_number(T value)
{
  std::array<char, 64> buffer{};
  const auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
  return std::string(buffer.data(), result.ptr);
}

template<std::unsigned_integral SizeType> struct IndexedString
{
  using size_type = SizeType;
  size_type start{ 0 };
  size_type size{ 0 };
  [[nodiscard]] constexpr bool operator==(const IndexedString &) const noexcept = default;
  [[nodiscard]] constexpr bool empty() const noexcept { return size == 0; }
  [[nodiscard]] constexpr auto substr(const size_type from, const size_type count) const noexcept
  {
    return IndexedString{ static_cast<size_type>(start + from), count };
  }
};

template<std::unsigned_integral SizeType> struct IndexedList
{
  using size_type = SizeType;
  size_type start{ 0 };
  size_type size{ 0 };
  [[nodiscard]] constexpr bool operator==(const IndexedList &) const noexcept = default;
  [[nodiscard]] constexpr bool empty() const noexcept { return size == 0; }
  [[nodiscard]] constexpr size_type operator[](size_type index) const noexcept
  {
    return static_cast<size_type>(start + index);
  }
};


enum struct error_kind : std::uint8_t {
  lex_error,
  parse_error,
  unbound_identifier,
  not_callable,
  type_error,
  division_by_zero,
  index_out_of_range,
  number_parse_error,
  recursion_limit_exceeded,
};

[[nodiscard]] constexpr std::string_view kind_name(error_kind kind) noexcept
{
  switch (kind) {
  case error_kind::lex_error:
    return "lex";
  case error_kind::parse_error:
    return "parse";
  case error_kind::unbound_identifier:
    return "name";
  case error_kind::not_callable:
    return "call";
  case error_kind::type_error:
    return "type";
  case error_kind::division_by_zero:
    return "division";
  case error_kind::index_out_of_range:
    return "index";
  case error_kind::number_parse_error:
    return "cast";
  case error_kind::recursion_limit_exceeded:
    return "recursion";
  }
  return "unknown";
}

// line 0 means the position is not known yet, it gets filled in by the enclosing application
template<std::unsigned_integral SizeType> struct Error
{
  using size_type = SizeType;
  error_kind kind{ error_kind::type_error };
  IndexedString<size_type> message;
  size_type line{ 0 };
  size_type column{ 0 };
  [[nodiscard]] constexpr bool operator==(const Error &) const noexcept = default;
};


inline constexpr auto adds = [](const auto &lhs, const auto &rhs) { return lhs + rhs; };
inline constexpr auto subtracts = [](const auto &lhs, const auto &rhs) { return lhs - rhs; };
inline constexpr auto multiplies = [](const auto &lhs, const auto &rhs) { return lhs * rhs; };
inline constexpr auto divides = [](const auto &lhs, const auto &rhs) { return lhs / rhs; };

// result takes the sign of the divisor
inline constexpr auto floored_modulo = [](const auto &lhs, const auto &rhs) {
  auto result = std::fmod(lhs, rhs);
  if (result != 0 && ((result < 0) != (rhs < 0))) { result += rhs; }
  return result;
};

enum struct comparison : std::uint8_t { equal, less, greater };


template<std::unsigned_integral SizeType = std::uint32_t, std::floating_point FloatType = double> struct interpreter
{
  using size_type = SizeType;
  using number_type = FloatType;
  using string_type = IndexedString<size_type>;
  using string_view_type = std::string_view;
  using list_type = IndexedList<size_type>;
  using error_type = Error<size_type>;

  static constexpr size_type npos = std::numeric_limits<size_type>::max();

  // frame index of the top level scope
  static constexpr size_type global_frame = npos;

  static constexpr std::size_t max_builtin_arity = 4;
  static constexpr size_type default_max_depth = 4096;

  struct Value;

  using builtin_ptr = Value (*)(interpreter &, std::span<const size_type>);

  struct Closure
  {
    string_type parameter;
    size_type body{ npos };
    size_type frame{ global_frame };

    [[nodiscard]] constexpr bool operator==(const Closure &) const noexcept = default;
  };

  // curried native function, `arguments` holds the thunks applied so far
  struct Builtin
  {
    builtin_ptr ptr{ nullptr };
    string_type name;
    std::uint8_t arity{ 0 };
    std::uint8_t applied{ 0 };
    std::array<size_type, max_builtin_arity> arguments{};

    [[nodiscard]] constexpr bool operator==(const Builtin &) const noexcept = default;
  };

  struct Value
  {
    std::variant<std::monostate, number_type, string_type, list_type, Closure, Builtin, error_type> value;

    [[nodiscard]] constexpr bool operator==(const Value &) const noexcept = default;
  };

  static_assert(std::is_trivially_copyable_v<Value> && std::is_trivially_destructible_v<Value>,
    "lime values must stay trivial");

  struct Identifier
  {
    string_type name;
  };

  struct Lambda
  {
    // empty for `\.body`, the argument is ignored
    string_type parameter;
    size_type body{ npos };
  };

  struct Application
  {
    size_type function{ npos };
    size_type argument{ npos };
  };

  // items index into `expression_items`
  struct ListLiteral
  {
    list_type items;
  };

  struct Expression
  {
    std::variant<Value, ListLiteral, Identifier, Lambda, Application> node;
    size_type line{ 0 };
    size_type column{ 0 };
  };

  struct Binding
  {
    string_type name;
    size_type expression{ npos };
  };

  // nothing (blank line), a binding or the index of an expression to print
  using Statement = std::variant<std::monostate, Binding, size_type>;

  struct Frame
  {
    size_type parent{ global_frame };
    string_type name;
    size_type thunk{ npos };
  };

  enum struct thunk_state : std::uint8_t { unforced, forcing, forced };

  struct Thunk
  {
    size_type expression{ npos };
    size_type frame{ global_frame };
    thunk_state state{ thunk_state::unforced };
    Value value{};
  };

  using LexicalScope = std::vector<std::pair<string_type, size_type>>;

  LexicalScope global_scope{};
  std::vector<char> strings{};
  // every interned identifier, so parsing never scans runtime strings
  std::vector<string_type> names{};
  std::vector<Value> values{};
  std::vector<Expression> expressions{};
  std::vector<size_type> expression_items{};
  std::vector<Frame> frames{};
  std::vector<Thunk> thunks{};

  size_type depth{ 0 };
  size_type max_depth{ default_max_depth };

  std::function<void(string_view_type)> output = [](string_view_type text) { std::cout << text << '\n'; };
  std::function<std::optional<std::string>()> input = []() -> std::optional<std::string> {
    std::string line;
    if (std::getline(std::cin, line)) { return line; }
    return std::nullopt;
  };

  struct DepthGuard
  {
    explicit DepthGuard(interpreter &t_engine) noexcept : engine(&t_engine) { ++engine->depth; }
    DepthGuard(const DepthGuard &) = delete;
    DepthGuard(DepthGuard &&) = delete;
    DepthGuard &operator=(const DepthGuard &) = delete;
    DepthGuard &operator=(DepthGuard &&) = delete;
    ~DepthGuard() noexcept { --engine->depth; }

  private:
    interpreter *engine;
  };

  interpreter()
  {
    add("+", arithmetic<adds>, 2);
    add("-", arithmetic<subtracts>, 2);
    add("*", arithmetic<multiplies>, 2);
    add("/", checked_division<divides>, 2);
    add("%", checked_division<floored_modulo>, 2);
    add("=", compare<comparison::equal>, 4);
    add("<", compare<comparison::less>, 4);
    add(">", compare<comparison::greater>, 4);
    add("cat", cat, 2);
    add("at", at, 2);
    add("join", join, 2);
    add("len", len, 1);
    add("num", num, 1);
    add("str", str, 1);
    add("get", get, 1);
    add("print", print, 1);
    add("do", doer, 2);
  }

  template<typename Container> [[nodiscard]] static constexpr size_type size_of(const Container &container) noexcept
  {
    return static_cast<size_type>(container.size());
  }

  template<typename Result> [[nodiscard]] static constexpr const Result *get_if(const Value *value) noexcept
  {
    if (value == nullptr) { return nullptr; }
    return std::get_if<Result>(&value->value);
  }

  [[nodiscard]] static constexpr bool is_error(const Value &value) noexcept
  {
    return std::holds_alternative<error_type>(value.value);
  }

  //
  // arenas
  //
  [[nodiscard]] string_view_type view(string_type string) const noexcept
  {
    if (string.empty()) { return {}; }
    return string_view_type{ strings.data() + string.start, string.size };
  }

  [[nodiscard]] string_type insert(string_view_type text)
  {
    const auto start = size_of(strings);
    strings.insert(strings.end(), text.begin(), text.end());
    return string_type{ start, size_of(text) };
  }

  // identifiers are interned so names can be compared by index
  [[nodiscard]] string_type intern(string_view_type name)
  {
    if (const auto found = std::ranges::find(names, name, [this](string_type known) { return view(known); });
        found != names.end()) {
      return *found;
    }
    return names.emplace_back(insert(name));
  }

  [[nodiscard]] string_type concat(string_type lhs, string_type rhs)
  {
    if (lhs.empty()) { return rhs; }
    if (rhs.empty()) { return lhs; }

    const auto start = size_of(strings);
    strings.resize(strings.size() + lhs.size + rhs.size);
    std::copy_n(std::next(strings.begin(), lhs.start), lhs.size, std::next(strings.begin(), start));
    std::copy_n(std::next(strings.begin(), rhs.start), rhs.size, std::next(strings.begin(), start + lhs.size));
    return string_type{ start, static_cast<size_type>(lhs.size + rhs.size) };
  }

  [[nodiscard]] list_type insert(std::span<const Value> items)
  {
    const auto start = size_of(values);
    values.insert(values.end(), items.begin(), items.end());
    return list_type{ start, size_of(items) };
  }

  [[nodiscard]] list_type concat(list_type lhs, list_type rhs)
  {
    const auto start = size_of(values);
    values.resize(values.size() + lhs.size + rhs.size);
    std::copy_n(std::next(values.begin(), lhs.start), lhs.size, std::next(values.begin(), start));
    std::copy_n(std::next(values.begin(), rhs.start), rhs.size, std::next(values.begin(), start + lhs.size));
    return list_type{ start, static_cast<size_type>(lhs.size + rhs.size) };
  }

  [[nodiscard]] std::span<const Value> items(list_type list) const noexcept
  {
    return std::span<const Value>(values).subspan(list.start, list.size);
  }

  size_type add_expression(Expression expression)
  {
    expressions.push_back(expression);
    return size_of(expressions) - 1;
  }

  [[nodiscard]] size_type make_thunk(size_type expression, size_type frame)
  {
    thunks.push_back(Thunk{ expression, frame, thunk_state::unforced, Value{} });
    return size_of(thunks) - 1;
  }

  [[nodiscard]] size_type make_thunk(Value value)
  {
    thunks.push_back(Thunk{ npos, global_frame, thunk_state::forced, value });
    return size_of(thunks) - 1;
  }

  //
  // errors
  //
  [[nodiscard]] Value make_error(error_kind kind, string_view_type description, size_type line = 0, size_type column = 0)
  {
    return Value{ error_type{ kind, insert(description), line, column } };
  }

  [[nodiscard]] static Value locate(Value result, const Expression &where) noexcept
  {
    if (auto *error = std::get_if<error_type>(&result.value); error != nullptr && error->line == 0) {
      error->line = where.line;
      error->column = where.column;
    }
    return result;
  }

  [[nodiscard]] static constexpr string_view_type type_name(const Value &value) noexcept
  {
    constexpr std::array<string_view_type, 7> names{ "none", "number", "string", "list", "function", "function", "error" };
    return names[value.value.index()];
  }

  template<typename Type> [[nodiscard]] static constexpr string_view_type type_name() noexcept
  {
    if constexpr (std::is_arithmetic_v<Type>) {
      return "number";
    } else if constexpr (std::is_same_v<Type, string_type> || std::is_convertible_v<Type, string_view_type>) {
      return "string";
    } else if constexpr (std::is_same_v<Type, list_type>) {
      return "list";
    } else if constexpr (std::is_same_v<Type, std::monostate>) {
      return "none";
    } else if constexpr (std::is_same_v<Type, Closure> || std::is_same_v<Type, Builtin>) {
      return "function";
    } else {
      return "any";
    }
  }

  [[nodiscard]] Value make_type_error(string_view_type expected, const Value &got)
  {
    std::string description{ "expected type of " };
    description.append(expected).append("; received type of ").append(type_name(got));
    return make_error(error_kind::type_error, description);
  }

  //
  // lexing and parsing
  //
  struct Cursor
  {
    std::span<const Token> tokens;
    std::size_t position{ 0 };
    string_view_type line;
    size_type line_number{ 1 };

    [[nodiscard]] const Token &peek() const noexcept { return tokens[position]; }

    const Token &next() noexcept
    {
      const auto &token = tokens[position];
      if (token.kind != token_kind::eof) { ++position; }
      return token;
    }

    [[nodiscard]] size_type column(const Token &token) const noexcept
    {
      return static_cast<size_type>(std::distance(line.data(), token.parsed.data()) + 1);
    }
  };

  [[nodiscard]] static std::string describe(const Token &token)
  {
    if (token.kind == token_kind::eof) { return "end of line"; }
    return "`" + std::string{ token.parsed } + "`";
  }

  [[nodiscard]] error_type parse_error(const Cursor &cursor, const Token &token, string_view_type description)
  {
    return error_type{ error_kind::parse_error, insert(description), cursor.line_number, cursor.column(token) };
  }

  [[nodiscard]] error_type unexpected_token(const Cursor &cursor, const Token &token)
  {
    if (token.kind == token_kind::eof) { return parse_error(cursor, token, "unexpected end of line"); }
    return parse_error(cursor, token, "unexpected token: " + describe(token));
  }

  [[nodiscard]] error_type expected_token(const Cursor &cursor, string_view_type expected)
  {
    std::string description{ "expected " };
    description.append(expected).append(" but found ").append(describe(cursor.peek()));
    return parse_error(cursor, cursor.peek(), description);
  }

  [[nodiscard]] static constexpr bool starts_atom(token_kind kind) noexcept
  {
    return kind == token_kind::identifier || kind == token_kind::number || kind == token_kind::string
           || kind == token_kind::lparen || kind == token_kind::lbracket || kind == token_kind::lambda;
  }

  [[nodiscard]] static std::string unescape_string(string_view_type quoted)
  {
    std::string result;
    const auto contents = quoted.substr(1, quoted.size() - 2);
    for (auto location = contents.begin(); location != contents.end(); ++location) {
      if (*location == '\\') {
        ++location;
        // validated by next_token
        result.push_back(unescape(*location).value_or(*location));
      } else {
        result.push_back(*location);
      }
    }
    return result;
  }

  [[nodiscard]] std::expected<size_type, error_type> parse_atom(Cursor &cursor)
  {
    const auto token = cursor.next();
    const auto line = cursor.line_number;
    const auto column = cursor.column(token);

    switch (token.kind) {
    case token_kind::identifier:
      return add_expression(Expression{ Identifier{ intern(token.parsed) }, line, column });

    case token_kind::number: {
      const auto [did_parse, value] = parse_number<number_type>(token.parsed);
      if (!did_parse) {
        return std::unexpected(error_type{ error_kind::lex_error, insert("malformed number"), line, column });
      }
      return add_expression(Expression{ Value{ value }, line, column });
    }

    case token_kind::string:
      return add_expression(Expression{ Value{ insert(unescape_string(token.parsed)) }, line, column });

    case token_kind::lparen: {
      if (cursor.peek().kind == token_kind::rparen) {
        cursor.next();
        return add_expression(Expression{ Value{}, line, column });
      }

      const auto inner = parse_expression(cursor);
      if (!inner) { return inner; }
      if (cursor.peek().kind != token_kind::rparen) { return std::unexpected(expected_token(cursor, "`)`")); }
      cursor.next();
      return inner;
    }

    case token_kind::lbracket: {
      std::vector<size_type> list_items;

      if (cursor.peek().kind == token_kind::rbracket) {
        cursor.next();
      } else {
        while (true) {
          const auto item = parse_expression(cursor);
          if (!item) { return item; }
          list_items.push_back(*item);

          const auto &separator = cursor.next();
          if (separator.kind == token_kind::rbracket) { break; }
          if (separator.kind != token_kind::comma) {
            return std::unexpected(parse_error(cursor, separator, "expected `,` or `]` but found " + describe(separator)));
          }
        }
      }

      const auto start = size_of(expression_items);
      expression_items.insert(expression_items.end(), list_items.begin(), list_items.end());
      return add_expression(Expression{ ListLiteral{ list_type{ start, size_of(list_items) } }, line, column });
    }

    case token_kind::lambda: {
      string_type parameter{};
      if (cursor.peek().kind == token_kind::identifier) { parameter = intern(cursor.next().parsed); }
      if (cursor.peek().kind != token_kind::dot) {
        return std::unexpected(expected_token(cursor, "`.` after lambda parameter"));
      }
      cursor.next();

      const auto body = parse_expression(cursor);
      if (!body) { return body; }
      return add_expression(Expression{ Lambda{ parameter, *body }, line, column });
    }

    default:
      return std::unexpected(unexpected_token(cursor, token));
    }
  }

  // a chain of atoms, `a b c` is `((a b) c)`
  [[nodiscard]] std::expected<size_type, error_type> parse_expression(Cursor &cursor)
  {
    std::optional<size_type> result;
    const auto line = cursor.line_number;
    const auto column = cursor.column(cursor.peek());

    while (starts_atom(cursor.peek().kind)) {
      const auto atom = parse_atom(cursor);
      if (!atom) { return atom; }

      if (result) {
        result = add_expression(Expression{ Application{ *result, *atom }, line, column });
      } else {
        result = *atom;
      }
    }

    if (!result) { return std::unexpected(unexpected_token(cursor, cursor.peek())); }
    return *result;
  }

  [[nodiscard]] std::expected<Statement, error_type> parse(string_view_type line, size_type line_number = 1)
  {
    const auto tokens = tokenize(line);

    if (const auto &last = tokens.back(); last.kind == token_kind::error) {
      Cursor cursor{ tokens, 0, line, line_number };
      return std::unexpected(error_type{ error_kind::lex_error, insert(last.error), line_number, cursor.column(last) });
    }

    Cursor cursor{ tokens, 0, line, line_number };

    if (cursor.peek().kind == token_kind::eof) { return Statement{}; }

    std::optional<string_type> name;
    if (tokens.size() >= 2 && tokens[0].kind == token_kind::identifier && tokens[1].kind == token_kind::assign) {
      name = intern(tokens[0].parsed);
      cursor.next();
      cursor.next();
    }

    const auto expression = parse_expression(cursor);
    if (!expression) { return std::unexpected(expression.error()); }

    if (cursor.peek().kind != token_kind::eof) { return std::unexpected(unexpected_token(cursor, cursor.peek())); }

    if (name) { return Statement{ Binding{ *name, *expression } }; }
    return Statement{ *expression };
  }

  //
  // environment
  //
  [[nodiscard]] size_type lookup(size_type frame, string_type name) const noexcept
  {
    while (frame != global_frame) {
      const auto &current = frames[frame];
      if (current.name == name) { return current.thunk; }
      frame = current.parent;
    }

    for (const auto &[key, thunk] : global_scope | std::views::reverse) {
      if (key == name) { return thunk; }
    }

    return npos;
  }

  void bind(string_type name, size_type thunk)
  {
    for (auto &[key, value] : global_scope) {
      if (key == name) {
        value = thunk;
        return;
      }
    }
    global_scope.emplace_back(name, thunk);
  }

  void add(string_view_type name, Value value) { bind(intern(name), make_thunk(value)); }

  void add(string_view_type name, builtin_ptr function, std::uint8_t arity)
  {
    const auto id = intern(name);
    bind(id, make_thunk(Value{ Builtin{ function, id, arity } }));
  }

  template<typename ValueType> void add(string_view_type name, const ValueType &value)
  {
    add(name, to_value(value));
  }

  template<auto Func> void add(string_view_type name)
  {
    auto builtin = make_evaluator<Func>();
    builtin.name = intern(name);
    bind(builtin.name, make_thunk(Value{ builtin }));
  }

  //
  // evaluation
  //
  [[nodiscard]] Value force(size_type thunk)
  {
    switch (thunks[thunk].state) {
    case thunk_state::forced:
      return thunks[thunk].value;
    case thunk_state::forcing: {
      const auto &where = expressions[thunks[thunk].expression];
      return make_error(error_kind::recursion_limit_exceeded, "value depends on itself", where.line, where.column);
    }
    case thunk_state::unforced:
      break;
    }

    thunks[thunk].state = thunk_state::forcing;
    const auto result = eval(thunks[thunk].frame, thunks[thunk].expression);

    // errors are not cached, forcing again evaluates again
    if (is_error(result)) {
      thunks[thunk].state = thunk_state::unforced;
    } else {
      thunks[thunk].state = thunk_state::forced;
      thunks[thunk].value = result;
    }

    return result;
  }

  [[nodiscard]] Value apply(const Value &function, size_type argument)
  {
    if (const auto *closure = get_if<Closure>(&function); closure != nullptr) {
      frames.push_back(Frame{ closure->frame, closure->parameter, argument });
      return eval(size_of(frames) - 1, closure->body);
    } else if (const auto *builtin = get_if<Builtin>(&function); builtin != nullptr) {
      auto applied = *builtin;
      applied.arguments[applied.applied] = argument;
      ++applied.applied;

      if (applied.applied < applied.arity) { return Value{ applied }; }

      return (applied.ptr)(*this, std::span<const size_type>(applied.arguments.data(), applied.arity));
    }

    return make_error(error_kind::not_callable, "unable to call a value of type " + std::string{ type_name(function) });
  }

  [[nodiscard]] Value eval(size_type frame, size_type expression)
  {
    const auto current = expressions[expression];

    const DepthGuard guard{ *this };
    if (depth > max_depth) {
      return make_error(
        error_kind::recursion_limit_exceeded, "maximum recursion depth exceeded", current.line, current.column);
    }

    if (const auto *literal = std::get_if<Value>(&current.node); literal != nullptr) {
      return *literal;
    } else if (const auto *list = std::get_if<ListLiteral>(&current.node); list != nullptr) {
      std::vector<Value> result;
      result.reserve(list->items.size);
      for (size_type index = 0; index < list->items.size; ++index) {
        const auto item = eval(frame, expression_items[list->items[index]]);
        if (is_error(item)) { return item; }
        result.push_back(item);
      }
      return Value{ insert(result) };
    } else if (const auto *id = std::get_if<Identifier>(&current.node); id != nullptr) {
      const auto thunk = lookup(frame, id->name);
      if (thunk == npos) {
        return make_error(error_kind::unbound_identifier,
          "`" + std::string{ view(id->name) } + "` is not defined",
          current.line,
          current.column);
      }
      return force(thunk);
    } else if (const auto *lambda = std::get_if<Lambda>(&current.node); lambda != nullptr) {
      return Value{ Closure{ lambda->parameter, lambda->body, frame } };
    }

    const auto &application = std::get<Application>(current.node);
    const auto function = eval(frame, application.function);
    if (is_error(function)) { return function; }

    // call by need, the argument is only wrapped here
    return locate(apply(function, make_thunk(application.argument, frame)), current);
  }

  //
  // conversions between lime values and C++
  //
  template<typename Type> [[nodiscard]] std::expected<Type, Value> convert_to(const Value &value)
  {
    if constexpr (std::is_same_v<Type, error_type>) {
      if (const auto *error = get_if<error_type>(&value); error != nullptr) { return *error; }
      return std::unexpected(value);
    } else {
      if (is_error(value)) { return std::unexpected(value); }

      if constexpr (std::is_same_v<Type, Value>) {
        return value;
      } else if constexpr (std::is_same_v<Type, std::string> || std::is_same_v<Type, string_view_type>) {
        if (const auto *string = get_if<string_type>(&value); string != nullptr) { return Type{ view(*string) }; }
      } else if constexpr (std::is_arithmetic_v<Type>) {
        if (const auto *number = get_if<number_type>(&value); number != nullptr) {
          return static_cast<Type>(*number);
        }
      } else {
        if (const auto *result = get_if<Type>(&value); result != nullptr) { return *result; }
      }

      return std::unexpected(make_type_error(type_name<Type>(), value));
    }
  }

  template<typename Type> [[nodiscard]] Value to_value(const Type &value)
  {
    if constexpr (std::is_same_v<Type, Value>) {
      return value;
    } else if constexpr (std::is_arithmetic_v<Type>) {
      return Value{ static_cast<number_type>(value) };
    } else if constexpr (std::is_convertible_v<const Type &, string_view_type>) {
      return Value{ insert(string_view_type{ value }) };
    } else {
      static_assert(!sizeof(Type), "only numbers and strings can be passed to lime");
    }
  }

  template<typename Type> [[nodiscard]] std::expected<Type, Value> force_to(size_type thunk)
  {
    return convert_to<Type>(force(thunk));
  }

  template<typename Type1, typename Type2>
  [[nodiscard]] std::expected<std::tuple<Type1, Type2>, Value> force_to(std::span<const size_type> arguments)
  {
    auto first = force_to<Type1>(arguments[0]);
    if (!first) { return std::unexpected(first.error()); }
    auto second = force_to<Type2>(arguments[1]);
    if (!second) { return std::unexpected(second.error()); }

    return std::tuple<Type1, Type2>{ *first, *second };
  }

  template<typename ValueType>
  [[nodiscard]] static Value error_or_else(const std::expected<ValueType, Value> &obj, auto callable)
  {
    if (obj) {
      return callable(*obj);
    } else {
      return obj.error();
    }
  }

  template<auto Func, typename Ret, typename... Param> [[nodiscard]] static constexpr Builtin make_evaluator()
  {
    static_assert(sizeof...(Param) > 0 && sizeof...(Param) <= max_builtin_arity,
      "native functions take between 1 and 4 parameters");

    builtin_ptr ptr = [](interpreter &engine, std::span<const size_type> arguments) -> Value {
      // force everything first, views into `strings` are only stable once nothing else is evaluated
      std::array<Value, sizeof...(Param)> forced{};
      for (std::size_t index = 0; index < forced.size(); ++index) {
        forced[index] = engine.force(arguments[index]);
        if (is_error(forced[index])) { return forced[index]; }
      }

      auto impl = [&]<std::size_t... Idx>(std::index_sequence<Idx...>) -> Value {
        std::tuple converted{ engine.template convert_to<std::remove_cvref_t<Param>>(forced[Idx])... };

        Value error;

        // See if any parameter conversions errored
        const bool errored = !([&] {
          if (std::get<Idx>(converted).has_value()) {
            return true;
          } else {
            error = std::get<Idx>(converted).error();
            return false;
          }
        }() && ...);

        if (errored) { return error; }

        if constexpr (std::is_same_v<void, Ret>) {
          std::invoke(Func, *std::get<Idx>(converted)...);
          return Value{};
        } else {
          return engine.to_value(std::invoke(Func, *std::get<Idx>(converted)...));
        }
      };

      return impl(std::index_sequence_for<Param...>{});
    };

    return Builtin{ ptr, {}, static_cast<std::uint8_t>(sizeof...(Param)) };
  }

  template<auto Func, typename Ret, typename... Param>
  [[nodiscard]] static constexpr Builtin make_evaluator(Ret (*)(Param...))
  {
    return make_evaluator<Func, Ret, Param...>();
  }

  template<auto Func> [[nodiscard]] static constexpr Builtin make_evaluator() { return make_evaluator<Func>(Func); }

  //
  // built-ins
  //
  template<auto Op>
  [[nodiscard]] static Value arithmetic(interpreter &engine, std::span<const size_type> arguments)
  {
    return error_or_else(engine.force_to<number_type, number_type>(arguments), [](const auto &operands) {
      return Value{ static_cast<number_type>(Op(std::get<0>(operands), std::get<1>(operands))) };
    });
  }

  template<auto Op>
  [[nodiscard]] static Value checked_division(interpreter &engine, std::span<const size_type> arguments)
  {
    return error_or_else(engine.force_to<number_type, number_type>(arguments), [&engine](const auto &operands) {
      const auto [lhs, rhs] = operands;
      if (rhs == number_type{ 0 }) { return engine.make_error(error_kind::division_by_zero, "division by zero"); }
      return Value{ static_cast<number_type>(Op(lhs, rhs)) };
    });
  }

  // functions are never equal, lists compare element by element
  [[nodiscard]] bool equal_values(const Value &lhs, const Value &rhs) const
  {
    if (lhs.value.index() != rhs.value.index()) { return false; }

    if (const auto *number = get_if<number_type>(&lhs); number != nullptr) {
      return *number == *get_if<number_type>(&rhs);
    } else if (const auto *string = get_if<string_type>(&lhs); string != nullptr) {
      return view(*string) == view(*get_if<string_type>(&rhs));
    } else if (const auto *list = get_if<list_type>(&lhs); list != nullptr) {
      const auto other = *get_if<list_type>(&rhs);
      if (list->size != other.size) { return false; }
      for (size_type index = 0; index < list->size; ++index) {
        if (!equal_values(values[(*list)[index]], values[other[index]])) { return false; }
      }
      return true;
    }

    return std::holds_alternative<std::monostate>(lhs.value);
  }

  template<comparison Compare> [[nodiscard]] bool holds(const Value &lhs, const Value &rhs) const
  {
    if constexpr (Compare == comparison::equal) {
      return equal_values(lhs, rhs);
    } else {
      const auto order = [](const auto &first, const auto &second) {
        if constexpr (Compare == comparison::less) {
          return first < second;
        } else {
          return first > second;
        }
      };

      if (const auto *number = get_if<number_type>(&lhs), *other = get_if<number_type>(&rhs);
          number != nullptr && other != nullptr) {
        return order(*number, *other);
      }

      if (const auto *string = get_if<string_type>(&lhs), *other = get_if<string_type>(&rhs);
          string != nullptr && other != nullptr) {
        return order(view(*string), view(*other));
      }

      // mismatched or unordered kinds
      return false;
    }
  }

  template<comparison Compare>
  [[nodiscard]] static Value compare(interpreter &engine, std::span<const size_type> arguments)
  {
    // need to be careful to not execute unexecuted branches
    const auto operands = engine.force_to<Value, Value>(arguments);
    if (!operands) { return operands.error(); }
    const auto &[lhs, rhs] = *operands;

    constexpr auto is_function = [](const Value &value) {
      return get_if<Closure>(&value) != nullptr || get_if<Builtin>(&value) != nullptr;
    };

    // a function against any other kind is simply a mismatch
    if (is_function(lhs) && is_function(rhs)) {
      return engine.make_error(error_kind::type_error, "unable to compare two values of type function");
    }

    return engine.force(engine.holds<Compare>(lhs, rhs) ? arguments[2] : arguments[3]);
  }

  [[nodiscard]] static Value cat(interpreter &engine, std::span<const size_type> arguments)
  {
    return error_or_else(engine.force_to<string_type, string_type>(arguments), [&engine](const auto &strings) {
      return Value{ engine.concat(std::get<0>(strings), std::get<1>(strings)) };
    });
  }

  [[nodiscard]] static Value join(interpreter &engine, std::span<const size_type> arguments)
  {
    const auto operands = engine.force_to<Value, Value>(arguments);
    if (!operands) { return operands.error(); }
    const auto &[lhs, rhs] = *operands;

    if (const auto *list = get_if<list_type>(&lhs); list != nullptr) {
      if (const auto *other = get_if<list_type>(&rhs); other != nullptr) { return Value{ engine.concat(*list, *other) }; }
      return engine.make_type_error("list", rhs);
    } else if (const auto *string = get_if<string_type>(&lhs); string != nullptr) {
      if (const auto *other = get_if<string_type>(&rhs); other != nullptr) {
        return Value{ engine.concat(*string, *other) };
      }
      return engine.make_type_error("string", rhs);
    }

    return engine.make_type_error("list or string", lhs);
  }

  [[nodiscard]] static Value at(interpreter &engine, std::span<const size_type> arguments)
  {
    const auto operands = engine.force_to<Value, number_type>(arguments);
    if (!operands) { return operands.error(); }
    const auto &[sequence, index] = *operands;

    const auto *string = get_if<string_type>(&sequence);
    const auto *list = get_if<list_type>(&sequence);
    if (string == nullptr && list == nullptr) { return engine.make_type_error("string or list", sequence); }

    const auto length = string != nullptr ? utf8_length(engine.view(*string)) : std::size_t{ list->size };
    const auto position = std::trunc(index);

    if (!(index >= 0 && position < static_cast<number_type>(length))) {
      return engine.make_error(error_kind::index_out_of_range,
        "index " + format_number(index) + " is out of range for length " + std::to_string(length));
    }

    const auto offset = static_cast<size_type>(position);
    if (string != nullptr) {
      const auto [start, size] = utf8_character(engine.view(*string), offset);
      return Value{ string->substr(static_cast<size_type>(start), static_cast<size_type>(size)) };
    }

    return engine.values[(*list)[offset]];
  }

  [[nodiscard]] static Value len(interpreter &engine, std::span<const size_type> arguments)
  {
    const auto sequence = engine.force(arguments[0]);
    if (is_error(sequence)) { return sequence; }

    if (const auto *string = get_if<string_type>(&sequence); string != nullptr) {
      return Value{ static_cast<number_type>(utf8_length(engine.view(*string))) };
    } else if (const auto *list = get_if<list_type>(&sequence); list != nullptr) {
      return Value{ static_cast<number_type>(list->size) };
    }

    return engine.make_type_error("string or list", sequence);
  }

  [[nodiscard]] static Value num(interpreter &engine, std::span<const size_type> arguments)
  {
    return error_or_else(engine.force_to<string_type>(arguments[0]), [&engine](const auto &string) {
      const auto text = engine.view(string);
      const auto [did_parse, value] = parse_number<number_type>(text);
      if (!did_parse) {
        return engine.make_error(
          error_kind::number_parse_error, "unable to convert `" + std::string{ text } + "` to a number");
      }
      return Value{ value };
    });
  }

  [[nodiscard]] static Value str(interpreter &engine, std::span<const size_type> arguments)
  {
    return error_or_else(engine.force_to<number_type>(arguments[0]),
      [&engine](const auto &number) { return Value{ engine.insert(format_number(number)) }; });
  }

  // `get ()`, None once the input is exhausted
  [[nodiscard]] static Value get(interpreter &engine, std::span<const size_type> arguments)
  {
    return error_or_else(engine.force_to<std::monostate>(arguments[0]), [&engine](const auto &) {
      if (!engine.input) { return Value{}; }
      if (const auto line = engine.input(); line) { return Value{ engine.insert(*line) }; }
      return Value{};
    });
  }

  [[nodiscard]] static Value print(interpreter &engine, std::span<const size_type> arguments)
  {
    const auto value = engine.force(arguments[0]);
    if (is_error(value)) { return value; }
    if (engine.output) { engine.output(engine.display(value)); }
    return Value{};
  }

  [[nodiscard]] static Value doer(interpreter &engine, std::span<const size_type> arguments)
  {
    if (const auto first = engine.force(arguments[0]); is_error(first)) { return first; }
    return engine.force(arguments[1]);
  }

  //
  // display form, shared by `print` and the top level
  //
  [[nodiscard]] std::string display(const Value &value) const
  {
    if (const auto *number = get_if<number_type>(&value); number != nullptr) {
      return format_number(*number);
    } else if (const auto *string = get_if<string_type>(&value); string != nullptr) {
      return std::string{ view(*string) };
    } else if (const auto *list = get_if<list_type>(&value); list != nullptr) {
      std::string result{ "[" };
      for (size_type index = 0; index < list->size; ++index) {
        if (index != 0) { result += ", "; }
        result += display(values[(*list)[index]]);
      }
      return result + "]";
    } else if (const auto *error = get_if<error_type>(&value); error != nullptr) {
      return std::string{ kind_name(error->kind) } + " error: " + std::string{ view(error->message) };
    } else if (std::holds_alternative<std::monostate>(value.value)) {
      return "()";
    }

    return "[function]";
  }

  //
  // top level
  //

  // the value to print, nothing for bindings and blank lines
  [[nodiscard]] std::optional<Value> evaluate(string_view_type line, size_type line_number = 1)
  {
    const auto statement = parse(line, line_number);
    if (!statement) { return Value{ statement.error() }; }

    if (const auto *binding = std::get_if<Binding>(&*statement); binding != nullptr) {
      // a rebinding sees the value it replaces, everything else is looked up in the live top level scope
      auto frame = global_frame;
      if (const auto previous = lookup(global_frame, binding->name); previous != npos) {
        frames.push_back(Frame{ global_frame, binding->name, previous });
        frame = size_of(frames) - 1;
      }
      bind(binding->name, make_thunk(binding->expression, frame));
      return std::nullopt;
    } else if (const auto *expression = std::get_if<size_type>(&*statement); expression != nullptr) {
      return eval(global_frame, *expression);
    }

    return std::nullopt;
  }

  // runs every line, stops at the first error, returns the last printable value
  [[nodiscard]] Value evaluate_all(string_view_type source)
  {
    Value result{};
    size_type line_number = 1;

    while (true) {
      const auto end = source.find('\n');
      const auto line = source.substr(0, end);

      if (const auto value = evaluate(line, line_number); value) {
        if (is_error(*value)) { return *value; }
        result = *value;
      }

      if (end == string_view_type::npos) { break; }
      source.remove_prefix(end + 1);
      ++line_number;
    }

    return result;
  }

  template<typename Result> [[nodiscard]] std::expected<Result, Value> evaluate_to(string_view_type source)
  {
    return convert_to<Result>(evaluate_all(source));
  }

  // evaluates `function` once, the returned object applies it to C++ arguments one at a time
  template<typename Signature>
  [[nodiscard]] auto make_callable(string_view_type function)
    requires std::is_function_v<Signature>
  {
    auto impl = [callable = evaluate_all(function)]<typename Ret, typename... Params>(Ret (*)(Params...)) {
      return [callable](interpreter &engine, Params... params) -> std::expected<Ret, Value> {
        auto result = callable;
        const auto apply_one = [&](const Value &argument) {
          if (!is_error(result)) { result = engine.apply(result, engine.make_thunk(argument)); }
        };
        (apply_one(engine.to_value(params)), ...);
        return engine.template convert_to<Ret>(result);
      };
    };

    return impl(std::add_pointer_t<Signature>{ nullptr });
  }
};


}// namespace lime

#endif
