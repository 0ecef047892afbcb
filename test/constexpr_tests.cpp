#include <catch2/catch_test_macros.hpp>

#include <lime/lime.hpp>
#include <internal_use_only/config.hpp>


static_assert(std::is_trivially_copyable_v<lime::interpreter<>::Value>);
static_assert(std::is_trivially_copyable_v<lime::interpreter<std::uint16_t, float>::Value>);


constexpr auto kind_of(std::string_view input) { return lime::next_token(input).kind; }

constexpr auto parsed(std::string_view input) { return lime::next_token(input).parsed; }

// number of tokens before eof, -1 on a lex error
constexpr int count_tokens(std::string_view input)
{
  const auto tokens = lime::tokenize(input);
  if (tokens.back().kind == lime::token_kind::error) { return -1; }
  return static_cast<int>(tokens.size()) - 1;
}


TEST_CASE("single tokens", "[lexer]")
{
  STATIC_CHECK(kind_of("\\") == lime::token_kind::lambda);
  STATIC_CHECK(kind_of(".") == lime::token_kind::dot);
  STATIC_CHECK(kind_of(":=") == lime::token_kind::assign);
  STATIC_CHECK(kind_of("(") == lime::token_kind::lparen);
  STATIC_CHECK(kind_of(")") == lime::token_kind::rparen);
  STATIC_CHECK(kind_of("[") == lime::token_kind::lbracket);
  STATIC_CHECK(kind_of("]") == lime::token_kind::rbracket);
  STATIC_CHECK(kind_of(",") == lime::token_kind::comma);
  STATIC_CHECK(kind_of("") == lime::token_kind::eof);
  STATIC_CHECK(kind_of("   ") == lime::token_kind::eof);
}

TEST_CASE("identifiers", "[lexer]")
{
  STATIC_CHECK(parsed("fact_rec f") == "fact_rec");
  STATIC_CHECK(parsed("x:=1") == "x");
  STATIC_CHECK(parsed("f.x") == "f");
  STATIC_CHECK(parsed("+ 1 2") == "+");
  STATIC_CHECK(parsed("a1b") == "a1b");
  STATIC_CHECK(kind_of("-") == lime::token_kind::identifier);
  STATIC_CHECK(kind_of("<") == lime::token_kind::identifier);
}

TEST_CASE("numbers", "[lexer]")
{
  STATIC_CHECK(kind_of("42") == lime::token_kind::number);
  STATIC_CHECK(parsed("3.14)") == "3.14");
  STATIC_CHECK(parsed("-7 x") == "-7");
  STATIC_CHECK(parsed("+0.5") == "+0.5");
  STATIC_CHECK(kind_of("1.") == lime::token_kind::error);
  STATIC_CHECK(kind_of("1.x") == lime::token_kind::error);
}

TEST_CASE("strings", "[lexer]")
{
  STATIC_CHECK(parsed(R"("hello" world)") == R"("hello")");
  STATIC_CHECK(parsed(R"("a \"quoted\" word")") == R"("a \"quoted\" word")");
  STATIC_CHECK(kind_of(R"("no end)") == lime::token_kind::error);
  STATIC_CHECK(kind_of(R"("\x")") == lime::token_kind::error);
  STATIC_CHECK(kind_of(R"("\n\t\s\\")") == lime::token_kind::string);
}

TEST_CASE("escape codes", "[lexer]")
{
  STATIC_CHECK(lime::unescape('n') == '\n');
  STATIC_CHECK(lime::unescape('s') == ' ');
  STATIC_CHECK(lime::unescape('"') == '"');
  STATIC_CHECK(!lime::unescape('q').has_value());
}

TEST_CASE("comments", "[lexer]")
{
  STATIC_CHECK(kind_of("; just a comment") == lime::token_kind::eof);
  STATIC_CHECK(count_tokens("+ 1 2 ; add") == 3);
  STATIC_CHECK(count_tokens(R"(print ";")") == 2);
}

TEST_CASE("whole lines", "[lexer]")
{
  STATIC_CHECK(count_tokens(R"(fact := \n.= n 0 1 (* n (fact (- n 1))))") == 21);
  STATIC_CHECK(count_tokens("[1, 2, 3]") == 7);
  STATIC_CHECK(count_tokens("") == 0);
  STATIC_CHECK(count_tokens(R"(cat "a)") == -1);
}

TEST_CASE("utf-8 helpers", "[lexer]")
{
  STATIC_CHECK(lime::utf8_length("abc") == 3);
  STATIC_CHECK(lime::utf8_length("h\xC3\xA9llo") == 5);
  STATIC_CHECK(lime::utf8_character("h\xC3\xA9llo", 1) == std::pair<std::size_t, std::size_t>{ 1, 2 });
  STATIC_CHECK(lime::utf8_character("abc", 3) == std::pair<std::size_t, std::size_t>{ 3, 0 });
  STATIC_CHECK(lime::utf8_length("\x80" "abc") == 4);
  STATIC_CHECK(lime::utf8_character("\x80" "abc", 2) == std::pair<std::size_t, std::size_t>{ 2, 1 });
}

TEST_CASE("error kind names", "[errors]")
{
  STATIC_CHECK(lime::kind_name(lime::error_kind::type_error) == "type");
  STATIC_CHECK(lime::kind_name(lime::error_kind::unbound_identifier) == "name");
  STATIC_CHECK(lime::kind_name(lime::error_kind::recursion_limit_exceeded) == "recursion");
}

TEST_CASE("check version number", "[system]")
{
  STATIC_CHECK(lime::lime_version_major == lime::cmake::project_version_major);
  STATIC_CHECK(lime::lime_version_minor == lime::cmake::project_version_minor);
  STATIC_CHECK(lime::lime_version_patch == lime::cmake::project_version_patch);
  STATIC_CHECK(lime::lime_version_tweak == lime::cmake::project_version_tweak);
}
