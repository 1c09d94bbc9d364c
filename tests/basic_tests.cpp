#define CATCH_CONFIG_ENABLE_BENCHMARKING
#include <catch2/catch.hpp>
#include "chomp/Chomp.hpp"

using namespace chomp;

namespace {

auto shouldMatch = [](const Parser<Text>& parser, Text input, Text matched, Text remaining) {
  auto res = parser->match(input);
  REQUIRE(isSuccess(res));
  REQUIRE(valueOf(res) == matched);
  REQUIRE(remainingOf(res) == remaining);
  // every match is a prefix of its input
  REQUIRE(std::string{ matched } + std::string{ remaining } == input);
};
auto shouldNotMatch = [](const Parser<Text>& parser, Text input) {
  auto res = parser->match(input);
  REQUIRE(!isSuccess(res));
  REQUIRE(remainingOf(res) == input);
  REQUIRE(errorOf(res));
};

}

TEST_CASE("Tag matches literal prefixes", "[basic]") {
  shouldMatch(tag("Hello"), "Hello, World!", "Hello", ", World!");
  shouldMatch(tag(""), "abc", "", "abc");
  shouldNotMatch(tag("Hello"), "hello, World!");
  shouldNotMatch(tag("Hello"), "Hell");
  shouldNotMatch(tag("a"), "");
}

TEST_CASE("Tag ignoring case", "[basic]") {
  shouldMatch(tagNoCase("hello"), "HeLLo, World!", "HeLLo", ", World!");
  shouldMatch(tagNoCase("STRASSE"), "strasse 5", "strasse", " 5");
  shouldMatch(tagNoCase("Ärger"), "äRGER!", "äRGER", "!");
  shouldNotMatch(tagNoCase("hello"), "help");
  shouldNotMatch(tagNoCase("hello"), "hel");
}

TEST_CASE("Single character scanners", "[basic]") {
  shouldMatch(character('H'), "Hello", "H", "ello");
  shouldMatch(character(U'ö'), "öl", "ö", "l");
  shouldNotMatch(character('h'), "Hello");
  shouldNotMatch(character('h'), "");

  shouldMatch(anyChar(), "€uro", "€", "uro");
  shouldNotMatch(anyChar(), "");

  shouldMatch(satisfy(isDigit), "1a", "1", "a");
  shouldNotMatch(satisfy(isDigit), "a1");

  shouldMatch(oneOf("!,eH"), "Hello, World!", "H", "ello, World!");
  shouldNotMatch(oneOf("!,e"), "Hello, World!");
  shouldMatch(noneOf("ho"), "Hello, World!", "H", "ello, World!");
  shouldNotMatch(noneOf("Ho"), "Hello, World!");
  shouldNotMatch(noneOf("Ho"), "");
}

TEST_CASE("Character runs", "[basic]") {
  shouldMatch(any("eH"), "Hello, World!", "He", "llo, World!");
  shouldNotMatch(any("xyz"), "Hello, World!");
  shouldMatch(notAny("ol"), "Hello, World!", "He", "llo, World!");
  shouldNotMatch(notAny("H"), "Hello, World!");
  shouldMatch(notAny("x"), "abc", "abc", "");
}

TEST_CASE("Until stops before the literal", "[basic]") {
  shouldMatch(until("World"), "Hello, World!", "Hello, ", "World!");
  shouldMatch(until("Hello"), "Hello, World!", "", "Hello, World!");
  shouldNotMatch(until("Moon"), "Hello, World!");
  shouldMatch(takeUntil1("World"), "Hello, World!", "Hello, ", "World!");
  shouldNotMatch(takeUntil1("Hello"), "Hello, World!");
}

TEST_CASE("Take counts codepoints", "[basic]") {
  shouldMatch(take(3), "Hello", "Hel", "lo");
  shouldMatch(take(2), "日本語", "日本", "語");
  shouldMatch(take(0), "abc", "", "abc");
  shouldNotMatch(take(6), "Hello");
}

TEST_CASE("TakeWhile variants", "[basic]") {
  shouldMatch(takeWhile(isLetter), "Hello, World!", "Hello", ", World!");
  shouldMatch(takeWhile(isDigit), "Hello", "", "Hello");
  shouldMatch(takeWhileN(isLetter, 3), "Hello, World!", "Hello", ", World!");
  shouldNotMatch(takeWhileN(isLetter, 6), "Hello, World!");
  shouldMatch(takeWhileNM(isDigit, 1, 8), "2024 adventure", "2024", " adventure");
  shouldNotMatch(takeWhileNM(isDigit, 1, 3), "2024 adventure");
  shouldNotMatch(takeWhileNM(isDigit, 1, 8), "adventure");
  // bounds given in the wrong order are swapped
  shouldMatch(takeWhileNM(isDigit, 8, 1), "2024 adventure", "2024", " adventure");

  shouldMatch(takeWhileNot(isSpace), "Hello, World!", "Hello,", " World!");
  shouldMatch(takeWhileNot(isSpace), " World!", "", " World!");
  shouldMatch(takeWhileNotN(isSpace, 2), "Hello, World!", "Hello,", " World!");
  shouldNotMatch(takeWhileNotN(isSpace, 7), "Hello, World!");
  shouldMatch(takeWhileNotNM(isLineEnding, 1, 20), "first\nsecond", "first", "\nsecond");
  shouldNotMatch(takeWhileNotNM(isLineEnding, 1, 2), "first\nsecond");
}

TEST_CASE("TakeWhileNM reports the observed count", "[basic]") {
  auto res = takeWhileNM(isDigit, 1, 3)->match("2024");
  REQUIRE(!isSuccess(res));
  auto& error = *errorOf(res);
  REQUIRE(error.getKind() == ErrorKind::RANGE_FAILED);
  REQUIRE(error.getExecutions() == 4);
  REQUIRE(error.getMinimum() == 1);
  REQUIRE(error.getMaximum() == 3);
  REQUIRE(error.getInput() == "is_digit");
}

TEST_CASE("Predicate based runs", "[basic]") {
  shouldMatch(digit(), "123abc", "123", "abc");
  shouldNotMatch(digit(), "abc");
  shouldMatch(alpha(), "abc123", "abc", "123");
  shouldMatch(alphanumeric(), "abc123 def", "abc123", " def");
  shouldMatch(hexDigit(), "DEADbeefg", "DEADbeef", "g");
  shouldMatch(octalDigit(), "01238", "0123", "8");
  shouldMatch(binaryDigit(), "0110102", "011010", "2");
  shouldMatch(space(), " \t\nx", " \t", "\nx");
  shouldMatch(multispace(), " \t\r\nx", " \t\r\n", "x");
  shouldNotMatch(space(), "\nx");
}

TEST_CASE("Escaped text keeps escape sequences", "[basic]") {
  auto parser = escaped(notAny("\\\""), '\\', oneOf("\"n\\"));
  shouldMatch(parser, R"(say \"hi\"" rest)", R"(say \"hi\")", R"(" rest)");
  shouldMatch(parser, R"(\\)", R"(\\)", "");
  shouldNotMatch(parser, "\"");
  shouldNotMatch(parser, R"(bad \x)");
}

TEST_CASE("Escaped text with transformed escapes", "[basic]") {
  auto transform = first(
      value(tag("n"), std::string{ "\n" }),
      value(tag("\\"), std::string{ "\\" }),
      value(tag("\""), std::string{ "\"" }));
  auto parser = escapedTransform(notAny("\\\""), '\\', transform);
  auto res = parser->match(R"(line\none \"quoted\"" tail)");
  REQUIRE(isSuccess(res));
  REQUIRE(valueOf(res) == "line\none \"quoted\"");
  REQUIRE(remainingOf(res) == "\" tail");

  auto failed = parser->match(R"(bad \q)");
  REQUIRE(!isSuccess(failed));
  REQUIRE(remainingOf(failed) == R"(bad \q)");
}

TEST_CASE("Missing sub-parsers are rejected", "[basic]") {
  REQUIRE_THROWS_AS(escaped(nullptr, '\\', tag("n")), std::invalid_argument);
  REQUIRE_THROWS_AS(escapedTransform(tag("a"), '\\', nullptr), std::invalid_argument);
}

TEST_CASE("Malformed UTF-8 never matches a real codepoint", "[basic]") {
  shouldNotMatch(character('/'), "\xC0\xAF" "rest");
  shouldNotMatch(oneOf("/"), "\xC0\xAF");
  shouldNotMatch(takeWhileN(isDigit, 1), "\xF4\x90\x80\x80" "1");
}

TEST_CASE("Malformed literals and sets are rejected", "[basic]") {
  REQUIRE_THROWS_AS(oneOf("\xff"), std::invalid_argument);
  REQUIRE_THROWS_AS(noneOf("ab\xC0\xAF"), std::invalid_argument);
  REQUIRE_THROWS_AS(any("\xED\xA0\x80"), std::invalid_argument);
  REQUIRE_THROWS_AS(notAny("\xE2\x82"), std::invalid_argument);
  REQUIRE_THROWS_AS(tag("\xff"), std::invalid_argument);
  REQUIRE_THROWS_AS(tagNoCase("a\xff"), std::invalid_argument);
  REQUIRE_THROWS_AS(until("\xff"), std::invalid_argument);
  REQUIRE_THROWS_AS(takeUntil1("\xff"), std::invalid_argument);

  // a genuine replacement character can still be matched
  shouldMatch(oneOf("\xEF\xBF\xBD"), "\xEF\xBF\xBD" "x", "\xEF\xBF\xBD", "x");
}

TEST_CASE("Line endings", "[basic]") {
  shouldMatch(crlf(), "\nHello", "\n", "Hello");
  shouldMatch(crlf(), "\r\nHello", "\r\n", "Hello");
  shouldNotMatch(crlf(), "Hello");
  shouldNotMatch(crlf(), "\rHello");
  shouldNotMatch(crlf(), "\r");
  shouldNotMatch(crlf(), "");
}

TEST_CASE("Eol consumes the line ending", "[basic]") {
  auto check = [](Text input, Text matched, Text remaining) {
    auto res = eol()->match(input);
    REQUIRE(isSuccess(res));
    REQUIRE(valueOf(res) == matched);
    REQUIRE(remainingOf(res) == remaining);
  };
  check("first line\nsecond line", "first line", "second line");
  check("first line\r\nsecond line", "first line", "second line");
  check("last line", "last line", "");
  check("\nnext", "", "next");
  check("", "", "");
  // a lone carriage return is not a line ending and stays in the input
  check("dangling\r", "dangling", "\r");
}

TEST_CASE("Combinators describe themselves", "[basic]") {
  REQUIRE(tag("a")->dump() == "'a'");
  REQUIRE(tagNoCase("a")->dump() == "i'a'");
  REQUIRE(oneOf("ab")->dump() == "[ab]");
  REQUIRE(noneOf("ab")->dump() == "[^ab]");
  REQUIRE(any("ab")->dump() == "[ab]+");
  REQUIRE(takeWhile(isDigit)->dump() == "<is_digit>*");
  REQUIRE(digit()->dump() == "<is_digit>+");
  REQUIRE(takeWhileNM(isDigit, 1, 8)->dump() == "<is_digit>{1,8}");
  REQUIRE(take(4)->dump() == ".{4}");
}

#ifdef CHOMP_BENCHMARKS
TEST_CASE("Primitive scanner benchmarks", "[basic]") {
  std::string text(4096, 'a');
  text += "!";
  auto run = takeWhile(isLetter);
  BENCHMARK("TakeWhile over 4096 letters") {
    return run->match(text);
  };
  auto literal = tagNoCase(text.substr(0, 256));
  BENCHMARK("Caseless tag of 256 codepoints") {
    return literal->match(text);
  };
}
#endif
