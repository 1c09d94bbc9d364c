#define CATCH_CONFIG_ENABLE_BENCHMARKING
#include <catch2/catch.hpp>
#include "chomp/Chomp.hpp"

using namespace chomp;

TEST_CASE("Map converts the output", "[modifier]") {
  auto parser = map(digit(), [](Text digits) { return std::stoi(std::string{ digits }); });
  auto res = parser->match("2024 adventure");
  REQUIRE(isSuccess(res));
  REQUIRE(valueOf(res) == 2024);
  REQUIRE(remainingOf(res) == " adventure");

  auto failed = parser->match("adventure");
  REQUIRE(!isSuccess(failed));
  REQUIRE(remainingOf(failed) == "adventure");
  REQUIRE(errorOf(failed)->getType() == "digit");
}

TEST_CASE("Opt never fails", "[modifier]") {
  auto res = opt(tag("Hello"))->match("Hello, World!");
  REQUIRE(isSuccess(res));
  REQUIRE(valueOf(res) == "Hello");
  REQUIRE(remainingOf(res) == ", World!");

  for(Text input : { "Goodbye", "", "H" }) {
    auto missing = opt(tag("Hello"))->match(input);
    REQUIRE(isSuccess(missing));
    REQUIRE(valueOf(missing).empty());
    REQUIRE(remainingOf(missing) == input);
  }

  auto fatal = opt(cut(tag("x")))->match("y");
  REQUIRE(isSuccess(fatal));
  REQUIRE(remainingOf(fatal) == "y");

  auto seqRes = opt(many(digit()))->match("abc");
  REQUIRE(isSuccess(seqRes));
  REQUIRE(valueOf(seqRes).empty());
}

TEST_CASE("Seq and Pick", "[modifier]") {
  auto wrapped = seq(tag("Hello"))->match("Hello, World!");
  REQUIRE(isSuccess(wrapped));
  REQUIRE(valueOf(wrapped) == Seq{ "Hello" });

  auto words = sepPair(tag("Hello"), tag(", "), tag("World"));
  auto second = pick(words, 1)->match("Hello, World!");
  REQUIRE(isSuccess(second));
  REQUIRE(valueOf(second) == "World");
  REQUIRE(remainingOf(second) == "!");

  for(long index : { -1L, 2L }) {
    auto res = pick(words, index)->match("Hello, World!");
    REQUIRE(!isSuccess(res));
    REQUIRE(remainingOf(res) == "Hello, World!");
    REQUIRE(errorOf(res)->getKind() == ErrorKind::INDEX_OUT_OF_BOUNDS);
    REQUIRE(errorOf(res)->getIndex() == index);
    REQUIRE(errorOf(res)->getType() == "i");
  }
  REQUIRE(pick(words, 5)->match("Hello, World!").index() == 1);
}

TEST_CASE("Peek never consumes", "[modifier]") {
  auto res = peek(tag("Hello"))->match("Hello, World!");
  REQUIRE(isSuccess(res));
  REQUIRE(valueOf(res) == "Hello");
  REQUIRE(remainingOf(res) == "Hello, World!");

  auto failed = peek(tag("World"))->match("Hello, World!");
  REQUIRE(!isSuccess(failed));
  REQUIRE(remainingOf(failed) == "Hello, World!");

  auto nested = peek(all(tag("Hello"), tag(", ")))->match("Hello, World!");
  REQUIRE(remainingOf(nested) == "Hello, World!");
}

TEST_CASE("PeekNot is a negative lookahead", "[modifier]") {
  auto res = peekNot(tag("World"))->match("Hello, World!");
  REQUIRE(isSuccess(res));
  REQUIRE(valueOf(res).empty());
  REQUIRE(remainingOf(res) == "Hello, World!");

  auto failed = peekNot(tag("Hello"))->match("Hello, World!");
  REQUIRE(!isSuccess(failed));
  REQUIRE(remainingOf(failed) == "Hello, World!");
}

TEST_CASE("Verify checks the output", "[modifier]") {
  auto small = verify(digit(), [](Text digits) { return digits.size() <= 2; });
  auto res = small->match("42!");
  REQUIRE(isSuccess(res));
  REQUIRE(valueOf(res) == "42");

  auto rejected = small->match("4242!");
  REQUIRE(!isSuccess(rejected));
  REQUIRE(remainingOf(rejected) == "4242!");
  REQUIRE(errorOf(rejected)->getType() == "verify");

  REQUIRE(!isSuccess(small->match("x")));
}

TEST_CASE("Recognize returns the consumed text", "[modifier]") {
  auto parser = recognize(all(tag("Hello"), tag(", "), tag("World")));
  auto res = parser->match("Hello, World!");
  REQUIRE(isSuccess(res));
  REQUIRE(valueOf(res) == "Hello, World");
  REQUIRE(remainingOf(res) == "!");

  // the recognized text matches as a literal again
  auto again = tag(std::string{ valueOf(res) })->match("Hello, World!");
  REQUIRE(isSuccess(again));
  REQUIRE(remainingOf(again) == remainingOf(res));

  REQUIRE(!isSuccess(parser->match("Hello World")));
}

TEST_CASE("Consumed returns the text and the output", "[modifier]") {
  auto res = consumed(sepPair(digit(), tag("-"), digit()))->match("12-34 rest");
  REQUIRE(isSuccess(res));
  REQUIRE(valueOf(res) == Seq{ "12-34", "12", "34" });
  REQUIRE(remainingOf(res) == " rest");
}

TEST_CASE("Eof and AllConsuming", "[modifier]") {
  REQUIRE(isSuccess(eof()->match("")));
  auto notDone = eof()->match("x");
  REQUIRE(!isSuccess(notDone));
  REQUIRE(remainingOf(notDone) == "x");

  auto res = allConsuming(tag("Hello"))->match("Hello, World!");
  REQUIRE(!isSuccess(res));
  REQUIRE(remainingOf(res) == "Hello, World!");
  REQUIRE(errorOf(res)->getType() == "all_consuming");

  auto complete = allConsuming(tag("Hello"))->match("Hello");
  REQUIRE(isSuccess(complete));
  REQUIRE(remainingOf(complete).empty());
}

TEST_CASE("Rest takes everything", "[modifier]") {
  auto res = rest()->match("Hello, World!");
  REQUIRE(isSuccess(res));
  REQUIRE(valueOf(res) == "Hello, World!");
  REQUIRE(remainingOf(res).empty());

  auto empty = rest()->match("");
  REQUIRE(isSuccess(empty));
  REQUIRE(valueOf(empty).empty());
}

TEST_CASE("Value replaces the output", "[modifier]") {
  auto parser = value(tag("true"), true);
  auto res = parser->match("true!");
  REQUIRE(isSuccess(res));
  REQUIRE(valueOf(res));
  REQUIRE(remainingOf(res) == "!");
  REQUIRE(!isSuccess(parser->match("false")));
}

TEST_CASE("Cond enables a parser", "[modifier]") {
  auto enabled = cond(true, tag("Hello"))->match("Hello, World!");
  REQUIRE(isSuccess(enabled));
  REQUIRE(valueOf(enabled) == "Hello");
  REQUIRE(!isSuccess(cond(true, tag("Bye"))->match("Hello, World!")));

  auto disabled = cond(false, tag("Bye"))->match("Hello, World!");
  REQUIRE(isSuccess(disabled));
  REQUIRE(valueOf(disabled).empty());
  REQUIRE(remainingOf(disabled) == "Hello, World!");
}

TEST_CASE("Cut marks failures as fatal", "[modifier]") {
  REQUIRE(isSuccess(cut(tag("a"))->match("a")));

  auto res = all(tag("a"), cut(tag("b")))->match("ac");
  REQUIRE(!isSuccess(res));
  REQUIRE(remainingOf(res) == "ac");
  REQUIRE(errorOf(res)->isFatal());
  auto& cause = *errorOf(res)->getCause();
  REQUIRE(cause.getKind() == ErrorKind::CUT);
  // the cut is positioned where it was invoked, not deeper
  REQUIRE(cause.getRemainingLength() == 1);
  REQUIRE(cause.getCause()->getType() == "tag");
}

TEST_CASE("Flatten joins sequences", "[modifier]") {
  auto res = flatten(all(tag("Hello"), tag(", "), tag("World")))->match("Hello, World!");
  REQUIRE(isSuccess(res));
  REQUIRE(valueOf(res) == "Hello, World");
  REQUIRE(remainingOf(res) == "!");
}

TEST_CASE("Callbacks may throw", "[modifier]") {
  auto parser = map(tag("x"), [](Text) -> int { throw std::runtime_error{ "not allowed" }; });
  REQUIRE_THROWS_AS(parser->match("x"), std::runtime_error);
  REQUIRE_THROWS_AS(map(Parser<Text>{}, [](Text t) { return t; }), std::invalid_argument);
}
