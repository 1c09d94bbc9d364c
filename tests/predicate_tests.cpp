#define CATCH_CONFIG_ENABLE_BENCHMARKING
#include <catch2/catch.hpp>
#include "chomp/ChompPredicate.hpp"

using namespace chomp;

TEST_CASE("Digit and letter predicates are Unicode aware", "[predicate]") {
  REQUIRE(isDigit('0'));
  REQUIRE(isDigit('9'));
  REQUIRE(isDigit(0x0663)); // ARABIC-INDIC DIGIT THREE
  REQUIRE(!isDigit('a'));
  REQUIRE(!isDigit('_'));

  REQUIRE(isLetter('a'));
  REQUIRE(isLetter('Z'));
  REQUIRE(isLetter(U'ß'));
  REQUIRE(isLetter(U'日'));
  REQUIRE(!isLetter('1'));
  REQUIRE(!isLetter(' '));

  REQUIRE(isAlphanumeric('a'));
  REQUIRE(isAlphanumeric('7'));
  REQUIRE(!isAlphanumeric('-'));
}

TEST_CASE("Whitespace predicates", "[predicate]") {
  REQUIRE(isLineEnding('\n'));
  REQUIRE(isLineEnding('\r'));
  REQUIRE(!isLineEnding(' '));

  REQUIRE(isSpace(' '));
  REQUIRE(isSpace('\t'));
  REQUIRE(!isSpace('\n'));

  REQUIRE(isMultispace(' '));
  REQUIRE(isMultispace('\t'));
  REQUIRE(isMultispace('\r'));
  REQUIRE(isMultispace('\n'));
  REQUIRE(!isMultispace('x'));
}

TEST_CASE("Number base predicates", "[predicate]") {
  REQUIRE(isHexDigit('0'));
  REQUIRE(isHexDigit('a'));
  REQUIRE(isHexDigit('F'));
  REQUIRE(!isHexDigit('g'));
  REQUIRE(!isHexDigit('G'));

  REQUIRE(isOctalDigit('0'));
  REQUIRE(isOctalDigit('7'));
  REQUIRE(!isOctalDigit('8'));

  REQUIRE(isBinaryDigit('0'));
  REQUIRE(isBinaryDigit('1'));
  REQUIRE(!isBinaryDigit('2'));
}

TEST_CASE("Predicates carry their names", "[predicate]") {
  REQUIRE(isDigit.dump() == "is_digit");
  REQUIRE(isLetter.dump() == "is_letter");
  REQUIRE(isAlphanumeric.dump() == "is_alphanumeric");
  REQUIRE(isLineEnding.dump() == "is_line_ending");
  REQUIRE(isSpace.dump() == "is_space");
  REQUIRE(isMultispace.dump() == "is_multispace");
  REQUIRE(isHexDigit.dump() == "is_hex_digit");
  REQUIRE(isOctalDigit.dump() == "is_octal_digit");
  REQUIRE(isBinaryDigit.dump() == "is_binary_digit");
}
