#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace chomp {

// A named test over a single codepoint. The name is part of every error
// message raised by a scanner built on the predicate.
struct Predicate {
    std::string_view name;
    bool (*test)(int32_t);

    [[nodiscard]] bool operator()(int32_t codepoint) const {
        return test(codepoint);
    }
    [[nodiscard]] std::string dump() const {
        return std::string{ name };
    }
};

namespace predicates {

// Unicode decimal digits (Nd).
bool digit(int32_t codepoint);
// Unicode letters (Lu, Ll, Lt, Lm, Lo).
bool letter(int32_t codepoint);
bool alphanumeric(int32_t codepoint);
bool lineEnding(int32_t codepoint);
bool space(int32_t codepoint);
bool multispace(int32_t codepoint);
bool hexDigit(int32_t codepoint);
bool octalDigit(int32_t codepoint);
bool binaryDigit(int32_t codepoint);

}

inline constexpr Predicate isDigit{ "is_digit", &predicates::digit };
inline constexpr Predicate isLetter{ "is_letter", &predicates::letter };
inline constexpr Predicate isAlphanumeric{ "is_alphanumeric", &predicates::alphanumeric };
inline constexpr Predicate isLineEnding{ "is_line_ending", &predicates::lineEnding };
inline constexpr Predicate isSpace{ "is_space", &predicates::space };
inline constexpr Predicate isMultispace{ "is_multispace", &predicates::multispace };
inline constexpr Predicate isHexDigit{ "is_hex_digit", &predicates::hexDigit };
inline constexpr Predicate isOctalDigit{ "is_octal_digit", &predicates::octalDigit };
inline constexpr Predicate isBinaryDigit{ "is_binary_digit", &predicates::binaryDigit };

}
