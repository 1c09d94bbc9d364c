#include "chomp/ChompPredicate.hpp"
#include <unicode/uchar.h>

namespace chomp::predicates {

bool digit(int32_t codepoint) {
    return u_isdigit(codepoint);
}

bool letter(int32_t codepoint) {
    return u_isalpha(codepoint);
}

bool alphanumeric(int32_t codepoint) {
    return digit(codepoint) || letter(codepoint);
}

bool lineEnding(int32_t codepoint) {
    return codepoint == '\n' || codepoint == '\r';
}

bool space(int32_t codepoint) {
    return codepoint == ' ' || codepoint == '\t';
}

bool multispace(int32_t codepoint) {
    return space(codepoint) || lineEnding(codepoint);
}

bool hexDigit(int32_t codepoint) {
    return (codepoint >= '0' && codepoint <= '9') || (codepoint >= 'a' && codepoint <= 'f') || (codepoint >= 'A' && codepoint <= 'F');
}

bool octalDigit(int32_t codepoint) {
    return codepoint >= '0' && codepoint <= '7';
}

bool binaryDigit(int32_t codepoint) {
    return codepoint == '0' || codepoint == '1';
}

}
